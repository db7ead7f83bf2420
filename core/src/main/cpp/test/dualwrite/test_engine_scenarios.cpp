/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <thread>
#include <unistd.h>
#include "dualwrite/engine.h"
#include "persistence/memory_store.h"
#include "persistence/journal_store.h"
#include "fault_injecting_store.h"

using namespace dualwrite;
using namespace dualwrite::persist;
using dualwrite::test::FaultInjectingStore;

// End-to-end scenarios through the public engine surface
class EngineScenarioTest : public ::testing::Test {
protected:
    DualWriteConfig config;
    MemoryStore new_db{"new"};
    MemoryStore legacy_db{"legacy"};
    FaultInjectingStore primary{new_db};
    FaultInjectingStore secondary{legacy_db};
    std::unique_ptr<Engine> engine;
    std::string dir;

    void SetUp() override {
        dir = "/tmp/dualwrite_engine_test_" + std::to_string(getpid());
        std::filesystem::remove_all(dir);
        config.service_name = "cart-service";
        config.validate_sync = false;
        config.metrics_enabled = false;
        config.retry.base_delay = std::chrono::milliseconds(5);
        config.retry.max_delay = std::chrono::milliseconds(20);
        config.retry.poll_interval = std::chrono::milliseconds(5);
        config.retry.jitter = 0.0;
    }

    void TearDown() override {
        engine.reset();
        std::filesystem::remove_all(dir);
    }

    void build() {
        engine = std::make_unique<Engine>(config, primary, secondary);
        engine->register_entity(EntitySpec{"cart", {"user_id", "total"}, {}, {}});
    }

    std::optional<Payload> read(StoreAdapter& store, const std::string& key) {
        return store.get(EntityKey{"cart", key}, deadline_after(std::chrono::milliseconds(100))).value;
    }

    bool wait_for_empty_queue() {
        for (int i = 0; i < 400; i++) {
            if (engine->retry_queue().depth() == 0) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    TimePoint later() { return Clock::now() + std::chrono::hours(1); }
};

TEST_F(EngineScenarioTest, HealthyCreate) {
    build();
    DualWriteResult r = engine->create("cart", "c-1", Payload{{"user_id", "u-7"}, {"total", 12.5}});
    EXPECT_EQ(r.overall, OverallStatus::Success);
    EXPECT_EQ(read(new_db, "c-1"), read(legacy_db, "c-1"));
    EXPECT_TRUE(engine->validator().validate_one("cart", "c-1").is_match());

    EngineStatus s = engine->status();
    EXPECT_EQ(s.operations, 1u);
    EXPECT_EQ(s.successes, 1u);
    EXPECT_EQ(s.retry_depth, 0u);
    EXPECT_FALSE(s.oldest_pending_retry_age.has_value());
    EXPECT_THAT(s.describe(), ::testing::HasSubstr("cart-service"));
}

TEST_F(EngineScenarioTest, LegacyOutageThenRecovery) {
    build();
    secondary.fail_writes(ErrorCode::Unavailable);

    DualWriteResult r = engine->update("cart", "c-1", Payload{{"user_id", "u-7"}, {"total", 3}});
    EXPECT_EQ(r.overall, OverallStatus::PartialSuccess);
    EXPECT_TRUE(r.retry_scheduled);
    EXPECT_EQ(engine->validator().validate_one("cart", "c-1").classification,
              Classification::MissingInSecondary);

    EngineStatus s = engine->status();
    EXPECT_EQ(s.partial_successes, 1u);
    EXPECT_EQ(s.retry_depth, 1u);
    EXPECT_TRUE(s.oldest_pending_retry_age.has_value());
    HealthReport h = engine->health();
    EXPECT_TRUE(h.primary.ok);
    EXPECT_FALSE(h.secondary.ok);
    EXPECT_FALSE(h.healthy());

    secondary.heal();
    engine->retry_queue().drain_once(later());
    EXPECT_TRUE(engine->validator().validate_one("cart", "c-1").is_match());
    EXPECT_EQ(engine->status().retry_depth, 0u);
    EXPECT_TRUE(engine->health().healthy());
}

TEST_F(EngineScenarioTest, BackgroundWorkerCatchesUp) {
    build();
    engine->start();
    EXPECT_TRUE(engine->status().retry_worker_running);
    secondary.fail_next_writes(2);

    engine->update("cart", "c-1", Payload{{"total", 1}});
    engine->update("cart", "c-1", Payload{{"total", 2}});
    ASSERT_TRUE(wait_for_empty_queue());
    engine->stop();

    EXPECT_FALSE(engine->status().retry_worker_running);
    EXPECT_EQ(read(legacy_db, "c-1")->at("total"), Value(2));
}

TEST_F(EngineScenarioTest, PrimaryOnlyWriteIsDetected) {
    build();
    new_db.put(EntityKey{"cart", "c-9"}, OpKind::Create, Payload{{"total", 4}},
               deadline_after(std::chrono::seconds(1)));
    ValidationPass pass = engine->validator().run_full_pass();
    EXPECT_EQ(pass.mismatches, 1u);
    EXPECT_EQ(pass.by_type.at("cart").mismatches_by_classification.at(Classification::MissingInSecondary), 1u);
    EXPECT_EQ(engine->status().last_validation_mismatches, 1u);
    EXPECT_TRUE(engine->status().last_validation_at.has_value());
}

TEST_F(EngineScenarioTest, ConcurrentUpdateAndDeleteConverge) {
    build();
    for (int round = 0; round < 20; round++) {
        std::string key = "c-" + std::to_string(round);
        engine->create("cart", key, Payload{{"total", 0}});
        std::thread updater([&] { engine->update("cart", key, Payload{{"total", round}}); });
        std::thread deleter([&] { engine->remove("cart", key); });
        updater.join();
        deleter.join();
        EXPECT_EQ(read(new_db, key), read(legacy_db, key)) << key;
    }
}

TEST_F(EngineScenarioTest, QueuedWritesKeepSubmissionOrder) {
    build();
    secondary.fail_next_writes(1);
    engine->create("cart", "c-1", Payload{{"total", 1}});
    engine->update("cart", "c-1", Payload{{"total", 2}});
    engine->remove("cart", "c-1");
    EXPECT_EQ(engine->retry_queue().depth(), 3u);

    engine->retry_queue().drain_once(later());
    EXPECT_FALSE(read(new_db, "c-1").has_value());
    EXPECT_FALSE(read(legacy_db, "c-1").has_value());
}

TEST_F(EngineScenarioTest, ResubmittedOperationIsNotReapplied) {
    build();
    Operation op = Operation::make("cart", "c-1", OpKind::Create, Payload{{"total", 1}});
    DualWriteResult first = engine->execute(op);
    DualWriteResult again = engine->execute(op);
    EXPECT_EQ(first.overall, OverallStatus::Success);
    EXPECT_EQ(again.overall, OverallStatus::Success);
    EXPECT_EQ(primary.write_calls(), 1);
    EXPECT_EQ(engine->status().operations, 1u);
}

TEST_F(EngineScenarioTest, OperationInterruptedByCrashIsNotRetriedBlindly) {
    Operation op = Operation::make("cart", "c-1", OpKind::Create, Payload{{"total", 1}});
    {
        // a process that recorded the begin and died
        WriteLedger crashed(dir);
        ASSERT_EQ(crashed.begin(op), WriteLedger::BeginStatus::Started);
    }
    config.journal_dir = dir;
    build();

    DualWriteResult r = engine->execute(op);
    EXPECT_EQ(r.overall, OverallStatus::Failed);
    EXPECT_THAT(r.primary.error.value_or(""), ::testing::HasSubstr("interrupted"));
    EXPECT_EQ(primary.write_calls(), 0);

    // a fresh id for the same change goes through
    DualWriteResult retry = engine->create("cart", "c-1", Payload{{"total", 1}});
    EXPECT_EQ(retry.overall, OverallStatus::Success);
    EXPECT_EQ(read(new_db, "c-1"), read(legacy_db, "c-1"));
}

TEST_F(EngineScenarioTest, ExpiredLedgerEntriesArePruned) {
    config.ledger_retention = std::chrono::seconds(3600);
    build();
    Operation old_op = Operation::make("cart", "c-1", OpKind::Create, Payload{{"total", 1}});
    old_op.submitted_at = Clock::now() - std::chrono::hours(2);
    engine->execute(old_op);
    engine->update("cart", "c-1", Payload{{"total", 2}});
    EXPECT_EQ(engine->status().ledger_entries, 2u);

    EXPECT_EQ(engine->prune_ledger(), 1u);
    EngineStatus s = engine->status();
    EXPECT_EQ(s.ledger_entries, 1u);
    EXPECT_EQ(s.ledger_journal_failures, 0u);
    EXPECT_THAT(s.describe(), ::testing::HasSubstr("ledger=1"));
}

TEST_F(EngineScenarioTest, AbandonedRetryIsReported) {
    config.retry.max_attempts = 2;
    build();
    std::vector<std::string> dead;
    engine->set_abandon_callback([&](const RetryTask& t) { dead.push_back(t.entity_key); });
    secondary.fail_writes();

    engine->update("cart", "c-1", Payload{{"total", 1}});
    engine->retry_queue().drain_once(later());
    ASSERT_EQ(dead.size(), 1u);
    EXPECT_EQ(dead[0], "c-1");
    EXPECT_EQ(engine->status().retries_abandoned, 1u);
    EXPECT_EQ(engine->status().retry_depth, 0u);
}

TEST_F(EngineScenarioTest, PendingRetriesSurviveRestart) {
    config.journal_dir = dir;
    build();
    secondary.fail_writes();
    Operation op = Operation::make("cart", "c-1", OpKind::Update, Payload{{"total", 8}});
    EXPECT_EQ(engine->execute(op).overall, OverallStatus::PartialSuccess);
    engine.reset();

    secondary.heal();
    build();
    EXPECT_TRUE(engine->ledger().durable());
    EXPECT_EQ(engine->retry_queue().depth(), 1u);
    ASSERT_TRUE(engine->ledger().find(op.operation_id).has_value());

    // The recorded result is returned for a resubmission after restart
    EXPECT_EQ(engine->execute(op).overall, OverallStatus::PartialSuccess);

    engine->retry_queue().drain_once(later());
    EXPECT_EQ(read(legacy_db, "c-1")->at("total"), Value(8));
    EXPECT_TRUE(engine->validator().validate_one("cart", "c-1").is_match());
}

TEST_F(EngineScenarioTest, DurableStoresAndJournalsTogether) {
    config.journal_dir = dir + "/engine";
    JournalStore new_store(dir + "/new");
    JournalStore legacy_store(dir + "/legacy");
    {
        Engine e(config, new_store, legacy_store);
        e.register_entity(EntitySpec{"cart", {}, {}, {}});
        e.create("cart", "c-1", Payload{{"total", 1}});
        e.update("cart", "c-2", Payload{{"total", 2}});
    }
    Engine e(config, new_store, legacy_store);
    e.register_entity(EntitySpec{"cart", {}, {}, {}});
    ValidationPass pass = e.validator().run_full_pass();
    EXPECT_EQ(pass.checked, 2u);
    EXPECT_EQ(pass.mismatches, 0u);
    EXPECT_EQ(e.ledger().size(), 2u);
}

TEST_F(EngineScenarioTest, LegacyStoreIgnoredWhenNotWritten) {
    config.write_to_legacy = false;
    build();
    secondary.fail_writes();
    HealthReport h = engine->health();
    EXPECT_FALSE(h.legacy_required);
    EXPECT_FALSE(h.secondary.ok);
    EXPECT_TRUE(h.healthy());
    EXPECT_EQ(engine->update("cart", "c-1", Payload{{"total", 1}}).overall, OverallStatus::Success);
}

TEST_F(EngineScenarioTest, InvalidConfigIsRejected) {
    config.retry.jitter = 2.0;
    EXPECT_THROW({ Engine e(config, primary, secondary); }, ConfigError);
}
