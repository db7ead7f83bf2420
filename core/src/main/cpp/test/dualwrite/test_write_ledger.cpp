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
#include <filesystem>
#include <unistd.h>
#include "dualwrite/write_ledger.h"
#include "util/uuid.h"
#include "file_size_limit.h"

using namespace dualwrite;

namespace {

WriteOutcome outcome(const Operation& op, StoreRole role, WriteStatus status,
                     ErrorCode code = ErrorCode::None, uint32_t attempt = 1) {
    WriteOutcome o;
    o.operation_id = op.operation_id;
    o.store = role;
    o.status = status;
    o.error_code = code;
    if (code != ErrorCode::None) o.error = std::string("failed: ") + error_code_name(code);
    o.attempt = attempt;
    o.attempted_at = Clock::now();
    o.duration = std::chrono::microseconds(250);
    return o;
}

DualWriteResult result(const Operation& op, OverallStatus overall, const WriteOutcome& primary) {
    DualWriteResult r;
    r.operation_id = op.operation_id;
    r.overall = overall;
    r.primary = primary;
    return r;
}

} // namespace

class WriteLedgerTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = "/tmp/dualwrite_ledger_test_" + std::to_string(getpid());
        std::filesystem::remove_all(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }
};

TEST_F(WriteLedgerTest, BeginDetectsResubmission) {
    WriteLedger ledger;
    Operation op = Operation::make("cart", "c-1", OpKind::Create, Payload{{"total", 0}});
    EXPECT_EQ(ledger.begin(op), WriteLedger::BeginStatus::Started);
    EXPECT_EQ(ledger.begin(op), WriteLedger::BeginStatus::InFlight);

    WriteOutcome p = outcome(op, StoreRole::Primary, WriteStatus::Success);
    ASSERT_TRUE(ledger.append_outcome(p));
    ledger.complete(result(op, OverallStatus::Success, p));

    std::optional<DualWriteResult> existing;
    EXPECT_EQ(ledger.begin(op, &existing), WriteLedger::BeginStatus::Completed);
    ASSERT_TRUE(existing.has_value());
    EXPECT_EQ(existing->overall, OverallStatus::Success);

    Operation stolen = op;
    stolen.entity_key = "c-2";
    EXPECT_EQ(ledger.begin(stolen), WriteLedger::BeginStatus::KeyConflict);
    EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(WriteLedgerTest, OutcomesAccumulateInOrder) {
    WriteLedger ledger;
    Operation op = Operation::make("order", "o-1", OpKind::Update);
    ledger.begin(op);
    ledger.append_outcome(outcome(op, StoreRole::Primary, WriteStatus::Success));
    ledger.append_outcome(outcome(op, StoreRole::Secondary, WriteStatus::Failed, ErrorCode::Timeout, 1));
    ledger.append_outcome(outcome(op, StoreRole::Secondary, WriteStatus::Success, ErrorCode::None, 2));

    std::optional<LedgerEntry> e = ledger.find(op.operation_id);
    ASSERT_TRUE(e.has_value());
    ASSERT_EQ(e->outcomes.size(), 3u);
    EXPECT_EQ(e->outcomes[1].error_code, ErrorCode::Timeout);
    EXPECT_EQ(e->outcomes[2].attempt, 2u);
    EXPECT_FALSE(e->result.has_value());
}

TEST_F(WriteLedgerTest, UnknownOperations) {
    WriteLedger ledger;
    Operation op = Operation::make("user", "u-1", OpKind::Delete);
    EXPECT_FALSE(ledger.append_outcome(outcome(op, StoreRole::Secondary, WriteStatus::Success)));
    EXPECT_THROW(ledger.complete(result(op, OverallStatus::Success, WriteOutcome())),
                 std::invalid_argument);
    EXPECT_FALSE(ledger.find(util::random_uuid()).has_value());
}

TEST_F(WriteLedgerTest, EntriesForKeyInSubmissionOrder) {
    WriteLedger ledger;
    Operation first = Operation::make("wishlist", "w-1", OpKind::Create);
    Operation second = Operation::make("wishlist", "w-1", OpKind::Update);
    second.submitted_at = first.submitted_at + std::chrono::milliseconds(5);
    Operation other = Operation::make("wishlist", "w-2", OpKind::Create);
    ledger.begin(second);
    ledger.begin(other);
    ledger.begin(first);

    std::vector<LedgerEntry> entries = ledger.entries_for(EntityKey{"wishlist", "w-1"});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].operation.operation_id, first.operation_id);
    EXPECT_EQ(entries[1].operation.operation_id, second.operation_id);
}

TEST_F(WriteLedgerTest, DurableLedgerSurvivesRestart) {
    Operation done = Operation::make("cart", "c-1", OpKind::Create, Payload{{"total", 12.5}});
    Operation pending = Operation::make("cart", "c-2", OpKind::Update);
    {
        WriteLedger ledger(test_dir);
        EXPECT_TRUE(ledger.durable());
        ledger.begin(done);
        WriteOutcome p = outcome(done, StoreRole::Primary, WriteStatus::Success);
        ledger.append_outcome(p);
        DualWriteResult r = result(done, OverallStatus::PartialSuccess, p);
        r.secondary = outcome(done, StoreRole::Secondary, WriteStatus::Failed, ErrorCode::Unavailable);
        r.retry_scheduled = true;
        ledger.complete(r);
        ledger.begin(pending);
    }

    WriteLedger ledger(test_dir);
    EXPECT_EQ(ledger.size(), 2u);

    std::optional<DualWriteResult> existing;
    EXPECT_EQ(ledger.begin(done, &existing), WriteLedger::BeginStatus::Completed);
    ASSERT_TRUE(existing.has_value());
    EXPECT_EQ(existing->overall, OverallStatus::PartialSuccess);
    ASSERT_TRUE(existing->secondary.has_value());
    EXPECT_EQ(existing->secondary->error_code, ErrorCode::Unavailable);
    EXPECT_TRUE(existing->retry_scheduled);

    std::optional<LedgerEntry> e = ledger.find(done.operation_id);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->operation.payload, done.payload);
    EXPECT_EQ(e->outcomes.size(), 1u);

    std::optional<DualWriteResult> closed;
    EXPECT_EQ(ledger.begin(pending, &closed), WriteLedger::BeginStatus::Completed);
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->overall, OverallStatus::Failed);
}

TEST_F(WriteLedgerTest, InterruptedOperationsAreClosedOnRecovery) {
    Operation before_primary = Operation::make("cart", "c-1", OpKind::Update, Payload{{"total", 1}});
    Operation after_primary = Operation::make("cart", "c-2", OpKind::Update, Payload{{"total", 2}});
    Operation after_both = Operation::make("cart", "c-3", OpKind::Delete);
    {
        WriteLedger ledger(test_dir);
        ledger.begin(before_primary);
        ledger.begin(after_primary);
        ledger.append_outcome(outcome(after_primary, StoreRole::Primary, WriteStatus::Success));
        ledger.begin(after_both);
        ledger.append_outcome(outcome(after_both, StoreRole::Primary, WriteStatus::Success));
        ledger.append_outcome(outcome(after_both, StoreRole::Secondary, WriteStatus::Success));
    }

    for (int restart = 0; restart < 2; restart++) {
        WriteLedger ledger(test_dir);
        ASSERT_EQ(ledger.size(), 3u);

        std::optional<DualWriteResult> r;
        EXPECT_EQ(ledger.begin(before_primary, &r), WriteLedger::BeginStatus::Completed);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r->overall, OverallStatus::Failed);
        EXPECT_EQ(r->primary.error_code, ErrorCode::StoreError);
        EXPECT_EQ(r->primary.error.value_or(""), "interrupted before completion");

        r.reset();
        EXPECT_EQ(ledger.begin(after_primary, &r), WriteLedger::BeginStatus::Completed);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r->overall, OverallStatus::PartialSuccess);
        EXPECT_TRUE(r->primary.succeeded());
        EXPECT_FALSE(r->secondary.has_value());

        r.reset();
        EXPECT_EQ(ledger.begin(after_both, &r), WriteLedger::BeginStatus::Completed);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r->overall, OverallStatus::Success);
    }
}

TEST_F(WriteLedgerTest, JournalWriteFailureKeepsEntryInMemory) {
    WriteLedger ledger(test_dir);
    Operation op = Operation::make("cart", "c-1", OpKind::Create, Payload{{"total", 3}});
    ASSERT_EQ(ledger.begin(op), WriteLedger::BeginStatus::Started);

    const std::string path = test_dir + "/write_ledger.journal";
    WriteOutcome p = outcome(op, StoreRole::Primary, WriteStatus::Success);
    {
        dualwrite::test::FileSizeLimit limit(std::filesystem::file_size(path));
        EXPECT_NO_THROW(ledger.append_outcome(p));
        EXPECT_NO_THROW(ledger.complete(result(op, OverallStatus::Success, p)));
    }
    EXPECT_EQ(ledger.journal_failures(), 2u);

    std::optional<LedgerEntry> e = ledger.find(op.operation_id);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->outcomes.size(), 1u);
    ASSERT_TRUE(e->result.has_value());
    EXPECT_EQ(e->result->overall, OverallStatus::Success);
}

TEST_F(WriteLedgerTest, PruneDropsOnlyCompletedEntries) {
    Operation old_done = Operation::make("user", "u-1", OpKind::Create);
    old_done.submitted_at = Clock::now() - std::chrono::hours(48);
    Operation old_open = Operation::make("user", "u-2", OpKind::Create);
    old_open.submitted_at = old_done.submitted_at;
    Operation fresh = Operation::make("user", "u-3", OpKind::Create);
    {
        WriteLedger ledger(test_dir);
        for (const Operation* op : {&old_done, &old_open, &fresh}) {
            ledger.begin(*op);
        }
        WriteOutcome p = outcome(old_done, StoreRole::Primary, WriteStatus::Success);
        ledger.complete(result(old_done, OverallStatus::Success, p));
        WriteOutcome q = outcome(fresh, StoreRole::Primary, WriteStatus::Success);
        ledger.complete(result(fresh, OverallStatus::Success, q));

        EXPECT_EQ(ledger.prune_completed_before(Clock::now() - std::chrono::hours(24)), 1u);
        EXPECT_EQ(ledger.size(), 2u);
    }
    WriteLedger ledger(test_dir);
    EXPECT_EQ(ledger.size(), 2u);
    EXPECT_FALSE(ledger.find(old_done.operation_id).has_value());
    EXPECT_TRUE(ledger.find(old_open.operation_id).has_value());
    EXPECT_TRUE(ledger.find(fresh.operation_id)->result.has_value());
}
