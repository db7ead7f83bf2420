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

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include "../src/dualwrite/engine.h"
#include "../src/persistence/memory_store.h"
#include "../src/util/log.h"

using namespace dualwrite;
using namespace std;

namespace {

// Legacy store that drops every write until it is brought back
class FlakyLegacyStore : public persist::StoreAdapter {
public:
    explicit FlakyLegacyStore(persist::StoreAdapter& inner) : inner_(inner) {}

    void set_down(bool down) { down_ = down; }

    persist::StoreResult put(const EntityKey& key, OpKind kind, const Payload& payload,
                             persist::Deadline deadline) override {
        if (down_) return persist::StoreResult::failure(ErrorCode::Unavailable, "legacy db offline");
        return inner_.put(key, kind, payload, deadline);
    }
    persist::StoreResult remove(const EntityKey& key, persist::Deadline deadline) override {
        if (down_) return persist::StoreResult::failure(ErrorCode::Unavailable, "legacy db offline");
        return inner_.remove(key, deadline);
    }
    persist::ReadResult get(const EntityKey& key, persist::Deadline deadline) override {
        return inner_.get(key, deadline);
    }
    persist::KeyPage scan_keys(const std::string& type, const std::string& after, size_t limit,
                               persist::Deadline deadline) override {
        return inner_.scan_keys(type, after, limit, deadline);
    }
    persist::StoreResult ping(persist::Deadline deadline) override {
        if (down_) return persist::StoreResult::failure(ErrorCode::Unavailable, "legacy db offline");
        return inner_.ping(deadline);
    }
    std::string name() const override { return "legacy"; }

private:
    persist::StoreAdapter& inner_;
    std::atomic<bool> down_{false};
};

void print_status(Engine& engine) {
    cout << engine.status().describe() << "\n";
    cout << engine.health().describe() << "\n\n";
}

}

int main() {
    initLoggingFromEnv();
    cout << "=== Dual Write Migration Example ===\n\n";

    persist::MemoryStore new_db("postgres");
    persist::MemoryStore legacy_db("mongo");
    FlakyLegacyStore legacy(legacy_db);

    DualWriteConfig config = DualWriteConfig::from_env("cart-service");
    config.validate_sync = false;
    config.allow_repair = true;
    config.retry.base_delay = chrono::milliseconds(50);
    config.retry.poll_interval = chrono::milliseconds(20);

    Engine engine(config, new_db, legacy);
    engine.register_entity(EntitySpec{"cart", {"user_id", "total"}, {}, {}});
    engine.set_abandon_callback([](const RetryTask& t) {
        cout << "  gave up on " << t.key().str() << ": " << t.last_error << "\n";
    });
    engine.start();

    // Step 1: normal dual writes
    cout << "Writing 5 carts to both stores...\n";
    for (int i = 0; i < 5; i++) {
        DualWriteResult r = engine.create("cart", "c-" + to_string(i),
                                          Payload{{"user_id", "u-" + to_string(i)},
                                                  {"total", 10.0 * i},
                                                  {"items", Value::List{Value("sku-1"), Value("sku-2")}}});
        cout << "  " << r.describe() << "\n";
    }
    print_status(engine);

    // Step 2: legacy outage; writes succeed on the new store and queue for retry
    cout << "Legacy store goes down...\n";
    legacy.set_down(true);
    for (int i = 0; i < 3; i++) {
        DualWriteResult r = engine.update("cart", "c-" + to_string(i), Payload{{"user_id", "u-" + to_string(i)},
                                                                               {"total", 99.0}});
        cout << "  " << r.describe() << "\n";
    }
    print_status(engine);

    // Step 3: legacy recovers; the retry worker catches up
    cout << "Legacy store is back; waiting for retries...\n";
    legacy.set_down(false);
    for (int i = 0; i < 100 && engine.retry_queue().depth() > 0; i++) {
        this_thread::sleep_for(chrono::milliseconds(20));
    }
    print_status(engine);

    // Step 4: drift introduced behind the engine's back, then repaired
    new_db.put(EntityKey{"cart", "c-9"}, OpKind::Create, Payload{{"user_id", "u-9"}, {"total", 1.0}},
               persist::deadline_after(chrono::seconds(1)));
    vector<DiffRecord> diffs = engine.validator().validate_all("cart");
    ValidationSummary summary = SyncValidator::summarize(diffs);
    cout << "Validation: " << summary.matches << "/" << summary.total << " in sync ("
         << summary.sync_percentage << "%)\n";
    for (const auto& d : diffs) {
        if (!d.is_match()) {
            cout << "  " << d.entity_key << ": " << classification_name(d.classification) << "\n";
        }
    }

    RepairReport repair = engine.validator().reconcile(diffs, true);
    cout << "Repaired " << repair.repaired << " of " << repair.attempted << "\n";
    summary = SyncValidator::summarize(engine.validator().validate_all("cart"));
    cout << "After repair: " << summary.sync_percentage << "% in sync\n";

    engine.stop();
    cout << "\n=== Example completed ===\n";
    return 0;
}
