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
#include <thread>
#include <vector>
#include "persistence/memory_store.h"

using namespace dualwrite;
using namespace dualwrite::persist;

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryStore store{"legacy"};

    Deadline soon() { return deadline_after(std::chrono::milliseconds(1000)); }
    EntityKey cart(const std::string& k) { return EntityKey{"cart", k}; }
};

TEST_F(MemoryStoreTest, CreateRejectsExistingKey) {
    Payload p{{"user_id", "u-1"}, {"total", 10.5}};
    StoreResult r = store.put(cart("c-1"), OpKind::Create, p, soon());
    ASSERT_TRUE(r.ok);

    r = store.put(cart("c-1"), OpKind::Create, p, soon());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::DuplicateKey);
    EXPECT_EQ(store.name(), "legacy");
}

TEST_F(MemoryStoreTest, UpdateUpserts) {
    Payload p{{"total", 1}};
    ASSERT_TRUE(store.put(cart("c-2"), OpKind::Update, p, soon()).ok);
    p["total"] = 2;
    ASSERT_TRUE(store.put(cart("c-2"), OpKind::Update, p, soon()).ok);

    ReadResult got = store.get(cart("c-2"), soon());
    ASSERT_TRUE(got.found());
    EXPECT_EQ(got.value->at("total"), Value(2));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(MemoryStoreTest, PutWithDeleteKindIsAnError) {
    StoreResult r = store.put(cart("c-3"), OpKind::Delete, Payload(), soon());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::StoreError);
}

TEST_F(MemoryStoreTest, RemoveAbsentIsNoop) {
    StoreResult r = store.remove(cart("ghost"), soon());
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.noop);

    ASSERT_TRUE(store.put(cart("c-4"), OpKind::Create, Payload{{"a", 1}}, soon()).ok);
    r = store.remove(cart("c-4"), soon());
    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(r.noop);

    ReadResult got = store.get(cart("c-4"), soon());
    EXPECT_TRUE(got.ok);
    EXPECT_FALSE(got.found());
}

TEST_F(MemoryStoreTest, ScanPagesWithinOneType) {
    for (int i = 0; i < 5; i++) {
        store.put(cart("c-" + std::to_string(i)), OpKind::Create, Payload(), soon());
    }
    store.put(EntityKey{"user", "u-1"}, OpKind::Create, Payload(), soon());
    store.put(EntityKey{"address", "a-1"}, OpKind::Create, Payload(), soon());

    KeyPage page = store.scan_keys("cart", "", 2, soon());
    ASSERT_TRUE(page.ok);
    EXPECT_EQ(page.keys, (std::vector<std::string>{"c-0", "c-1"}));
    EXPECT_FALSE(page.done);

    page = store.scan_keys("cart", "c-1", 2, soon());
    EXPECT_EQ(page.keys, (std::vector<std::string>{"c-2", "c-3"}));
    EXPECT_FALSE(page.done);

    page = store.scan_keys("cart", "c-3", 2, soon());
    EXPECT_EQ(page.keys, (std::vector<std::string>{"c-4"}));
    EXPECT_TRUE(page.done);

    page = store.scan_keys("wishlist", "", 10, soon());
    EXPECT_TRUE(page.keys.empty());
    EXPECT_TRUE(page.done);
}

TEST_F(MemoryStoreTest, ExactPageBoundaryReportsDone) {
    store.put(cart("a"), OpKind::Create, Payload(), soon());
    store.put(cart("b"), OpKind::Create, Payload(), soon());
    KeyPage page = store.scan_keys("cart", "", 2, soon());
    EXPECT_EQ(page.keys.size(), 2u);
    EXPECT_TRUE(page.done);
}

TEST_F(MemoryStoreTest, ConcurrentWritersOnDistinctKeys) {
    const int threads = 8;
    const int per_thread = 200;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([this, t] {
            for (int i = 0; i < per_thread; i++) {
                std::string k = "t" + std::to_string(t) + "-" + std::to_string(i);
                EXPECT_TRUE(store.put(cart(k), OpKind::Create, Payload{{"i", i}}, soon()).ok);
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(store.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_TRUE(store.ping(soon()).ok);
}
