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
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "dualwrite/key_serializer.h"

using namespace dualwrite;
using namespace std::chrono_literals;

class KeySerializerTest : public ::testing::Test {
protected:
    KeySerializer serializer;
    EntityKey cart{"cart", "c-1"};
};

TEST_F(KeySerializerTest, SlotsAreCreatedAndCollected) {
    EXPECT_EQ(serializer.slot_count(), 0u);
    {
        Lease a = serializer.acquire(cart);
        Lease b = serializer.acquire("cart", "c-2");
        EXPECT_TRUE(a.held());
        EXPECT_EQ(a.key(), cart);
        EXPECT_EQ(serializer.slot_count(), 2u);
    }
    EXPECT_EQ(serializer.slot_count(), 0u);
}

TEST_F(KeySerializerTest, ExplicitReleaseIsIdempotent) {
    Lease lease = serializer.acquire(cart);
    serializer.release(lease);
    EXPECT_FALSE(lease.held());
    lease.release();
    EXPECT_EQ(serializer.slot_count(), 0u);
}

TEST_F(KeySerializerTest, MovedLeaseReleasesOnce) {
    Lease outer;
    {
        Lease inner = serializer.acquire(cart);
        outer = std::move(inner);
        EXPECT_FALSE(inner.held());
    }
    EXPECT_TRUE(outer.held());
    EXPECT_EQ(serializer.slot_count(), 1u);
    outer.release();
    EXPECT_EQ(serializer.slot_count(), 0u);
}

TEST_F(KeySerializerTest, TryAcquireFailsWhileHeld) {
    Lease held = serializer.acquire(cart);
    Lease attempt = serializer.try_acquire(cart);
    EXPECT_FALSE(attempt.held());

    Lease other = serializer.try_acquire(EntityKey{"cart", "c-9"});
    EXPECT_TRUE(other.held());

    held.release();
    Lease again = serializer.try_acquire(cart);
    EXPECT_TRUE(again.held());
}

TEST_F(KeySerializerTest, MutualExclusionPerKey) {
    const int threads = 8;
    const int rounds = 200;
    int inside = 0;
    int max_inside = 0;
    int64_t total = 0;
    std::mutex observe;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&] {
            for (int i = 0; i < rounds; i++) {
                Lease lease = serializer.acquire(cart);
                {
                    std::lock_guard<std::mutex> lk(observe);
                    inside++;
                    max_inside = std::max(max_inside, inside);
                }
                total++;    // protected only by the lease
                {
                    std::lock_guard<std::mutex> lk(observe);
                    inside--;
                }
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(max_inside, 1);
    EXPECT_EQ(total, threads * rounds);
    EXPECT_EQ(serializer.slot_count(), 0u);
}

TEST_F(KeySerializerTest, WaitersAreServedInArrivalOrder) {
    Lease gate = serializer.acquire(cart);
    std::vector<int> order;
    std::mutex order_mu;
    std::vector<std::thread> waiters;

    for (int i = 0; i < 5; i++) {
        waiters.emplace_back([&, i] {
            Lease lease = serializer.acquire(cart);
            std::lock_guard<std::mutex> lk(order_mu);
            order.push_back(i);
        });
        // Let waiter i take its ticket before the next one arrives
        std::this_thread::sleep_for(20ms);
    }
    gate.release();
    for (auto& w : waiters) w.join();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(KeySerializerTest, DistinctKeysDoNotBlock) {
    Lease held = serializer.acquire(cart);
    std::atomic<bool> done{false};
    std::thread other([&] {
        Lease lease = serializer.acquire(EntityKey{"user", "c-1"});
        done = true;
    });
    other.join();
    EXPECT_TRUE(done.load());
}
