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

#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "types.h"

namespace dualwrite {

    /**
     * Per-key FIFO mutual exclusion. At most one Lease exists per
     * (entity_type, entity_key); waiters are admitted in arrival order.
     * Slots are created on first use and erased when nobody holds or waits.
     *
     * Callers never hold two leases at once, so there is no lock ordering.
     */
    class KeySerializer {
    public:
        class Lease {
        public:
            Lease() = default;
            Lease(Lease&& o) noexcept;
            Lease& operator=(Lease&& o) noexcept;
            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;
            ~Lease() { release(); }

            void release();
            bool held() const { return owner_ != nullptr; }
            const EntityKey& key() const { return key_; }

        private:
            friend class KeySerializer;
            Lease(KeySerializer* owner, EntityKey key) : owner_(owner), key_(std::move(key)) {}

            KeySerializer* owner_ = nullptr;
            EntityKey key_;
        };

        KeySerializer() = default;
        KeySerializer(const KeySerializer&) = delete;
        KeySerializer& operator=(const KeySerializer&) = delete;

        // Blocks until the key is free and every earlier waiter has been served
        Lease acquire(const EntityKey& key);
        Lease acquire(const std::string& entity_type, const std::string& entity_key) {
            return acquire(EntityKey{entity_type, entity_key});
        }

        // Returns an empty lease when the key is held or contended
        Lease try_acquire(const EntityKey& key);

        void release(Lease& lease) { lease.release(); }

        size_t slot_count() const;

    private:
        struct Slot {
            uint64_t next_ticket = 0;
            uint64_t serving = 0;
            uint64_t users = 0;     // holder plus waiters
            std::condition_variable cv;
        };

        void release_key(const EntityKey& key);

        mutable std::mutex mu_;
        std::unordered_map<EntityKey, std::unique_ptr<Slot>, EntityKeyHash> slots_;
    };

    using Lease = KeySerializer::Lease;

} // namespace dualwrite
