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
#include "store_adapter.h"
#include "entity_table.h"
#include <mutex>

namespace dualwrite {
    namespace persist {

        // In-process store. Calls wait for the table lock no longer than the
        // deadline allows.
        class MemoryStore final : public StoreAdapter {
        public:
            explicit MemoryStore(std::string name = "memory") : name_(std::move(name)) {}

            StoreResult put(const EntityKey& key, OpKind kind,
                            const Payload& payload, Deadline deadline) override;
            StoreResult remove(const EntityKey& key, Deadline deadline) override;
            ReadResult get(const EntityKey& key, Deadline deadline) override;
            KeyPage scan_keys(const std::string& entity_type,
                              const std::string& after_key,
                              size_t limit,
                              Deadline deadline) override;
            StoreResult ping(Deadline deadline) override;
            std::string name() const override { return name_; }

            size_t size() const;
            void clear();

        private:
            std::string name_;
            mutable std::timed_mutex mu_;
            EntityTable table_;
        };
    }
}
