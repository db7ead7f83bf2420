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
#include <map>
#include <string>

#include "store_adapter.h"

namespace dualwrite {
    namespace persist {

        // Ordered in-memory entity map with the put/remove semantics every
        // adapter shares. Not synchronized; owners hold their own lock.
        class EntityTable {
        public:
            // Checks a put without applying it
            StoreResult check_put(const EntityKey& key, OpKind kind) const {
                if (kind == OpKind::Delete) {
                    return StoreResult::failure(ErrorCode::StoreError, "put called with delete kind");
                }
                if (kind == OpKind::Create && rows_.count(key)) {
                    return StoreResult::failure(ErrorCode::DuplicateKey, "key exists: " + key.str());
                }
                return StoreResult::success();
            }

            void apply_put(const EntityKey& key, const Payload& payload) {
                rows_[key] = payload;
            }

            // false when the key was absent
            bool apply_remove(const EntityKey& key) {
                return rows_.erase(key) > 0;
            }

            bool contains(const EntityKey& key) const { return rows_.count(key) > 0; }

            ReadResult get(const EntityKey& key) const {
                ReadResult r;
                auto it = rows_.find(key);
                if (it != rows_.end()) {
                    r.value = it->second;
                }
                return r;
            }

            KeyPage scan(const std::string& entity_type, const std::string& after_key, size_t limit) const {
                KeyPage page;
                auto it = rows_.upper_bound(EntityKey{entity_type, after_key});
                for (; it != rows_.end() && it->first.entity_type == entity_type; ++it) {
                    if (page.keys.size() == limit) {
                        page.done = false;
                        return page;
                    }
                    page.keys.push_back(it->first.entity_key);
                }
                page.done = true;
                return page;
            }

            size_t size() const { return rows_.size(); }
            void clear() { rows_.clear(); }
            const std::map<EntityKey, Payload>& rows() const { return rows_; }

        private:
            std::map<EntityKey, Payload> rows_;
        };

    } // namespace persist
} // namespace dualwrite
