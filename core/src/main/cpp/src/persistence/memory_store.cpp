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

#include "memory_store.h"

namespace dualwrite {
    namespace persist {

        namespace {
            std::string lock_timeout(const std::string& store) {
                return store + ": deadline passed waiting for table lock";
            }
        }

        StoreResult MemoryStore::put(const EntityKey& key, OpKind kind,
                                     const Payload& payload, Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return StoreResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            StoreResult r = table_.check_put(key, kind);
            if (!r.ok) return r;
            table_.apply_put(key, payload);
            return r;
        }

        StoreResult MemoryStore::remove(const EntityKey& key, Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return StoreResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            bool existed = table_.apply_remove(key);
            return StoreResult::success(!existed);
        }

        ReadResult MemoryStore::get(const EntityKey& key, Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return ReadResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            return table_.get(key);
        }

        KeyPage MemoryStore::scan_keys(const std::string& entity_type,
                                       const std::string& after_key,
                                       size_t limit,
                                       Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return KeyPage::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            return table_.scan(entity_type, after_key, limit);
        }

        StoreResult MemoryStore::ping(Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return StoreResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            return StoreResult::success();
        }

        size_t MemoryStore::size() const {
            std::lock_guard<std::timed_mutex> lk(mu_);
            return table_.size();
        }

        void MemoryStore::clear() {
            std::lock_guard<std::timed_mutex> lk(mu_);
            table_.clear();
        }

    } // namespace persist
} // namespace dualwrite
