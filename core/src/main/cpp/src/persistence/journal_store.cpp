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

#include "journal_store.h"
#include "config.h"
#include "../util/log.h"
#include "../util/wire.hpp"

#include <filesystem>

namespace dualwrite {
    namespace persist {

        namespace {

            std::vector<uint8_t> encode_put(const EntityKey& key, const Payload& payload) {
                util::ByteWriter w;
                w.put_string(key.entity_type);
                w.put_string(key.entity_key);
                encode_payload(w, payload);
                return std::move(w.bytes());
            }

            std::vector<uint8_t> encode_remove(const EntityKey& key) {
                util::ByteWriter w;
                w.put_string(key.entity_type);
                w.put_string(key.entity_key);
                return std::move(w.bytes());
            }

            std::string lock_timeout(const std::string& store) {
                return store + ": deadline passed waiting for table lock";
            }

        }

        JournalStore::JournalStore(const std::string& dir, std::string name,
                                   size_t compact_min_records)
            : name_(std::move(name)), compact_min_records_(compact_min_records) {
            std::string path = (std::filesystem::path(dir) / files::kStoreJournal).string();
            journal_ = std::make_unique<Journal>(path);
            recover();
        }

        void JournalStore::recover() {
            uint64_t bad = 0;
            Journal::ReplayStats stats = journal_->replay(
                [this, &bad](uint16_t type, const uint8_t* body, size_t len) {
                    util::ByteReader r(body, len);
                    EntityKey key;
                    if (!r.get_string(key.entity_type) || !r.get_string(key.entity_key)) {
                        bad++;
                        return;
                    }
                    if (type == kPut) {
                        Payload p;
                        if (!decode_payload(r, p)) {
                            bad++;
                            return;
                        }
                        table_.apply_put(key, p);
                    } else if (type == kRemove) {
                        table_.apply_remove(key);
                    } else {
                        bad++;
                    }
                });
            if (bad > 0) {
                warning() << name_ << ": skipped " << bad << " undecodable journal records";
            }
            info() << name_ << ": recovered " << table_.size() << " entities from "
                   << stats.records << " journal records";

            compact_if_due_locked();
        }

        void JournalStore::compact_if_due_locked() {
            if (!compaction::due(journal_->record_count(), table_.size(), compact_min_records_)) {
                return;
            }
            try {
                journal_->compact(live_records());
            } catch (const JournalError& e) {
                error() << name_ << ": journal compaction failed: " << e.what();
            }
        }

        std::vector<JournalRecord> JournalStore::live_records() const {
            std::vector<JournalRecord> live;
            live.reserve(table_.size());
            for (const auto& kv : table_.rows()) {
                live.push_back(JournalRecord{kPut, encode_put(kv.first, kv.second)});
            }
            return live;
        }

        void JournalStore::compact() {
            std::lock_guard<std::timed_mutex> lk(mu_);
            journal_->compact(live_records());
        }

        StoreResult JournalStore::put(const EntityKey& key, OpKind kind,
                                      const Payload& payload, Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return StoreResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            StoreResult r = table_.check_put(key, kind);
            if (!r.ok) return r;
            try {
                journal_->append(kPut, encode_put(key, payload));
            } catch (const JournalError& e) {
                error() << name_ << ": put " << key.str() << " not persisted: " << e.what();
                return StoreResult::failure(ErrorCode::StoreError, e.what());
            }
            table_.apply_put(key, payload);
            compact_if_due_locked();
            return r;
        }

        StoreResult JournalStore::remove(const EntityKey& key, Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return StoreResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            if (!table_.contains(key)) {
                return StoreResult::success(true);
            }
            try {
                journal_->append(kRemove, encode_remove(key));
            } catch (const JournalError& e) {
                error() << name_ << ": remove " << key.str() << " not persisted: " << e.what();
                return StoreResult::failure(ErrorCode::StoreError, e.what());
            }
            table_.apply_remove(key);
            compact_if_due_locked();
            return StoreResult::success();
        }

        ReadResult JournalStore::get(const EntityKey& key, Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return ReadResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            return table_.get(key);
        }

        KeyPage JournalStore::scan_keys(const std::string& entity_type,
                                        const std::string& after_key,
                                        size_t limit,
                                        Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return KeyPage::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            return table_.scan(entity_type, after_key, limit);
        }

        StoreResult JournalStore::ping(Deadline deadline) {
            std::unique_lock<std::timed_mutex> lk(mu_, deadline);
            if (!lk.owns_lock()) {
                return StoreResult::failure(ErrorCode::Timeout, lock_timeout(name_));
            }
            if (!journal_->is_open()) {
                return StoreResult::failure(ErrorCode::Unavailable, name_ + ": journal closed");
            }
            return StoreResult::success();
        }

        size_t JournalStore::size() const {
            std::lock_guard<std::timed_mutex> lk(mu_);
            return table_.size();
        }

    } // namespace persist
} // namespace dualwrite
