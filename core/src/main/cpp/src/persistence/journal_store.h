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
#include <memory>
#include <mutex>
#include <string>

#include "store_adapter.h"
#include "entity_table.h"
#include "journal.h"
#include "config.h"

namespace dualwrite {
    namespace persist {

        /**
         * Durable store backed by a Journal in `dir`. Every mutation is
         * appended (and synced) before it becomes visible; opening replays
         * the journal. The journal is compacted at open and after a write
         * whenever compaction::due() holds for `compact_min_records`.
         *
         * Throws JournalError from the constructor if the journal cannot be
         * opened. After that, journal failures surface as StoreError results.
         */
        class JournalStore final : public StoreAdapter {
        public:
            enum RecordType : uint16_t {
                kPut = 1,
                kRemove = 2
            };

            JournalStore(const std::string& dir, std::string name = "journal",
                         size_t compact_min_records = compaction::kMinRecords);

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
            // Rewrites the journal with one record per live key
            void compact();
            const std::string& journal_path() const { return journal_->path(); }

        private:
            void recover();
            std::vector<JournalRecord> live_records() const;
            void compact_if_due_locked();

            std::string name_;
            size_t compact_min_records_;
            mutable std::timed_mutex mu_;
            EntityTable table_;
            std::unique_ptr<Journal> journal_;
        };

    } // namespace persist
} // namespace dualwrite
