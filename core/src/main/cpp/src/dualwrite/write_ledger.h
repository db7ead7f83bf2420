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

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/functional/hash.hpp>

#include "types.h"
#include "../persistence/journal.h"

namespace dualwrite {

    struct LedgerEntry {
        Operation operation;
        std::vector<WriteOutcome> outcomes;     // append-only, in attempt order
        std::optional<DualWriteResult> result;  // set once the initial write finishes
    };

    /**
     * Record of every attempted operation keyed by operation id.
     *
     * In memory by default; given a journal directory each begin, outcome
     * and completion is appended to write_ledger.journal before it becomes
     * visible, and the ledger is rebuilt from that journal on construction.
     * Entries found begun but never completed are closed during recovery
     * with a result built from their recorded outcomes; the primary counts
     * as failed when its outcome was never recorded.
     *
     * A journal that cannot be opened throws persist::JournalError. Later
     * journal write failures are logged and counted; the entry stays in
     * memory only.
     */
    class WriteLedger {
    public:
        enum class BeginStatus {
            Started,        // new entry created
            Completed,      // same id already finished; result returned
            InFlight,       // same id recorded but not finished
            KeyConflict     // same id already bound to another key
        };

        WriteLedger();
        explicit WriteLedger(const std::string& journal_dir);
        ~WriteLedger();

        // Checks the id and creates the entry in one step.
        // `existing` receives the stored result for Completed.
        BeginStatus begin(const Operation& op, std::optional<DualWriteResult>* existing = nullptr);

        // false when the id is unknown (e.g. recorded by an earlier process
        // whose ledger was not durable)
        bool append_outcome(const WriteOutcome& outcome);

        void complete(const DualWriteResult& result);

        std::optional<LedgerEntry> find(const OperationId& id) const;
        std::vector<LedgerEntry> entries_for(const EntityKey& key) const;
        size_t size() const;
        bool durable() const { return journal_ != nullptr; }
        // Journal appends or compactions that failed since construction
        uint64_t journal_failures() const { return journal_failures_.load(); }

        // Drops completed entries submitted before `cutoff` unless their id
        // is in `keep`; returns how many
        size_t prune_completed_before(TimePoint cutoff, const std::set<OperationId>& keep = {});

    private:
        enum RecordType : uint16_t {
            kBegin = 1,
            kOutcome = 2,
            kComplete = 3
        };

        void recover();
        void write_record(uint16_t type, const std::vector<uint8_t>& body);

        mutable std::mutex mu_;
        std::unordered_map<OperationId, LedgerEntry, boost::hash<OperationId>> entries_;
        std::unique_ptr<persist::Journal> journal_;
        std::atomic<uint64_t> journal_failures_{0};
    };

} // namespace dualwrite
