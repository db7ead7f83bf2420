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

#include "write_ledger.h"
#include "../persistence/config.h"
#include "../util/log.h"
#include "../util/uuid.h"

#include <algorithm>
#include <filesystem>

namespace dualwrite {

    namespace {
        // Result for an entry whose process stopped between begin and complete.
        // The recorded outcomes are kept; a missing primary outcome counts as failed.
        DualWriteResult interrupted_result(const LedgerEntry& e) {
            DualWriteResult res;
            res.operation_id = e.operation.operation_id;
            res.primary.operation_id = e.operation.operation_id;
            res.primary.store = StoreRole::Primary;
            res.primary.status = WriteStatus::Failed;
            res.primary.error_code = ErrorCode::StoreError;
            res.primary.error = "interrupted before completion";
            res.primary.attempted_at = Clock::now();
            for (const auto& o : e.outcomes) {
                if (o.store == StoreRole::Primary) {
                    res.primary = o;
                } else {
                    res.secondary = o;
                }
            }
            const bool secondary_ok = res.secondary && res.secondary->succeeded();
            if (res.primary.failed()) {
                res.overall = OverallStatus::Failed;
            } else if (secondary_ok) {
                res.overall = OverallStatus::Success;
            } else if (res.primary.succeeded()) {
                res.overall = OverallStatus::PartialSuccess;
            } else {
                res.overall = OverallStatus::Failed;
            }
            return res;
        }
    } // namespace

    WriteLedger::WriteLedger() = default;

    WriteLedger::WriteLedger(const std::string& journal_dir) {
        std::string path = (std::filesystem::path(journal_dir) / persist::files::kLedgerJournal).string();
        journal_ = std::make_unique<persist::Journal>(path);
        recover();
    }

    WriteLedger::~WriteLedger() = default;

    void WriteLedger::recover() {
        uint64_t bad = 0;
        journal_->replay([this, &bad](uint16_t type, const uint8_t* body, size_t len) {
            util::ByteReader r(body, len);
            switch (type) {
            case kBegin: {
                LedgerEntry e;
                if (!decode_operation(r, e.operation)) { bad++; return; }
                OperationId id = e.operation.operation_id;
                entries_[id] = std::move(e);
                return;
            }
            case kOutcome: {
                WriteOutcome o;
                if (!decode_outcome(r, o)) { bad++; return; }
                auto it = entries_.find(o.operation_id);
                if (it != entries_.end()) it->second.outcomes.push_back(std::move(o));
                return;
            }
            case kComplete: {
                DualWriteResult res;
                if (!decode_result(r, res)) { bad++; return; }
                auto it = entries_.find(res.operation_id);
                if (it != entries_.end()) it->second.result = std::move(res);
                return;
            }
            default:
                bad++;
            }
        });
        if (bad > 0) {
            warning() << "write ledger: skipped " << bad << " undecodable records";
        }
        for (auto& kv : entries_) {
            LedgerEntry& e = kv.second;
            if (e.result) continue;
            e.result = interrupted_result(e);
            util::ByteWriter w;
            encode_result(w, *e.result);
            write_record(kComplete, w.bytes());
            warning() << "write ledger: operation " << util::uuid_string(kv.first) << " on "
                      << e.operation.key().str() << " was interrupted; closed as "
                      << overall_name(e.result->overall);
        }
        info() << "write ledger: recovered " << entries_.size() << " operations";
    }

    void WriteLedger::write_record(uint16_t type, const std::vector<uint8_t>& body) {
        if (!journal_) return;
        try {
            journal_->append(type, body);
        } catch (const persist::JournalError& e) {
            journal_failures_++;
            error() << "write ledger journal write failed, entry kept in memory only: " << e.what();
        }
    }

    WriteLedger::BeginStatus WriteLedger::begin(const Operation& op,
                                                std::optional<DualWriteResult>* existing) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(op.operation_id);
        if (it != entries_.end()) {
            const Operation& prior = it->second.operation;
            if (prior.entity_type != op.entity_type || prior.entity_key != op.entity_key) {
                return BeginStatus::KeyConflict;
            }
            if (!it->second.result) {
                return BeginStatus::InFlight;
            }
            if (existing) *existing = it->second.result;
            return BeginStatus::Completed;
        }

        if (journal_) {
            util::ByteWriter w;
            encode_operation(w, op);
            write_record(kBegin, w.bytes());
        }
        LedgerEntry e;
        e.operation = op;
        entries_.emplace(op.operation_id, std::move(e));
        return BeginStatus::Started;
    }

    bool WriteLedger::append_outcome(const WriteOutcome& outcome) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(outcome.operation_id);
        if (it == entries_.end()) {
            debug() << "write ledger: outcome for unknown operation "
                    << util::uuid_string(outcome.operation_id);
            return false;
        }
        if (journal_) {
            util::ByteWriter w;
            encode_outcome(w, outcome);
            write_record(kOutcome, w.bytes());
        }
        it->second.outcomes.push_back(outcome);
        return true;
    }

    void WriteLedger::complete(const DualWriteResult& result) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(result.operation_id);
        if (it == entries_.end()) {
            throw std::invalid_argument("write ledger: complete for unknown operation " +
                                        util::uuid_string(result.operation_id));
        }
        if (journal_) {
            util::ByteWriter w;
            encode_result(w, result);
            write_record(kComplete, w.bytes());
        }
        it->second.result = result;
    }

    std::optional<LedgerEntry> WriteLedger::find(const OperationId& id) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<LedgerEntry> WriteLedger::entries_for(const EntityKey& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<LedgerEntry> out;
        for (const auto& kv : entries_) {
            const Operation& op = kv.second.operation;
            if (op.entity_type == key.entity_type && op.entity_key == key.entity_key) {
                out.push_back(kv.second);
            }
        }
        std::sort(out.begin(), out.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
            return a.operation.submitted_at < b.operation.submitted_at;
        });
        return out;
    }

    size_t WriteLedger::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return entries_.size();
    }

    size_t WriteLedger::prune_completed_before(TimePoint cutoff, const std::set<OperationId>& keep) {
        std::lock_guard<std::mutex> lk(mu_);
        size_t dropped = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.result && it->second.operation.submitted_at < cutoff &&
                keep.count(it->first) == 0) {
                it = entries_.erase(it);
                dropped++;
            } else {
                ++it;
            }
        }
        if (journal_ && dropped > 0) {
            std::vector<persist::JournalRecord> live;
            for (const auto& kv : entries_) {
                util::ByteWriter w;
                encode_operation(w, kv.second.operation);
                live.push_back(persist::JournalRecord{kBegin, std::move(w.bytes())});
                for (const auto& o : kv.second.outcomes) {
                    util::ByteWriter ow;
                    encode_outcome(ow, o);
                    live.push_back(persist::JournalRecord{kOutcome, std::move(ow.bytes())});
                }
                if (kv.second.result) {
                    util::ByteWriter rw;
                    encode_result(rw, *kv.second.result);
                    live.push_back(persist::JournalRecord{kComplete, std::move(rw.bytes())});
                }
            }
            try {
                journal_->compact(live);
            } catch (const persist::JournalError& e) {
                journal_failures_++;
                error() << "write ledger compaction failed, pruned entries remain on disk: " << e.what();
            }
        }
        if (dropped > 0) {
            info() << "write ledger: pruned " << dropped << " completed operations";
        }
        return dropped;
    }

} // namespace dualwrite
