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

#include "retry_queue.h"
#include "../persistence/config.h"
#include "../util/log.h"
#include "../util/uuid.h"

#include <filesystem>
#include <set>

namespace dualwrite {

    namespace {

        void encode_task(util::ByteWriter& w, const RetryTask& t) {
            encode_uuid(w, t.operation_id);
            w.put_string(t.entity_type);
            w.put_string(t.entity_key);
            w.put_u8(static_cast<uint8_t>(t.kind));
            encode_payload(w, t.payload);
            w.put_u32(t.attempt_count);
            w.put_i64(to_micros(t.next_attempt_at));
            w.put_i64(to_micros(t.enqueued_at));
            w.put_string(t.last_error);
            w.put_u8(static_cast<uint8_t>(t.last_error_code));
        }

        bool decode_task(util::ByteReader& r, RetryTask& t) {
            uint8_t kind, code;
            int64_t next_at, enq_at;
            if (!decode_uuid(r, t.operation_id) ||
                !r.get_string(t.entity_type) ||
                !r.get_string(t.entity_key) ||
                !r.get_u8(kind) ||
                !decode_payload(r, t.payload) ||
                !r.get_u32(t.attempt_count) ||
                !r.get_i64(next_at) ||
                !r.get_i64(enq_at) ||
                !r.get_string(t.last_error) ||
                !r.get_u8(code)) {
                return false;
            }
            if (kind < 1 || kind > 3 || code > static_cast<uint8_t>(ErrorCode::DuplicateOperation)) {
                return false;
            }
            t.kind = static_cast<OpKind>(kind);
            t.next_attempt_at = from_micros(next_at);
            t.enqueued_at = from_micros(enq_at);
            t.last_error_code = static_cast<ErrorCode>(code);
            return true;
        }

        // Retries must be idempotent: the earlier attempt may have landed
        // before it timed out, so a create is re-applied as an upsert.
        persist::StoreResult apply_task(persist::StoreAdapter& store, const RetryTask& t,
                                        persist::Deadline deadline) {
            try {
                if (t.kind == OpKind::Delete) {
                    return store.remove(t.key(), deadline);
                }
                return store.put(t.key(), OpKind::Update, t.payload, deadline);
            } catch (const std::exception& e) {
                return persist::StoreResult::failure(ErrorCode::StoreError,
                                                     std::string("adapter threw: ") + e.what());
            }
        }

    }

    RetryTask RetryTask::from_operation(const Operation& op, uint32_t attempt_count,
                                        TimePoint next_attempt_at) {
        RetryTask t;
        t.operation_id = op.operation_id;
        t.entity_type = op.entity_type;
        t.entity_key = op.entity_key;
        t.kind = op.kind;
        t.payload = op.payload;
        t.attempt_count = attempt_count;
        t.next_attempt_at = next_attempt_at;
        t.enqueued_at = Clock::now();
        return t;
    }

    RetryQueue::RetryQueue(const DualWriteConfig& config,
                           persist::StoreAdapter& secondary,
                           KeySerializer& serializer,
                           WriteLedger& ledger,
                           DualWriteMetrics& metrics)
        : config_(config), secondary_(secondary), serializer_(serializer),
          ledger_(ledger), metrics_(metrics), rng_(std::random_device{}()) {
        if (config_.journal_dir.empty()) {
            warning() << "retry queue for " << secondary_.name()
                      << " is memory only; pending retries are lost on restart"
                      << " (set DUAL_WRITE_JOURNAL_DIR to persist them)";
            return;
        }
        std::string path = (std::filesystem::path(config_.journal_dir) /
                            persist::files::kRetryQueueJournal).string();
        journal_ = std::make_unique<persist::Journal>(path);
        recover();
    }

    RetryQueue::~RetryQueue() {
        stop();
    }

    void RetryQueue::recover() {
        uint64_t bad = 0;
        journal_->replay([this, &bad](uint16_t type, const uint8_t* body, size_t len) {
            util::ByteReader r(body, len);
            if (type == kEnqueue) {
                RetryTask t;
                if (!decode_task(r, t)) { bad++; return; }
                index_[t.operation_id] = t.key();
                by_key_[t.key()].push_back(std::move(t));
                return;
            }
            OperationId id;
            if (!decode_uuid(r, id)) { bad++; return; }
            if (type == kAttempt) {
                uint32_t attempts;
                int64_t next_at;
                std::string err;
                uint8_t code;
                if (!r.get_u32(attempts) || !r.get_i64(next_at) || !r.get_string(err) || !r.get_u8(code) ||
                    code > static_cast<uint8_t>(ErrorCode::DuplicateOperation)) {
                    bad++;
                    return;
                }
                auto it = index_.find(id);
                if (it == index_.end()) return;
                for (auto& t : by_key_[it->second]) {
                    if (t.operation_id == id) {
                        t.attempt_count = attempts;
                        t.next_attempt_at = from_micros(next_at);
                        t.last_error = err;
                        t.last_error_code = static_cast<ErrorCode>(code);
                    }
                }
            } else if (type == kResolve || type == kCancel) {
                remove_locked(id, nullptr);
            } else if (type == kAbandon) {
                RetryTask t;
                if (remove_locked(id, &t)) {
                    abandoned_.push_back(std::move(t));
                    if (abandoned_.size() > kMaxAbandoned) abandoned_.pop_front();
                }
            } else {
                bad++;
            }
        });
        if (bad > 0) {
            warning() << "retry queue: skipped " << bad << " undecodable journal records";
        }

        journal_->compact(live_records_locked());
        refresh_gauges_locked(Clock::now());
        if (!index_.empty()) {
            info() << "retry queue: recovered " << index_.size() << " pending secondary writes";
        }
    }

    void RetryQueue::journal_write(uint16_t type, const std::vector<uint8_t>& body) {
        if (!journal_) return;
        try {
            journal_->append(type, body);
        } catch (const persist::JournalError& e) {
            error() << "retry queue journal write failed, state kept in memory only: " << e.what();
        }
    }

    // Pending tasks with their current attempt state, then abandoned tasks
    // as an enqueue and abandon pair
    std::vector<persist::JournalRecord> RetryQueue::live_records_locked() const {
        std::vector<persist::JournalRecord> live;
        for (const auto& kv : by_key_) {
            for (const auto& t : kv.second) {
                util::ByteWriter w;
                encode_task(w, t);
                live.push_back(persist::JournalRecord{kEnqueue, std::move(w.bytes())});
            }
        }
        for (const auto& t : abandoned_) {
            util::ByteWriter w;
            encode_task(w, t);
            live.push_back(persist::JournalRecord{kEnqueue, std::move(w.bytes())});
            util::ByteWriter a;
            encode_uuid(a, t.operation_id);
            live.push_back(persist::JournalRecord{kAbandon, std::move(a.bytes())});
        }
        return live;
    }

    void RetryQueue::compact_journal_if_due_locked() {
        if (!journal_) return;
        const size_t live = index_.size() + 2 * abandoned_.size();
        if (!persist::compaction::due(journal_->record_count(), live,
                                      config_.journal_compact_min_records)) {
            return;
        }
        try {
            journal_->compact(live_records_locked());
        } catch (const persist::JournalError& e) {
            error() << "retry queue journal compaction failed: " << e.what();
        }
    }

    void RetryQueue::journal_id_record(uint16_t type, const OperationId& id) {
        util::ByteWriter w;
        encode_uuid(w, id);
        journal_write(type, w.bytes());
    }

    void RetryQueue::enqueue(RetryTask task) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (index_.count(task.operation_id)) {
                warning() << "retry queue: operation " << util::uuid_string(task.operation_id)
                          << " already queued";
                return;
            }
            if (task.enqueued_at == TimePoint{}) {
                task.enqueued_at = Clock::now();
            }
            util::ByteWriter w;
            encode_task(w, task);
            journal_write(kEnqueue, w.bytes());

            debug() << "retry queue: enqueued " << kind_name(task.kind) << ' ' << task.key().str()
                    << " attempt_count=" << task.attempt_count;
            index_[task.operation_id] = task.key();
            by_key_[task.key()].push_back(std::move(task));
            metrics_.retries_enqueued.increment();
            compact_journal_if_due_locked();
            refresh_gauges_locked(Clock::now());
        }
        wake();
    }

    bool RetryQueue::remove_locked(const OperationId& id, RetryTask* out) {
        auto it = index_.find(id);
        if (it == index_.end()) return false;
        auto kit = by_key_.find(it->second);
        if (kit != by_key_.end()) {
            auto& q = kit->second;
            for (auto qi = q.begin(); qi != q.end(); ++qi) {
                if (qi->operation_id == id) {
                    if (out) *out = std::move(*qi);
                    q.erase(qi);
                    break;
                }
            }
            if (q.empty()) by_key_.erase(kit);
        }
        index_.erase(it);
        return true;
    }

    void RetryQueue::refresh_gauges_locked(TimePoint now) {
        metrics_.retry_queue_depth.set(static_cast<int64_t>(index_.size()));
        std::optional<TimePoint> oldest;
        for (const auto& kv : by_key_) {
            for (const auto& t : kv.second) {
                if (!oldest || t.enqueued_at < *oldest) oldest = t.enqueued_at;
            }
        }
        if (oldest) {
            auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - *oldest).count();
            metrics_.oldest_pending_retry_age_ms.set(age < 0 ? 0 : age);
        } else {
            metrics_.oldest_pending_retry_age_ms.set(-1);
        }
    }

    std::chrono::milliseconds RetryQueue::jittered_locked(uint32_t attempt) {
        std::chrono::milliseconds base = config_.retry.backoff(attempt);
        if (config_.retry.jitter <= 0.0) return base;
        std::uniform_real_distribution<double> dist(0.0, config_.retry.jitter);
        double factor = 1.0 - dist(rng_);
        return std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(base.count()) * factor));
    }

    std::chrono::milliseconds RetryQueue::retry_delay(uint32_t attempt) {
        std::lock_guard<std::mutex> lk(mu_);
        return jittered_locked(attempt);
    }

    void RetryQueue::record_outcome(const RetryTask& task, WriteStatus status, ErrorCode code,
                                    const std::string& err, uint32_t attempt,
                                    TimePoint at, std::chrono::microseconds duration) {
        WriteOutcome o;
        o.operation_id = task.operation_id;
        o.store = StoreRole::Secondary;
        o.status = status;
        o.error_code = code;
        if (!err.empty()) o.error = err;
        o.attempt = attempt;
        o.attempted_at = at;
        o.duration = duration;
        ledger_.append_outcome(o);
    }

    size_t RetryQueue::drain_once(TimePoint now) {
        std::vector<EntityKey> due;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (const auto& kv : by_key_) {
                if (!kv.second.empty() && kv.second.front().next_attempt_at <= now) {
                    due.push_back(kv.first);
                }
            }
        }
        size_t attempts = 0;
        for (const auto& key : due) {
            attempts += drain_key(key, now);
        }
        return attempts;
    }

    size_t RetryQueue::drain_key(const EntityKey& key, TimePoint now) {
        KeySerializer::Lease lease = serializer_.acquire(key);
        size_t attempts = 0;

        while (true) {
            RetryTask task;
            {
                std::lock_guard<std::mutex> lk(mu_);
                auto it = by_key_.find(key);
                if (it == by_key_.end() || it->second.empty()) break;
                if (it->second.front().next_attempt_at > now) break;
                task = it->second.front();
            }

            const uint32_t attempt = task.attempt_count + 1;
            const TimePoint started = Clock::now();
            Timer timer;
            persist::StoreResult r = apply_task(secondary_, task,
                                                persist::deadline_after(config_.store_timeout));
            const auto elapsed = std::chrono::microseconds(timer.elapsed_us());
            metrics_.secondary_latency_us.record(timer.elapsed_us());
            metrics_.retry_attempts.increment();
            attempts++;

            std::optional<RetryTask> dead_task;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (r.ok) {
                    bool still_queued = remove_locked(task.operation_id, nullptr);
                    if (still_queued) journal_id_record(kResolve, task.operation_id);
                    metrics_.retry_successes.increment();
                    info() << "retry succeeded for " << kind_name(task.kind) << ' ' << key.str()
                           << " on attempt " << attempt;
                } else {
                    metrics_.secondary_failures.increment();
                    auto it = index_.find(task.operation_id);
                    if (it != index_.end()) {
                        if (attempt >= config_.retry.max_attempts) {
                            RetryTask dead;
                            remove_locked(task.operation_id, &dead);
                            dead.attempt_count = attempt;
                            dead.last_error = r.message;
                            dead.last_error_code = r.code;
                            journal_id_record(kAbandon, task.operation_id);
                            abandoned_.push_back(dead);
                            if (abandoned_.size() > kMaxAbandoned) abandoned_.pop_front();
                            metrics_.retries_abandoned.increment();
                            dead_task = std::move(dead);
                        } else {
                            auto& q = by_key_[key];
                            RetryTask& head = q.front();
                            head.attempt_count = attempt;
                            head.next_attempt_at = Clock::now() + jittered_locked(attempt);
                            head.last_error = r.message;
                            head.last_error_code = r.code;

                            util::ByteWriter w;
                            encode_uuid(w, head.operation_id);
                            w.put_u32(head.attempt_count);
                            w.put_i64(to_micros(head.next_attempt_at));
                            w.put_string(head.last_error);
                            w.put_u8(static_cast<uint8_t>(head.last_error_code));
                            journal_write(kAttempt, w.bytes());

                            warning() << "retry " << attempt << '/' << config_.retry.max_attempts
                                      << " failed for " << kind_name(task.kind) << ' ' << key.str()
                                      << " (" << error_code_name(r.code) << ": " << r.message << ")";
                        }
                    }
                }
                compact_journal_if_due_locked();
                refresh_gauges_locked(Clock::now());
            }

            if (r.ok) {
                record_outcome(task, WriteStatus::Success, ErrorCode::None, "", attempt, started, elapsed);
                continue;
            }
            if (dead_task) {
                record_outcome(task, WriteStatus::Failed, ErrorCode::RetriesExhausted,
                               std::string(error_code_name(r.code)) + ": " + r.message,
                               attempt, started, elapsed);
                error() << "ABANDONED secondary " << kind_name(task.kind) << ' ' << key.str()
                        << " op=" << util::uuid_string(task.operation_id)
                        << " after " << attempt << " attempts; last error "
                        << error_code_name(r.code) << ": " << r.message;
                AbandonCallback cb;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    cb = abandon_callback_;
                }
                if (cb) cb(*dead_task);
                // Later tasks for the key may still be due
                continue;
            }
            record_outcome(task, WriteStatus::Failed, r.code, r.message, attempt, started, elapsed);
            break;
        }
        return attempts;
    }

    void RetryQueue::start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) return;
        th_ = std::thread([this] { loop(); });
    }

    void RetryQueue::stop() {
        if (!running_.exchange(false)) return;
        {
            std::lock_guard<std::mutex> lk(wake_mu_);
            wake_requested_ = true;
        }
        cv_.notify_all();
        if (th_.joinable()) {
            th_.join();
        }
    }

    void RetryQueue::wake() {
        {
            std::lock_guard<std::mutex> lk(wake_mu_);
            wake_requested_ = true;
        }
        cv_.notify_all();
    }

    void RetryQueue::loop() {
        setLogThreadName("retry-drain");
        info() << "retry drain started, poll every " << config_.retry.poll_interval.count() << "ms";
        TimePoint last_prune = Clock::now();
        while (running_.load(std::memory_order_acquire)) {
            try {
                drain_once(Clock::now());
                if (Clock::now() - last_prune >= kLedgerPruneInterval) {
                    last_prune = Clock::now();
                    prune_ledger(last_prune);
                }
            } catch (const std::exception& e) {
                error() << "retry drain pass failed: " << e.what();
            }
            std::unique_lock<std::mutex> lk(wake_mu_);
            cv_.wait_for(lk, config_.retry.poll_interval, [this] {
                return wake_requested_ || !running_.load(std::memory_order_acquire);
            });
            wake_requested_ = false;
        }
        info() << "retry drain stopped";
    }

    bool RetryQueue::cancel(const OperationId& id) {
        RetryTask t;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!remove_locked(id, &t)) return false;
            journal_id_record(kCancel, id);
            metrics_.retries_cancelled.increment();
            compact_journal_if_due_locked();
            refresh_gauges_locked(Clock::now());
        }
        record_outcome(t, WriteStatus::Failed, ErrorCode::Cancelled, "cancelled by operator",
                       t.attempt_count, Clock::now(), std::chrono::microseconds(0));
        warning() << "retry cancelled for " << t.key().str() << " op=" << util::uuid_string(id);
        return true;
    }

    size_t RetryQueue::cancel_entity_type(const std::string& entity_type) {
        std::vector<RetryTask> removed;
        {
            std::lock_guard<std::mutex> lk(mu_);
            std::vector<OperationId> ids;
            for (const auto& kv : by_key_) {
                if (kv.first.entity_type != entity_type) continue;
                for (const auto& t : kv.second) ids.push_back(t.operation_id);
            }
            for (const auto& id : ids) {
                RetryTask t;
                if (remove_locked(id, &t)) {
                    journal_id_record(kCancel, id);
                    removed.push_back(std::move(t));
                }
            }
            metrics_.retries_cancelled.increment(removed.size());
            compact_journal_if_due_locked();
            refresh_gauges_locked(Clock::now());
        }
        for (const auto& t : removed) {
            record_outcome(t, WriteStatus::Failed, ErrorCode::Cancelled, "cancelled by operator",
                           t.attempt_count, Clock::now(), std::chrono::microseconds(0));
        }
        warning() << "retry queue: cancelled " << removed.size() << " tasks for entity type " << entity_type;
        return removed.size();
    }

    std::vector<RetryTask> RetryQueue::pending() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<RetryTask> out;
        for (const auto& kv : by_key_) {
            out.insert(out.end(), kv.second.begin(), kv.second.end());
        }
        return out;
    }

    std::vector<RetryTask> RetryQueue::abandoned() const {
        std::lock_guard<std::mutex> lk(mu_);
        return std::vector<RetryTask>(abandoned_.begin(), abandoned_.end());
    }

    size_t RetryQueue::depth() const {
        std::lock_guard<std::mutex> lk(mu_);
        return index_.size();
    }

    std::optional<TimePoint> RetryQueue::oldest_pending_enqueued_at() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::optional<TimePoint> oldest;
        for (const auto& kv : by_key_) {
            for (const auto& t : kv.second) {
                if (!oldest || t.enqueued_at < *oldest) oldest = t.enqueued_at;
            }
        }
        return oldest;
    }

    bool RetryQueue::has_pending(const EntityKey& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = by_key_.find(key);
        return it != by_key_.end() && !it->second.empty();
    }

    size_t RetryQueue::prune_ledger(TimePoint now) {
        if (config_.ledger_retention.count() == 0) return 0;
        std::set<OperationId> pending_ids;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (const auto& kv : index_) pending_ids.insert(kv.first);
        }
        return ledger_.prune_completed_before(now - config_.ledger_retention, pending_ids);
    }

    void RetryQueue::set_abandon_callback(AbandonCallback cb) {
        std::lock_guard<std::mutex> lk(mu_);
        abandon_callback_ = std::move(cb);
    }

} // namespace dualwrite
