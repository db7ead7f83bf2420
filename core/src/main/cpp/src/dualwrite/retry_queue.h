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
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "key_serializer.h"
#include "metrics.h"
#include "types.h"
#include "write_ledger.h"
#include "../persistence/journal.h"
#include "../persistence/store_adapter.h"

namespace dualwrite {

    // A secondary write waiting to be (re)applied.
    struct RetryTask {
        OperationId operation_id{};
        std::string entity_type;
        std::string entity_key;
        OpKind kind = OpKind::Update;
        Payload payload;
        uint32_t attempt_count = 0;     // attempts already made
        TimePoint next_attempt_at{};
        TimePoint enqueued_at{};
        std::string last_error;
        ErrorCode last_error_code = ErrorCode::None;

        EntityKey key() const { return EntityKey{entity_type, entity_key}; }

        static RetryTask from_operation(const Operation& op, uint32_t attempt_count,
                                        TimePoint next_attempt_at);
    };

    /**
     * Background re-application of secondary writes.
     *
     * Tasks for one key are kept in FIFO order and only the head is ever
     * attempted, so the secondary sees a key's writes in submission order.
     * Each attempt holds the key's lease. After a failure the task waits
     * min(max_delay, base_delay * 2^(attempt-1)) shortened by up to the
     * jitter fraction; at max_attempts it is abandoned, which is logged at
     * ERROR, counted, reported to the abandonment callback and kept in a
     * bounded list.
     *
     * With a journal directory every state change is appended to
     * retry_queue.journal and replayed on construction. Journal failures
     * are logged and never stop the queue; tasks then live in memory only.
     * The journal is compacted at open and whenever compaction::due() holds
     * for journal_compact_min_records.
     */
    class RetryQueue {
    public:
        using AbandonCallback = std::function<void(const RetryTask& task)>;

        static constexpr size_t kMaxAbandoned = 1000;
        static constexpr std::chrono::seconds kLedgerPruneInterval{60};

        RetryQueue(const DualWriteConfig& config,
                   persist::StoreAdapter& secondary,
                   KeySerializer& serializer,
                   WriteLedger& ledger,
                   DualWriteMetrics& metrics);
        ~RetryQueue();

        RetryQueue(const RetryQueue&) = delete;
        RetryQueue& operator=(const RetryQueue&) = delete;

        void enqueue(RetryTask task);

        // Attempts every due head task once; returns the number of attempts
        size_t drain_once(TimePoint now = Clock::now());

        void start();   // spawn drain thread
        void stop();    // signal & join
        bool running() const { return running_.load(std::memory_order_acquire); }
        void wake();

        bool cancel(const OperationId& id);
        size_t cancel_entity_type(const std::string& entity_type);

        std::vector<RetryTask> pending() const;
        std::vector<RetryTask> abandoned() const;
        size_t depth() const;
        std::optional<TimePoint> oldest_pending_enqueued_at() const;
        bool has_pending(const EntityKey& key) const;

        void set_abandon_callback(AbandonCallback cb);

        // Prunes completed ledger entries older than ledger_retention,
        // keeping those with a pending retry. The drain thread calls this
        // every kLedgerPruneInterval. Returns how many were dropped.
        size_t prune_ledger(TimePoint now = Clock::now());
        bool durable() const { return journal_ != nullptr; }

        // Backoff for the given attempt with jitter applied
        std::chrono::milliseconds retry_delay(uint32_t attempt);

    private:
        enum RecordType : uint16_t {
            kEnqueue = 1,
            kAttempt = 2,
            kResolve = 3,
            kAbandon = 4,
            kCancel = 5
        };

        void loop();
        void recover();
        void journal_write(uint16_t type, const std::vector<uint8_t>& body);
        void journal_id_record(uint16_t type, const OperationId& id);
        std::vector<persist::JournalRecord> live_records_locked() const;
        void compact_journal_if_due_locked();
        bool remove_locked(const OperationId& id, RetryTask* out);
        void refresh_gauges_locked(TimePoint now);
        void record_outcome(const RetryTask& task, WriteStatus status, ErrorCode code,
                            const std::string& error, uint32_t attempt,
                            TimePoint at, std::chrono::microseconds duration);
        std::chrono::milliseconds jittered_locked(uint32_t attempt);

        // Attempts the head of one key while it stays due; returns attempts made
        size_t drain_key(const EntityKey& key, TimePoint now);

        const DualWriteConfig& config_;
        persist::StoreAdapter& secondary_;
        KeySerializer& serializer_;
        WriteLedger& ledger_;
        DualWriteMetrics& metrics_;

        mutable std::mutex mu_;
        std::map<EntityKey, std::deque<RetryTask>> by_key_;
        std::map<OperationId, EntityKey> index_;
        std::deque<RetryTask> abandoned_;
        std::mt19937_64 rng_;
        AbandonCallback abandon_callback_;
        std::unique_ptr<persist::Journal> journal_;

        // drain thread
        std::atomic<bool> running_{false};
        std::thread th_;
        std::mutex wake_mu_;
        std::condition_variable cv_;
        bool wake_requested_ = false;
    };

} // namespace dualwrite
