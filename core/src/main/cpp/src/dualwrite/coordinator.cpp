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

#include "coordinator.h"
#include "../util/log.h"
#include "../util/uuid.h"

namespace dualwrite {

    Coordinator::Coordinator(const DualWriteConfig& config,
                             persist::StoreAdapter& primary,
                             persist::StoreAdapter& secondary,
                             KeySerializer& serializer,
                             WriteLedger& ledger,
                             RetryQueue& retries,
                             DualWriteMetrics& metrics)
        : config_(config), primary_(primary), secondary_(secondary),
          serializer_(serializer), ledger_(ledger), retries_(retries), metrics_(metrics) {}

    WriteOutcome Coordinator::skipped(const Operation& op, StoreRole role, ErrorCode code,
                                      const std::string& reason) const {
        WriteOutcome o;
        o.operation_id = op.operation_id;
        o.store = role;
        o.status = WriteStatus::Skipped;
        o.error_code = code;
        o.error = reason;
        o.attempted_at = Clock::now();
        return o;
    }

    WriteOutcome Coordinator::invoke(persist::StoreAdapter& store, StoreRole role,
                                     const Operation& op, uint32_t attempt) {
        WriteOutcome o;
        o.operation_id = op.operation_id;
        o.store = role;
        o.attempt = attempt;
        o.attempted_at = Clock::now();

        const persist::Deadline deadline = persist::deadline_after(config_.store_timeout);
        Timer timer;
        persist::StoreResult r;
        try {
            if (op.kind == OpKind::Delete) {
                r = store.remove(op.key(), deadline);
            } else {
                r = store.put(op.key(), op.kind, op.payload, deadline);
            }
        } catch (const std::exception& e) {
            r = persist::StoreResult::failure(ErrorCode::StoreError,
                                              std::string("adapter threw: ") + e.what());
        }
        o.duration = std::chrono::microseconds(timer.elapsed_us());
        (role == StoreRole::Primary ? metrics_.primary_latency_us : metrics_.secondary_latency_us)
            .record(timer.elapsed_us());

        if (r.ok) {
            o.status = WriteStatus::Success;
            o.noop = r.noop;
        } else {
            o.status = WriteStatus::Failed;
            o.error_code = r.code == ErrorCode::None ? ErrorCode::StoreError : r.code;
            o.error = r.message;
            (role == StoreRole::Primary ? metrics_.primary_failures : metrics_.secondary_failures)
                .increment();
            warning() << role_name(role) << " store " << store.name() << " failed "
                      << kind_name(op.kind) << ' ' << op.key().str() << ": "
                      << error_code_name(o.error_code) << ": " << r.message;
        }
        return o;
    }

    void Coordinator::defer_secondary(const Operation& op, DualWriteResult& result) {
        retries_.enqueue(RetryTask::from_operation(op, 0, Clock::now()));
        result.retry_scheduled = true;
    }

    DualWriteResult Coordinator::execute(const Operation& op) {
        Lease lease = serializer_.acquire(op.key());

        DualWriteResult result;
        result.operation_id = op.operation_id;

        std::optional<DualWriteResult> existing;
        switch (ledger_.begin(op, &existing)) {
        case WriteLedger::BeginStatus::Completed:
            debug() << "operation " << util::uuid_string(op.operation_id) << " already completed";
            return *existing;
        case WriteLedger::BeginStatus::InFlight:
        case WriteLedger::BeginStatus::KeyConflict:
            warning() << "duplicate operation id " << util::uuid_string(op.operation_id)
                      << " for " << op.key().str();
            result.overall = OverallStatus::Failed;
            result.primary = skipped(op, StoreRole::Primary, ErrorCode::DuplicateOperation,
                                     "operation id already in use");
            result.primary.status = WriteStatus::Failed;
            metrics_.ops_total.increment();
            metrics_.ops_failed.increment();
            return result;
        case WriteLedger::BeginStatus::Started:
            break;
        }

        // 1. primary
        if (config_.primary_writes_active()) {
            result.primary = invoke(primary_, StoreRole::Primary, op, 1);
        } else {
            result.primary = skipped(op, StoreRole::Primary, ErrorCode::Disabled,
                                     "writes to the new store are disabled");
        }
        ledger_.append_outcome(result.primary);

        if (result.primary.failed()) {
            result.overall = OverallStatus::Failed;
            finish(op, result);
            return result;
        }

        // 2. secondary
        const bool legacy_only = result.primary.status == WriteStatus::Skipped;
        if (!config_.legacy_writes_active()) {
            result.overall = OverallStatus::Success;
        } else if (retries_.has_pending(op.key())) {
            debug() << op.key().str() << " has pending retries; queueing secondary write behind them";
            defer_secondary(op, result);
            result.overall = OverallStatus::Success;
        } else if (config_.async_legacy && !legacy_only) {
            defer_secondary(op, result);
            result.overall = OverallStatus::Success;
        } else {
            WriteOutcome s = invoke(secondary_, StoreRole::Secondary, op, 1);
            ledger_.append_outcome(s);
            if (s.succeeded()) {
                result.overall = OverallStatus::Success;
            } else if (legacy_only) {
                // the legacy store is the only target
                result.overall = OverallStatus::Failed;
            } else {
                RetryTask task = RetryTask::from_operation(op, 1, Clock::now() + retries_.retry_delay(1));
                task.last_error = s.error.value_or("");
                task.last_error_code = s.error_code;
                retries_.enqueue(std::move(task));
                result.retry_scheduled = true;
                result.overall = config_.fail_on_legacy_error ? OverallStatus::Failed
                                                               : OverallStatus::PartialSuccess;
            }
            result.secondary = std::move(s);
        }

        finish(op, result);
        return result;
    }

    void Coordinator::finish(const Operation& op, DualWriteResult& result) {
        ledger_.complete(result);

        metrics_.ops_total.increment();
        switch (result.overall) {
        case OverallStatus::Success:
            metrics_.ops_success.increment();
            if (config_.log_all_operations || !config_.log_errors_only) {
                info() << "dual write " << kind_name(op.kind) << ' ' << op.key().str() << ": "
                       << result.describe();
            } else {
                debug() << "dual write " << kind_name(op.kind) << ' ' << op.key().str() << ": "
                        << result.describe();
            }
            break;
        case OverallStatus::PartialSuccess:
            metrics_.ops_partial.increment();
            warning() << "dual write " << kind_name(op.kind) << ' ' << op.key().str()
                      << " partially applied: " << result.describe();
            break;
        case OverallStatus::Failed:
            metrics_.ops_failed.increment();
            error() << "dual write " << kind_name(op.kind) << ' ' << op.key().str()
                    << " failed: " << result.describe();
            break;
        }
    }

    DualWriteResult Coordinator::repair_secondary(const std::string& entity_type,
                                                  const std::string& entity_key) {
        const EntityKey key{entity_type, entity_key};
        if (!config_.legacy_writes_active()) {
            Operation op = Operation::make(entity_type, entity_key, OpKind::Update);
            DualWriteResult result;
            result.operation_id = op.operation_id;
            result.overall = OverallStatus::Failed;
            result.primary = skipped(op, StoreRole::Primary, ErrorCode::None, "repair reads the primary only");
            result.secondary = skipped(op, StoreRole::Secondary, ErrorCode::Disabled,
                                       "writes to the legacy store are disabled");
            warning() << "repair of " << key.str() << " refused: writes to the legacy store are disabled";
            return result;
        }
        Lease lease = serializer_.acquire(key);

        persist::ReadResult current;
        try {
            current = primary_.get(key, persist::deadline_after(config_.store_timeout));
        } catch (const std::exception& e) {
            current = persist::ReadResult::failure(ErrorCode::StoreError,
                                                   std::string("adapter threw: ") + e.what());
        }

        Operation op = Operation::make(entity_type, entity_key,
                                       current.found() ? OpKind::Update : OpKind::Delete,
                                       current.found() ? *current.value : Payload());
        ledger_.begin(op);

        DualWriteResult result;
        result.operation_id = op.operation_id;
        result.primary = skipped(op, StoreRole::Primary, ErrorCode::None, "repair reads the primary only");
        if (!current.ok) {
            result.primary.status = WriteStatus::Failed;
            result.primary.error_code = current.code;
            result.primary.error = "primary read failed: " + current.message;
            ledger_.append_outcome(result.primary);
            result.overall = OverallStatus::Failed;
            ledger_.complete(result);
            error() << "repair of " << key.str() << " failed reading primary: " << current.message;
            return result;
        }
        ledger_.append_outcome(result.primary);

        if (retries_.has_pending(key)) {
            defer_secondary(op, result);
            result.overall = OverallStatus::Success;
        } else {
            WriteOutcome s = invoke(secondary_, StoreRole::Secondary, op, 1);
            ledger_.append_outcome(s);
            result.overall = s.succeeded() ? OverallStatus::Success : OverallStatus::Failed;
            result.secondary = std::move(s);
        }
        ledger_.complete(result);
        info() << "repair " << kind_name(op.kind) << ' ' << key.str() << ": " << result.describe();
        return result;
    }

} // namespace dualwrite
