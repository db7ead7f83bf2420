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

#include "types.h"
#include "../util/uuid.h"

#include <sstream>

namespace dualwrite {

    const char* kind_name(OpKind k) {
        switch (k) {
        case OpKind::Create: return "create";
        case OpKind::Update: return "update";
        case OpKind::Delete: return "delete";
        }
        return "unknown";
    }

    const char* role_name(StoreRole r) {
        return r == StoreRole::Primary ? "primary" : "secondary";
    }

    const char* status_name(WriteStatus s) {
        switch (s) {
        case WriteStatus::Success: return "success";
        case WriteStatus::Failed:  return "failed";
        case WriteStatus::Skipped: return "skipped";
        }
        return "unknown";
    }

    const char* overall_name(OverallStatus s) {
        switch (s) {
        case OverallStatus::Success:        return "success";
        case OverallStatus::PartialSuccess: return "partial_success";
        case OverallStatus::Failed:         return "failed";
        }
        return "unknown";
    }

    const char* error_code_name(ErrorCode c) {
        switch (c) {
        case ErrorCode::None:               return "none";
        case ErrorCode::StoreError:         return "store_error";
        case ErrorCode::DuplicateKey:       return "duplicate_key";
        case ErrorCode::Timeout:            return "timeout";
        case ErrorCode::Unavailable:        return "unavailable";
        case ErrorCode::Disabled:           return "disabled";
        case ErrorCode::RetriesExhausted:   return "retries_exhausted";
        case ErrorCode::Cancelled:          return "cancelled";
        case ErrorCode::DuplicateOperation: return "duplicate_operation";
        }
        return "unknown";
    }

    Operation Operation::make(const std::string& entity_type,
                              const std::string& entity_key,
                              OpKind kind,
                              Payload payload) {
        Operation op;
        op.operation_id = util::random_uuid();
        op.entity_type = entity_type;
        op.entity_key = entity_key;
        op.kind = kind;
        op.payload = std::move(payload);
        op.submitted_at = Clock::now();
        return op;
    }

    std::string WriteOutcome::describe() const {
        std::ostringstream os;
        os << role_name(store) << '=' << status_name(status);
        if (error_code != ErrorCode::None) {
            os << '(' << error_code_name(error_code);
            if (error) os << ": " << *error;
            os << ')';
        }
        if (noop) os << " noop";
        os << " attempt=" << attempt;
        return os.str();
    }

    std::string DualWriteResult::describe() const {
        std::ostringstream os;
        os << util::uuid_string(operation_id) << ' ' << overall_name(overall)
           << " [" << primary.describe();
        if (secondary) os << ", " << secondary->describe();
        os << ']';
        if (retry_scheduled) os << " retry_scheduled";
        return os.str();
    }

    int64_t to_micros(TimePoint t) {
        return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
    }

    TimePoint from_micros(int64_t us) {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(us)));
    }

    void encode_uuid(util::ByteWriter& w, const OperationId& id) {
        w.put_bytes(id.data, id.size());
    }

    bool decode_uuid(util::ByteReader& r, OperationId& id) {
        return r.get_bytes(id.data, id.size());
    }

    void encode_operation(util::ByteWriter& w, const Operation& op) {
        encode_uuid(w, op.operation_id);
        w.put_string(op.entity_type);
        w.put_string(op.entity_key);
        w.put_u8(static_cast<uint8_t>(op.kind));
        encode_payload(w, op.payload);
        w.put_i64(to_micros(op.submitted_at));
    }

    bool decode_operation(util::ByteReader& r, Operation& op) {
        uint8_t kind;
        int64_t submitted;
        if (!decode_uuid(r, op.operation_id) ||
            !r.get_string(op.entity_type) ||
            !r.get_string(op.entity_key) ||
            !r.get_u8(kind) ||
            !decode_payload(r, op.payload) ||
            !r.get_i64(submitted)) {
            return false;
        }
        if (kind < static_cast<uint8_t>(OpKind::Create) || kind > static_cast<uint8_t>(OpKind::Delete)) {
            return false;
        }
        op.kind = static_cast<OpKind>(kind);
        op.submitted_at = from_micros(submitted);
        return true;
    }

    void encode_outcome(util::ByteWriter& w, const WriteOutcome& o) {
        encode_uuid(w, o.operation_id);
        w.put_u8(static_cast<uint8_t>(o.store));
        w.put_u8(static_cast<uint8_t>(o.status));
        w.put_u8(static_cast<uint8_t>(o.error_code));
        w.put_u8(o.error ? 1 : 0);
        if (o.error) w.put_string(*o.error);
        w.put_u8(o.noop ? 1 : 0);
        w.put_u32(o.attempt);
        w.put_i64(to_micros(o.attempted_at));
        w.put_i64(o.duration.count());
    }

    bool decode_outcome(util::ByteReader& r, WriteOutcome& o) {
        uint8_t store, status, code, has_error, noop;
        int64_t at, dur;
        if (!decode_uuid(r, o.operation_id) ||
            !r.get_u8(store) || !r.get_u8(status) || !r.get_u8(code) ||
            !r.get_u8(has_error)) {
            return false;
        }
        if (store > 1 || status > 2 || code > static_cast<uint8_t>(ErrorCode::DuplicateOperation)) {
            return false;
        }
        o.error.reset();
        if (has_error) {
            std::string e;
            if (!r.get_string(e)) return false;
            o.error = std::move(e);
        }
        if (!r.get_u8(noop) || !r.get_u32(o.attempt) || !r.get_i64(at) || !r.get_i64(dur)) {
            return false;
        }
        o.store = static_cast<StoreRole>(store);
        o.status = static_cast<WriteStatus>(status);
        o.error_code = static_cast<ErrorCode>(code);
        o.noop = noop != 0;
        o.attempted_at = from_micros(at);
        o.duration = std::chrono::microseconds(dur);
        return true;
    }

    void encode_result(util::ByteWriter& w, const DualWriteResult& res) {
        encode_uuid(w, res.operation_id);
        w.put_u8(static_cast<uint8_t>(res.overall));
        encode_outcome(w, res.primary);
        w.put_u8(res.secondary ? 1 : 0);
        if (res.secondary) encode_outcome(w, *res.secondary);
        w.put_u8(res.retry_scheduled ? 1 : 0);
    }

    bool decode_result(util::ByteReader& r, DualWriteResult& res) {
        uint8_t overall, has_secondary, retry;
        if (!decode_uuid(r, res.operation_id) || !r.get_u8(overall) || overall > 2 ||
            !decode_outcome(r, res.primary) || !r.get_u8(has_secondary)) {
            return false;
        }
        res.secondary.reset();
        if (has_secondary) {
            WriteOutcome s;
            if (!decode_outcome(r, s)) return false;
            res.secondary = std::move(s);
        }
        if (!r.get_u8(retry)) return false;
        res.overall = static_cast<OverallStatus>(overall);
        res.retry_scheduled = retry != 0;
        return true;
    }

} // namespace dualwrite
