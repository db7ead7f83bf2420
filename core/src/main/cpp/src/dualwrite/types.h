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

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <boost/uuid/uuid.hpp>

#include "payload.h"

namespace dualwrite {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using OperationId = boost::uuids::uuid;

    enum class OpKind : uint8_t { Create = 1, Update = 2, Delete = 3 };

    // Primary is the new service-owned store, Secondary the legacy shared one
    enum class StoreRole : uint8_t { Primary = 0, Secondary = 1 };

    enum class WriteStatus : uint8_t { Success = 0, Failed = 1, Skipped = 2 };

    enum class OverallStatus : uint8_t { Success = 0, PartialSuccess = 1, Failed = 2 };

    enum class ErrorCode : uint8_t {
        None = 0,
        StoreError,
        DuplicateKey,
        Timeout,
        Unavailable,
        Disabled,
        RetriesExhausted,
        Cancelled,
        DuplicateOperation
    };

    const char* kind_name(OpKind k);
    const char* role_name(StoreRole r);
    const char* status_name(WriteStatus s);
    const char* overall_name(OverallStatus s);
    const char* error_code_name(ErrorCode c);

    struct EntityKey {
        std::string entity_type;
        std::string entity_key;

        std::string str() const { return entity_type + "/" + entity_key; }

        bool operator==(const EntityKey& o) const {
            return entity_type == o.entity_type && entity_key == o.entity_key;
        }
        bool operator!=(const EntityKey& o) const { return !(*this == o); }
        bool operator<(const EntityKey& o) const {
            if (entity_type != o.entity_type) return entity_type < o.entity_type;
            return entity_key < o.entity_key;
        }
    };

    struct EntityKeyHash {
        size_t operator()(const EntityKey& k) const {
            size_t h = std::hash<std::string>()(k.entity_type);
            return h ^ (std::hash<std::string>()(k.entity_key) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };

    /**
     * One logical mutation. Never modified after submission; two operations
     * on the same key never execute concurrently.
     */
    struct Operation {
        OperationId operation_id{};
        std::string entity_type;
        std::string entity_key;
        OpKind kind = OpKind::Update;
        Payload payload;
        TimePoint submitted_at{};

        EntityKey key() const { return EntityKey{entity_type, entity_key}; }

        // fresh random id, submitted now
        static Operation make(const std::string& entity_type,
                              const std::string& entity_key,
                              OpKind kind,
                              Payload payload = Payload());
    };

    struct WriteOutcome {
        OperationId operation_id{};
        StoreRole store = StoreRole::Primary;
        WriteStatus status = WriteStatus::Skipped;
        ErrorCode error_code = ErrorCode::None;
        std::optional<std::string> error;
        bool noop = false;
        uint32_t attempt = 1;
        TimePoint attempted_at{};
        std::chrono::microseconds duration{0};

        bool succeeded() const { return status == WriteStatus::Success; }
        bool failed() const { return status == WriteStatus::Failed; }
        std::string describe() const;
    };

    struct DualWriteResult {
        OperationId operation_id{};
        OverallStatus overall = OverallStatus::Failed;
        WriteOutcome primary;
        std::optional<WriteOutcome> secondary;
        bool retry_scheduled = false;

        std::string describe() const;
    };

    // Microseconds since the Unix epoch; the journal time encoding
    int64_t to_micros(TimePoint t);
    TimePoint from_micros(int64_t us);

    void encode_uuid(util::ByteWriter& w, const OperationId& id);
    bool decode_uuid(util::ByteReader& r, OperationId& id);
    void encode_operation(util::ByteWriter& w, const Operation& op);
    bool decode_operation(util::ByteReader& r, Operation& op);
    void encode_outcome(util::ByteWriter& w, const WriteOutcome& o);
    bool decode_outcome(util::ByteReader& r, WriteOutcome& o);
    void encode_result(util::ByteWriter& w, const DualWriteResult& res);
    bool decode_result(util::ByteReader& r, DualWriteResult& res);

} // namespace dualwrite
