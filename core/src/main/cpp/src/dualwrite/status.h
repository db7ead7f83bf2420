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
#include <optional>
#include <string>

#include "types.h"

namespace dualwrite {

    // Point-in-time view of one engine for health-check collaborators.
    struct EngineStatus {
        std::string service_name;
        bool enabled = true;
        bool write_to_new = true;
        bool write_to_legacy = true;
        bool async_legacy = false;

        uint64_t operations = 0;
        uint64_t successes = 0;
        uint64_t partial_successes = 0;
        uint64_t failures = 0;

        size_t retry_depth = 0;
        std::optional<std::chrono::milliseconds> oldest_pending_retry_age;  // empty when none
        uint64_t retries_abandoned = 0;
        bool retry_worker_running = false;

        size_t ledger_entries = 0;
        uint64_t ledger_journal_failures = 0;

        std::optional<TimePoint> last_validation_at;   // empty before the first pass
        uint64_t last_validation_mismatches = 0;
        bool validator_running = false;

        std::string describe() const;
    };

    struct StoreHealth {
        std::string store;
        bool ok = false;
        ErrorCode code = ErrorCode::None;
        std::string message;
        std::chrono::microseconds latency{0};
    };

    struct HealthReport {
        StoreHealth primary;
        StoreHealth secondary;
        // The legacy store only counts while legacy writes are active
        bool legacy_required = true;

        bool healthy() const { return primary.ok && (secondary.ok || !legacy_required); }
        std::string describe() const;
    };

} // namespace dualwrite
