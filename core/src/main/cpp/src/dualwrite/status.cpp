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

#include "status.h"

#include <sstream>

namespace dualwrite {

    namespace {

        void describe_store(std::ostringstream& os, const StoreHealth& h) {
            os << h.store << '=' << (h.ok ? "up" : "down");
            if (!h.ok) {
                os << " (" << error_code_name(h.code);
                if (!h.message.empty()) os << ": " << h.message;
                os << ')';
            }
            os << ' ' << h.latency.count() << "us";
        }

    }

    std::string EngineStatus::describe() const {
        std::ostringstream os;
        os << "service=" << (service_name.empty() ? "-" : service_name)
           << " mode=" << (!enabled ? "disabled"
                           : !write_to_legacy ? "new_only"
                           : !write_to_new ? "legacy_only"
                           : async_legacy ? "shadow" : "dual")
           << " ops=" << operations
           << " success=" << successes
           << " partial=" << partial_successes
           << " failed=" << failures
           << " retry_depth=" << retry_depth
           << " oldest_retry_ms=";
        if (oldest_pending_retry_age) {
            os << oldest_pending_retry_age->count();
        } else {
            os << "none";
        }
        os << " abandoned=" << retries_abandoned
           << " ledger=" << ledger_entries;
        if (ledger_journal_failures > 0) {
            os << " ledger_journal_failures=" << ledger_journal_failures;
        }
        os << " last_validation_mismatches=" << last_validation_mismatches;
        if (!last_validation_at) {
            os << " last_validation=never";
        }
        return os.str();
    }

    std::string HealthReport::describe() const {
        std::ostringstream os;
        os << (healthy() ? "healthy: " : "unhealthy: ");
        describe_store(os, primary);
        os << ", ";
        describe_store(os, secondary);
        if (!legacy_required) os << " (legacy not required)";
        return os.str();
    }

} // namespace dualwrite
