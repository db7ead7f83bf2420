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
#include <stdexcept>
#include <string>

namespace dualwrite {

    // Invalid or inconsistent settings. The message names the field.
    class ConfigError : public std::invalid_argument {
    public:
        explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
    };

    struct RetryPolicy {
        uint32_t max_attempts = 5;
        std::chrono::milliseconds base_delay{500};
        std::chrono::milliseconds max_delay{60000};
        double jitter = 0.2;                         // fraction in [0,1]
        std::chrono::milliseconds poll_interval{250};

        // min(max_delay, base_delay * 2^(attempt-1)) before jitter
        std::chrono::milliseconds backoff(uint32_t attempt) const;
    };

    /**
     * Immutable dual-write settings for one service. Load once at startup
     * with from_env() and pass by const reference to every component.
     */
    struct DualWriteConfig {
        std::string service_name;

        bool enabled = true;
        bool write_to_new = true;
        bool write_to_legacy = true;
        bool fail_on_new_error = true;
        bool fail_on_legacy_error = false;
        bool async_legacy = false;

        bool validate_sync = true;
        std::chrono::seconds sync_interval{300};
        uint32_t batch_size = 100;
        std::chrono::milliseconds store_timeout{5000};

        RetryPolicy retry;

        double numeric_tolerance = 0.005;
        bool allow_repair = false;
        std::string journal_dir;        // empty: retry queue and ledger stay in memory
        // Journals are rewritten with only live records once they hold at
        // least this many records and more than twice the live count
        uint32_t journal_compact_min_records = 1024;
        // Completed ledger entries older than this are pruned by the retry
        // worker; zero keeps them
        std::chrono::seconds ledger_retention{86400};

        // Successful writes log at INFO with log_all_operations or without
        // log_errors_only, otherwise at DEBUG
        bool log_all_operations = false;
        bool log_errors_only = true;
        bool metrics_enabled = true;

        // Legacy writes happen only while dual write is enabled
        bool legacy_writes_active() const { return enabled && write_to_legacy; }
        // A disabled dual write still writes the new store
        bool primary_writes_active() const { return !enabled || write_to_new; }

        // Throws ConfigError on the first violated rule
        void validate() const;

        std::string describe() const;

        using Lookup = std::function<std::optional<std::string>(const std::string& name)>;

        /**
         * Reads <SERVICE>_DUAL_WRITE_* then DUAL_WRITE_* then the default for
         * every field, then validates. `service_name` is upper-cased for the
         * prefix ("cart-service" -> "CART_SERVICE_").
         */
        static DualWriteConfig from_env(const std::string& service_name);
        static DualWriteConfig from_lookup(const std::string& service_name, const Lookup& lookup);

        /**
         * Named migration stages:
         *   dual         write both stores synchronously (defaults)
         *   new_only     cut over; legacy writes off
         *   legacy_only  rollback; new store writes off
         *   shadow       legacy written asynchronously through the retry queue
         */
        static DualWriteConfig migration_profile(const std::string& name,
                                                 const std::string& service_name = "");
    };

    // "true/1/yes/on" and "false/0/no/off", case-insensitive
    bool parse_bool(const std::string& field, const std::string& text);

} // namespace dualwrite
