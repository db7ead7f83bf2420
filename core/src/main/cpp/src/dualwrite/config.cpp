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

#include "config.h"
#include "../util/log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace dualwrite {

    namespace {

        std::string lower(std::string s) {
            for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return s;
        }

        std::string env_prefix(const std::string& service_name) {
            std::string p;
            for (char c : service_name) {
                unsigned char u = static_cast<unsigned char>(c);
                p.push_back(std::isalnum(u) ? static_cast<char>(std::toupper(u)) : '_');
            }
            return p.empty() ? p : p + "_";
        }

        int64_t parse_int(const std::string& field, const std::string& text) {
            size_t used = 0;
            long long v = 0;
            try {
                v = std::stoll(text, &used, 10);
            } catch (const std::invalid_argument&) {
                throw ConfigError(field + ": not an integer: '" + text + "'");
            } catch (const std::out_of_range&) {
                throw ConfigError(field + ": out of range: '" + text + "'");
            }
            if (used != text.size()) {
                throw ConfigError(field + ": not an integer: '" + text + "'");
            }
            return static_cast<int64_t>(v);
        }

        double parse_double(const std::string& field, const std::string& text) {
            size_t used = 0;
            double v = 0;
            try {
                v = std::stod(text, &used);
            } catch (const std::invalid_argument&) {
                throw ConfigError(field + ": not a number: '" + text + "'");
            } catch (const std::out_of_range&) {
                throw ConfigError(field + ": out of range: '" + text + "'");
            }
            if (used != text.size()) {
                throw ConfigError(field + ": not a number: '" + text + "'");
            }
            return v;
        }

        uint32_t parse_count(const std::string& field, const std::string& text) {
            int64_t v = parse_int(field, text);
            if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) {
                throw ConfigError(field + ": must be between 0 and " + std::to_string(UINT32_MAX));
            }
            return static_cast<uint32_t>(v);
        }

        // Resolves one field through the service prefix, then the global name
        class EnvReader {
        public:
            EnvReader(const std::string& service_name, const DualWriteConfig::Lookup& lookup)
                : prefix_(env_prefix(service_name)), lookup_(lookup) {}

            std::optional<std::string> raw(const std::string& suffix) const {
                if (!prefix_.empty()) {
                    auto v = lookup_(prefix_ + suffix);
                    if (v) return v;
                }
                return lookup_(suffix);
            }

            void read_bool(const std::string& suffix, bool& out) const {
                if (auto v = raw(suffix)) out = parse_bool(suffix, *v);
            }

            void read_count(const std::string& suffix, uint32_t& out) const {
                if (auto v = raw(suffix)) out = parse_count(suffix, *v);
            }

            void read_double(const std::string& suffix, double& out) const {
                if (auto v = raw(suffix)) out = parse_double(suffix, *v);
            }

            void read_string(const std::string& suffix, std::string& out) const {
                if (auto v = raw(suffix)) out = *v;
            }

            template<typename Duration>
            void read_duration(const std::string& suffix, Duration& out) const {
                if (auto v = raw(suffix)) out = Duration(parse_int(suffix, *v));
            }

        private:
            std::string prefix_;
            const DualWriteConfig::Lookup& lookup_;
        };

    }

    bool parse_bool(const std::string& field, const std::string& text) {
        std::string v = lower(text);
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        throw ConfigError(field + ": not a boolean: '" + text + "'");
    }

    std::chrono::milliseconds RetryPolicy::backoff(uint32_t attempt) const {
        if (attempt < 1) attempt = 1;
        // Saturate the doubling instead of overflowing
        int64_t delay = base_delay.count();
        for (uint32_t i = 1; i < attempt && delay < max_delay.count(); ++i) {
            delay *= 2;
        }
        return std::chrono::milliseconds(std::min<int64_t>(delay, max_delay.count()));
    }

    void DualWriteConfig::validate() const {
        if (!primary_writes_active() && !legacy_writes_active()) {
            throw ConfigError("DUAL_WRITE_TO_NEW/DUAL_WRITE_TO_LEGACY: both stores are disabled");
        }
        if (enabled && async_legacy && !write_to_new) {
            throw ConfigError("DUAL_WRITE_ASYNC_LEGACY: requires DUAL_WRITE_TO_NEW");
        }
        if (enabled && async_legacy && fail_on_legacy_error) {
            throw ConfigError("DUAL_WRITE_ASYNC_LEGACY: cannot be combined with DUAL_WRITE_FAIL_ON_LEGACY_ERROR");
        }
        if (retry.max_attempts < 1) {
            throw ConfigError("DUAL_WRITE_RETRY_MAX_ATTEMPTS: must be at least 1");
        }
        if (retry.base_delay.count() <= 0) {
            throw ConfigError("DUAL_WRITE_RETRY_BASE_DELAY_MS: must be positive");
        }
        if (retry.max_delay.count() <= 0) {
            throw ConfigError("DUAL_WRITE_RETRY_MAX_DELAY_MS: must be positive");
        }
        if (retry.max_delay < retry.base_delay) {
            throw ConfigError("DUAL_WRITE_RETRY_MAX_DELAY_MS: must not be below DUAL_WRITE_RETRY_BASE_DELAY_MS");
        }
        if (retry.poll_interval.count() <= 0) {
            throw ConfigError("DUAL_WRITE_RETRY_POLL_MS: must be positive");
        }
        if (!(retry.jitter >= 0.0 && retry.jitter <= 1.0)) {
            throw ConfigError("DUAL_WRITE_RETRY_JITTER: must be within [0, 1]");
        }
        if (store_timeout.count() <= 0) {
            throw ConfigError("DUAL_WRITE_STORE_TIMEOUT_MS: must be positive");
        }
        if (batch_size == 0) {
            throw ConfigError("DUAL_WRITE_BATCH_SIZE: must be positive");
        }
        if (validate_sync && sync_interval.count() <= 0) {
            throw ConfigError("DUAL_WRITE_SYNC_INTERVAL: must be positive when DUAL_WRITE_VALIDATE_SYNC is on");
        }
        if (!(numeric_tolerance >= 0.0)) {
            throw ConfigError("DUAL_WRITE_NUMERIC_TOLERANCE: must not be negative");
        }
        if (journal_compact_min_records == 0) {
            throw ConfigError("DUAL_WRITE_JOURNAL_COMPACT_MIN_RECORDS: must be positive");
        }
        if (ledger_retention.count() < 0) {
            throw ConfigError("DUAL_WRITE_LEDGER_RETENTION_S: must not be negative");
        }
    }

    std::string DualWriteConfig::describe() const {
        std::ostringstream os;
        os << "service=" << (service_name.empty() ? "-" : service_name)
           << " enabled=" << enabled
           << " to_new=" << write_to_new
           << " to_legacy=" << write_to_legacy
           << " fail_on_legacy=" << fail_on_legacy_error
           << " async_legacy=" << async_legacy
           << " validate_sync=" << validate_sync
           << " sync_interval=" << sync_interval.count() << "s"
           << " batch=" << batch_size
           << " timeout=" << store_timeout.count() << "ms"
           << " retry=" << retry.max_attempts << "x/" << retry.base_delay.count()
           << "-" << retry.max_delay.count() << "ms"
           << " repair=" << allow_repair
           << " journal=" << (journal_dir.empty() ? "(memory)" : journal_dir)
           << " ledger_retention=" << ledger_retention.count() << "s";
        return os.str();
    }

    DualWriteConfig DualWriteConfig::from_env(const std::string& service_name) {
        return from_lookup(service_name, [](const std::string& name) -> std::optional<std::string> {
            const char* v = std::getenv(name.c_str());
            if (!v) return std::nullopt;
            return std::string(v);
        });
    }

    DualWriteConfig DualWriteConfig::from_lookup(const std::string& service_name, const Lookup& lookup) {
        DualWriteConfig c;
        c.service_name = service_name;
        EnvReader env(service_name, lookup);

        env.read_bool("DUAL_WRITE_ENABLED", c.enabled);
        env.read_bool("DUAL_WRITE_TO_NEW", c.write_to_new);
        env.read_bool("DUAL_WRITE_TO_LEGACY", c.write_to_legacy);
        env.read_bool("DUAL_WRITE_FAIL_ON_NEW_ERROR", c.fail_on_new_error);
        env.read_bool("DUAL_WRITE_FAIL_ON_LEGACY_ERROR", c.fail_on_legacy_error);
        env.read_bool("DUAL_WRITE_ASYNC_LEGACY", c.async_legacy);
        env.read_bool("DUAL_WRITE_VALIDATE_SYNC", c.validate_sync);
        env.read_duration("DUAL_WRITE_SYNC_INTERVAL", c.sync_interval);
        env.read_count("DUAL_WRITE_BATCH_SIZE", c.batch_size);
        env.read_duration("DUAL_WRITE_STORE_TIMEOUT_MS", c.store_timeout);
        env.read_count("DUAL_WRITE_RETRY_MAX_ATTEMPTS", c.retry.max_attempts);
        env.read_duration("DUAL_WRITE_RETRY_BASE_DELAY_MS", c.retry.base_delay);
        env.read_duration("DUAL_WRITE_RETRY_MAX_DELAY_MS", c.retry.max_delay);
        env.read_double("DUAL_WRITE_RETRY_JITTER", c.retry.jitter);
        env.read_duration("DUAL_WRITE_RETRY_POLL_MS", c.retry.poll_interval);
        env.read_double("DUAL_WRITE_NUMERIC_TOLERANCE", c.numeric_tolerance);
        env.read_bool("DUAL_WRITE_ALLOW_REPAIR", c.allow_repair);
        env.read_string("DUAL_WRITE_JOURNAL_DIR", c.journal_dir);
        env.read_count("DUAL_WRITE_JOURNAL_COMPACT_MIN_RECORDS", c.journal_compact_min_records);
        env.read_duration("DUAL_WRITE_LEDGER_RETENTION_S", c.ledger_retention);
        env.read_bool("DUAL_WRITE_LOG_ALL", c.log_all_operations);
        env.read_bool("DUAL_WRITE_LOG_ERRORS_ONLY", c.log_errors_only);
        env.read_bool("DUAL_WRITE_METRICS_ENABLED", c.metrics_enabled);

        if (!c.fail_on_new_error) {
            warning() << "DUAL_WRITE_FAIL_ON_NEW_ERROR=false ignored: new store failures are always fatal";
            c.fail_on_new_error = true;
        }

        c.validate();
        info() << "dual-write config loaded: " << c.describe();
        return c;
    }

    DualWriteConfig DualWriteConfig::migration_profile(const std::string& name,
                                                       const std::string& service_name) {
        DualWriteConfig c;
        c.service_name = service_name;
        std::string n = lower(name);
        if (n == "dual") {
            // defaults
        } else if (n == "new_only") {
            c.write_to_legacy = false;
        } else if (n == "legacy_only") {
            c.write_to_new = false;
            c.validate_sync = false;
        } else if (n == "shadow") {
            c.async_legacy = true;
            c.fail_on_legacy_error = false;
        } else {
            throw ConfigError("unknown migration profile: '" + name + "'");
        }
        c.validate();
        return c;
    }

} // namespace dualwrite
