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
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "coordinator.h"
#include "entity_registry.h"
#include "key_serializer.h"
#include "metrics.h"
#include "types.h"
#include "../persistence/store_adapter.h"

namespace dualwrite {

    enum class Classification : uint8_t {
        Match = 0,
        ValueMismatch,
        MissingInPrimary,
        MissingInSecondary,
        ReadError           // a store could not be read; nothing was compared
    };

    const char* classification_name(Classification c);

    struct FieldDifference {
        std::string field;              // primary-side name
        Value primary;                  // null when absent
        Value secondary;
    };

    // Report data only; producing one never changes either store.
    struct DiffRecord {
        std::string entity_type;
        std::string entity_key;
        std::optional<Payload> primary_value;
        std::optional<Payload> secondary_value;
        Classification classification = Classification::Match;
        std::vector<FieldDifference> differing_fields;
        std::string error;              // set for ReadError

        bool is_match() const { return classification == Classification::Match; }
    };

    struct ValidationPage {
        std::vector<DiffRecord> diffs;
        std::string next_cursor;        // pass back to continue; empty once done
        bool done = false;
        std::string error;              // scan failure; the cursor did not advance
    };

    struct ValidationSummary {
        size_t total = 0;
        size_t matches = 0;
        std::map<Classification, size_t> mismatches_by_classification;
        std::map<std::string, size_t> field_mismatch_counts;
        double sync_percentage = 100.0;

        // Most frequently differing fields, at most `limit`, most frequent first
        std::vector<std::pair<std::string, size_t>> common_issues(size_t limit = 10) const;
        size_t mismatches() const { return total - matches; }
    };

    struct RepairReport {
        bool refused = false;
        size_t attempted = 0;
        size_t repaired = 0;
        size_t failed = 0;
        size_t skipped = 0;             // matches, MissingInPrimary and read errors
        std::vector<DualWriteResult> results;
    };

    struct ValidationPass {
        TimePoint finished_at{};
        std::chrono::milliseconds duration{0};
        size_t checked = 0;
        size_t mismatches = 0;
        std::map<std::string, ValidationSummary> by_type;
        std::vector<std::string> errors;
    };

    /**
     * Detects drift between the two stores.
     *
     * Comparison follows the registered EntitySpec: only parity fields,
     * renamed to their legacy names, strings trimmed, numbers compared with
     * the configured absolute tolerance, absent equal to null.
     *
     * A batch scan runs in two phases. The first pages the primary's keys
     * and classifies each one; the second pages the secondary's keys and
     * reports those missing from the primary. Cursors are opaque and
     * restartable.
     */
    class SyncValidator {
    public:
        SyncValidator(const DualWriteConfig& config,
                      persist::StoreAdapter& primary,
                      persist::StoreAdapter& secondary,
                      const EntityRegistry& registry,
                      KeySerializer& serializer,
                      Coordinator& coordinator,
                      DualWriteMetrics& metrics);
        ~SyncValidator();

        SyncValidator(const SyncValidator&) = delete;
        SyncValidator& operator=(const SyncValidator&) = delete;

        // Throws std::invalid_argument for unregistered entity types
        DiffRecord validate_one(const std::string& entity_type, const std::string& entity_key);

        // page_size 0 uses the configured batch size. Throws
        // std::invalid_argument for a malformed cursor.
        ValidationPage validate_batch(const std::string& entity_type,
                                      const std::string& cursor,
                                      size_t page_size = 0);

        std::vector<DiffRecord> validate_all(const std::string& entity_type);

        // validate_all over every registered type, recorded in metrics
        ValidationPass run_full_pass();

        static ValidationSummary summarize(const std::vector<DiffRecord>& diffs);

        // Repairs MissingInSecondary and ValueMismatch from the primary.
        // Refused unless allow_repair is set in the config and here.
        RepairReport reconcile(const std::vector<DiffRecord>& diffs, bool allow_repair);

        void start();   // periodic run_full_pass every sync_interval
        void stop();
        bool running() const { return running_.load(std::memory_order_acquire); }

        std::optional<ValidationPass> last_pass() const;

        // Pure comparison of two already-read values
        static DiffRecord compare(const EntitySpec& spec,
                                  const std::string& entity_key,
                                  std::optional<Payload> primary,
                                  std::optional<Payload> secondary,
                                  double tolerance);

    private:
        DiffRecord check_key(const EntitySpec& spec, const std::string& entity_key);
        void loop();

        const DualWriteConfig& config_;
        persist::StoreAdapter& primary_;
        persist::StoreAdapter& secondary_;
        const EntityRegistry& registry_;
        KeySerializer& serializer_;
        Coordinator& coordinator_;
        DualWriteMetrics& metrics_;

        mutable std::mutex pass_mu_;
        std::optional<ValidationPass> last_pass_;

        std::atomic<bool> running_{false};
        std::thread th_;
        std::mutex mu_;
        std::condition_variable cv_;
    };

} // namespace dualwrite
