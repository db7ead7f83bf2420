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

#include "sync_validator.h"
#include "../util/log.h"

#include <algorithm>

namespace dualwrite {

    namespace {

        constexpr const char* kPrimaryPhase = "p:";
        constexpr const char* kSecondaryPhase = "s:";

        struct Cursor {
            bool secondary_phase = false;
            std::string after_key;
        };

        Cursor parse_cursor(const std::string& text) {
            Cursor c;
            if (text.empty()) return c;
            if (text.compare(0, 2, kPrimaryPhase) == 0) {
                c.after_key = text.substr(2);
                return c;
            }
            if (text.compare(0, 2, kSecondaryPhase) == 0) {
                c.secondary_phase = true;
                c.after_key = text.substr(2);
                return c;
            }
            throw std::invalid_argument("malformed validation cursor: '" + text + "'");
        }

        int64_t unix_ms(TimePoint t) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
        }

    }

    const char* classification_name(Classification c) {
        switch (c) {
        case Classification::Match:              return "match";
        case Classification::ValueMismatch:      return "value_mismatch";
        case Classification::MissingInPrimary:   return "missing_in_primary";
        case Classification::MissingInSecondary: return "missing_in_secondary";
        case Classification::ReadError:          return "read_error";
        }
        return "unknown";
    }

    std::vector<std::pair<std::string, size_t>> ValidationSummary::common_issues(size_t limit) const {
        std::vector<std::pair<std::string, size_t>> out(field_mismatch_counts.begin(),
                                                        field_mismatch_counts.end());
        std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
            return a.second > b.second;
        });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    SyncValidator::SyncValidator(const DualWriteConfig& config,
                                 persist::StoreAdapter& primary,
                                 persist::StoreAdapter& secondary,
                                 const EntityRegistry& registry,
                                 KeySerializer& serializer,
                                 Coordinator& coordinator,
                                 DualWriteMetrics& metrics)
        : config_(config), primary_(primary), secondary_(secondary), registry_(registry),
          serializer_(serializer), coordinator_(coordinator), metrics_(metrics) {}

    SyncValidator::~SyncValidator() {
        stop();
    }

    DiffRecord SyncValidator::compare(const EntitySpec& spec,
                                      const std::string& entity_key,
                                      std::optional<Payload> primary,
                                      std::optional<Payload> secondary,
                                      double tolerance) {
        DiffRecord d;
        d.entity_type = spec.entity_type;
        d.entity_key = entity_key;

        if (!primary && !secondary) {
            d.classification = Classification::Match;
        } else if (!primary) {
            d.classification = Classification::MissingInPrimary;
        } else if (!secondary) {
            d.classification = Classification::MissingInSecondary;
        } else {
            for (const auto& f : EntityRegistry::comparison_fields(spec, &*primary, &*secondary)) {
                auto pi = primary->find(f.primary_field);
                auto si = secondary->find(f.secondary_field);
                Value pv = pi == primary->end() ? Value() : pi->second;
                Value sv = si == secondary->end() ? Value() : si->second;
                if (!values_equivalent(pv, sv, tolerance)) {
                    d.differing_fields.push_back(FieldDifference{f.primary_field, pv, sv});
                }
            }
            d.classification = d.differing_fields.empty() ? Classification::Match
                                                          : Classification::ValueMismatch;
        }
        d.primary_value = std::move(primary);
        d.secondary_value = std::move(secondary);
        return d;
    }

    DiffRecord SyncValidator::check_key(const EntitySpec& spec, const std::string& entity_key) {
        const EntityKey key{spec.entity_type, entity_key};
        persist::ReadResult p;
        persist::ReadResult s;
        {
            Lease lease = serializer_.acquire(key);
            try {
                p = primary_.get(key, persist::deadline_after(config_.store_timeout));
            } catch (const std::exception& e) {
                p = persist::ReadResult::failure(ErrorCode::StoreError, e.what());
            }
            try {
                s = secondary_.get(key, persist::deadline_after(config_.store_timeout));
            } catch (const std::exception& e) {
                s = persist::ReadResult::failure(ErrorCode::StoreError, e.what());
            }
        }

        if (!p.ok || !s.ok) {
            DiffRecord d;
            d.entity_type = spec.entity_type;
            d.entity_key = entity_key;
            d.classification = Classification::ReadError;
            d.error = !p.ok ? "primary: " + p.message : "secondary: " + s.message;
            warning() << "validation of " << key.str() << " could not read " << d.error;
            return d;
        }
        return compare(spec, entity_key, std::move(p.value), std::move(s.value),
                       config_.numeric_tolerance);
    }

    DiffRecord SyncValidator::validate_one(const std::string& entity_type, const std::string& entity_key) {
        return check_key(registry_.get(entity_type), entity_key);
    }

    ValidationPage SyncValidator::validate_batch(const std::string& entity_type,
                                                 const std::string& cursor,
                                                 size_t page_size) {
        const EntitySpec spec = registry_.get(entity_type);
        const Cursor c = parse_cursor(cursor);
        if (page_size == 0) page_size = config_.batch_size;

        ValidationPage page;
        persist::StoreAdapter& source = c.secondary_phase ? secondary_ : primary_;
        persist::KeyPage keys;
        try {
            keys = source.scan_keys(entity_type, c.after_key, page_size,
                                    persist::deadline_after(config_.store_timeout));
        } catch (const std::exception& e) {
            keys = persist::KeyPage::failure(ErrorCode::StoreError, e.what());
        }
        if (!keys.ok) {
            page.error = std::string(c.secondary_phase ? "secondary" : "primary") +
                         " scan failed: " + keys.message;
            page.next_cursor = cursor.empty() ? std::string(kPrimaryPhase) : cursor;
            return page;
        }

        for (const auto& k : keys.keys) {
            DiffRecord d = check_key(spec, k);
            if (!c.secondary_phase) {
                page.diffs.push_back(std::move(d));
            } else if (d.classification == Classification::MissingInPrimary ||
                       d.classification == Classification::ReadError) {
                // keys readable in both stores were reported in the first phase
                page.diffs.push_back(std::move(d));
            }
        }

        if (!keys.done) {
            const std::string& last = keys.keys.empty() ? c.after_key : keys.keys.back();
            page.next_cursor = (c.secondary_phase ? kSecondaryPhase : kPrimaryPhase) + last;
        } else if (!c.secondary_phase) {
            page.next_cursor = kSecondaryPhase;
        } else {
            page.done = true;
        }
        return page;
    }

    std::vector<DiffRecord> SyncValidator::validate_all(const std::string& entity_type) {
        std::vector<DiffRecord> all;
        std::string cursor;
        while (true) {
            ValidationPage page = validate_batch(entity_type, cursor, config_.batch_size);
            if (!page.error.empty()) {
                throw std::runtime_error("validation of " + entity_type + " aborted: " + page.error);
            }
            for (auto& d : page.diffs) all.push_back(std::move(d));
            if (page.done) break;
            cursor = page.next_cursor;
        }
        return all;
    }

    ValidationSummary SyncValidator::summarize(const std::vector<DiffRecord>& diffs) {
        ValidationSummary s;
        s.total = diffs.size();
        for (const auto& d : diffs) {
            if (d.is_match()) {
                s.matches++;
                continue;
            }
            s.mismatches_by_classification[d.classification]++;
            for (const auto& f : d.differing_fields) {
                s.field_mismatch_counts[f.field]++;
            }
        }
        s.sync_percentage = s.total == 0 ? 100.0
                                         : 100.0 * static_cast<double>(s.matches) / static_cast<double>(s.total);
        return s;
    }

    ValidationPass SyncValidator::run_full_pass() {
        Timer timer;
        ValidationPass pass;
        for (const auto& type : registry_.types()) {
            try {
                std::vector<DiffRecord> diffs = validate_all(type);
                ValidationSummary summary = summarize(diffs);
                pass.checked += summary.total;
                pass.mismatches += summary.mismatches();
                if (summary.mismatches() > 0) {
                    warning() << "sync check " << type << ": " << summary.mismatches() << " of "
                              << summary.total << " keys differ (" << summary.sync_percentage << "% in sync)";
                    for (const auto& issue : summary.common_issues()) {
                        warning() << "  field " << issue.first << " differs on " << issue.second << " keys";
                    }
                } else {
                    info() << "sync check " << type << ": " << summary.total << " keys in sync";
                }
                pass.by_type.emplace(type, std::move(summary));
            } catch (const std::runtime_error& e) {
                error() << "sync check " << type << " failed: " << e.what();
                pass.errors.push_back(e.what());
            }
        }
        pass.finished_at = Clock::now();
        pass.duration = std::chrono::milliseconds(timer.elapsed_ms());

        metrics_.validation_passes.increment();
        metrics_.validation_checked.increment(pass.checked);
        metrics_.validation_mismatches.increment(pass.mismatches);
        metrics_.last_validation_mismatches.set(static_cast<int64_t>(pass.mismatches));
        metrics_.last_validation_unix_ms.set(unix_ms(pass.finished_at));
        metrics_.validation_pass_ms.record(timer.elapsed_ms());

        {
            std::lock_guard<std::mutex> lk(pass_mu_);
            last_pass_ = pass;
        }
        return pass;
    }

    RepairReport SyncValidator::reconcile(const std::vector<DiffRecord>& diffs, bool allow_repair) {
        RepairReport report;
        if (!config_.allow_repair || !allow_repair) {
            warning() << "reconcile refused: repair requires DUAL_WRITE_ALLOW_REPAIR and an explicit request";
            report.refused = true;
            return report;
        }
        for (const auto& d : diffs) {
            switch (d.classification) {
            case Classification::MissingInSecondary:
            case Classification::ValueMismatch: {
                report.attempted++;
                metrics_.repairs_attempted.increment();
                DualWriteResult r = coordinator_.repair_secondary(d.entity_type, d.entity_key);
                if (r.overall == OverallStatus::Success) {
                    report.repaired++;
                    metrics_.repairs_succeeded.increment();
                } else {
                    report.failed++;
                }
                report.results.push_back(std::move(r));
                break;
            }
            case Classification::MissingInPrimary:
                warning() << d.entity_type << '/' << d.entity_key
                          << " exists only in the legacy store; not repaired automatically";
                report.skipped++;
                break;
            case Classification::Match:
            case Classification::ReadError:
                report.skipped++;
                break;
            }
        }
        info() << "reconcile: " << report.repaired << " repaired, " << report.failed << " failed, "
               << report.skipped << " skipped";
        return report;
    }

    void SyncValidator::start() {
        if (!config_.validate_sync) {
            info() << "periodic sync validation disabled";
            return;
        }
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) return;
        th_ = std::thread([this] { loop(); });
    }

    void SyncValidator::stop() {
        if (!running_.exchange(false)) return;
        {
            std::lock_guard<std::mutex> lk(mu_);
        }
        cv_.notify_all();
        if (th_.joinable()) {
            th_.join();
        }
    }

    void SyncValidator::loop() {
        setLogThreadName("sync-validator");
        info() << "sync validation every " << config_.sync_interval.count() << "s";
        while (running_.load(std::memory_order_acquire)) {
            {
                std::unique_lock<std::mutex> lk(mu_);
                cv_.wait_for(lk, config_.sync_interval, [this] {
                    return !running_.load(std::memory_order_acquire);
                });
            }
            if (!running_.load(std::memory_order_acquire)) break;
            try {
                run_full_pass();
            } catch (const std::exception& e) {
                error() << "sync validation pass failed: " << e.what();
            }
        }
    }

    std::optional<ValidationPass> SyncValidator::last_pass() const {
        std::lock_guard<std::mutex> lk(pass_mu_);
        return last_pass_;
    }

} // namespace dualwrite
