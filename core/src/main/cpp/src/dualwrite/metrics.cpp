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

#include "metrics.h"
#include <algorithm>
#include <numeric>
#include <sstream>

namespace dualwrite {

// Histogram implementation
void Histogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
    next_ = 0;
    count_ = 0;
    sum_ = 0;
}

void Histogram::record(uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (values_.size() < window_) {
        values_.push_back(value);
    } else {
        values_[next_] = value;
        next_ = (next_ + 1) % window_;
    }
    count_++;
    sum_ += value;
}

Histogram::Stats Histogram::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats{};
    if (values_.empty()) {
        return stats;
    }

    std::vector<uint64_t> sorted = values_;
    std::sort(sorted.begin(), sorted.end());

    stats.count = count_;
    stats.sum = sum_;
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.mean = static_cast<double>(sum_) / static_cast<double>(count_);

    auto percentile = [&sorted](double p) -> uint64_t {
        size_t idx = static_cast<size_t>(p * (sorted.size() - 1));
        return sorted[idx];
    };

    stats.p50 = percentile(0.50);
    stats.p95 = percentile(0.95);
    stats.p99 = percentile(0.99);

    return stats;
}


// MetricsCollector implementation
MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector collector;
    return collector;
}

void MetricsCollector::register_counter(Counter& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.push_back(&counter);
}

void MetricsCollector::register_gauge(Gauge& gauge) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_.push_back(&gauge);
}

void MetricsCollector::register_histogram(Histogram& histogram) {
    std::lock_guard<std::mutex> lock(mutex_);
    histograms_.push_back(&histogram);
}

void MetricsCollector::unregister(const Metric& metric) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto drop = [&metric](auto& vec) {
        vec.erase(std::remove_if(vec.begin(), vec.end(),
                                 [&metric](const Metric* m) { return m == &metric; }),
                  vec.end());
    };
    drop(counters_);
    drop(gauges_);
    drop(histograms_);
}

void MetricsCollector::export_metrics(ExportFunc func) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto* counter : counters_) {
        func(counter->name(), MetricType::Counter, std::to_string(counter->value()));
    }

    for (const auto* gauge : gauges_) {
        func(gauge->name(), MetricType::Gauge, std::to_string(gauge->value()));
    }

    for (const auto* histogram : histograms_) {
        auto stats = histogram->get_stats();
        std::ostringstream oss;
        oss << "count=" << stats.count
            << ",sum=" << stats.sum
            << ",mean=" << stats.mean
            << ",p50=" << stats.p50
            << ",p95=" << stats.p95
            << ",p99=" << stats.p99;
        func(histogram->name(), MetricType::Histogram, oss.str());
    }
}

// DualWriteMetrics
#define DW_METRIC_NAME(service, m) ("dualwrite." + (service) + "." m)

DualWriteMetrics::DualWriteMetrics(const std::string& service, bool exported)
    : ops_total(DW_METRIC_NAME(service, "ops_total")),
      ops_success(DW_METRIC_NAME(service, "ops_success")),
      ops_partial(DW_METRIC_NAME(service, "ops_partial_success")),
      ops_failed(DW_METRIC_NAME(service, "ops_failed")),
      primary_failures(DW_METRIC_NAME(service, "primary_failures")),
      secondary_failures(DW_METRIC_NAME(service, "secondary_failures")),
      primary_latency_us(DW_METRIC_NAME(service, "primary_latency_us")),
      secondary_latency_us(DW_METRIC_NAME(service, "secondary_latency_us")),
      retries_enqueued(DW_METRIC_NAME(service, "retries_enqueued")),
      retry_attempts(DW_METRIC_NAME(service, "retry_attempts")),
      retry_successes(DW_METRIC_NAME(service, "retry_successes")),
      retries_abandoned(DW_METRIC_NAME(service, "retries_abandoned")),
      retries_cancelled(DW_METRIC_NAME(service, "retries_cancelled")),
      retry_queue_depth(DW_METRIC_NAME(service, "retry_queue_depth")),
      oldest_pending_retry_age_ms(DW_METRIC_NAME(service, "oldest_pending_retry_age_ms")),
      validation_passes(DW_METRIC_NAME(service, "validation_passes")),
      validation_checked(DW_METRIC_NAME(service, "validation_checked")),
      validation_mismatches(DW_METRIC_NAME(service, "validation_mismatches")),
      last_validation_mismatches(DW_METRIC_NAME(service, "last_validation_mismatches")),
      last_validation_unix_ms(DW_METRIC_NAME(service, "last_validation_unix_ms")),
      validation_pass_ms(DW_METRIC_NAME(service, "validation_pass_ms")),
      repairs_attempted(DW_METRIC_NAME(service, "repairs_attempted")),
      repairs_succeeded(DW_METRIC_NAME(service, "repairs_succeeded")),
      exported_(exported) {
    oldest_pending_retry_age_ms.set(-1);
    if (!exported_) return;
    auto& collector = MetricsCollector::instance();
    for (auto* c : counters()) collector.register_counter(*c);
    for (auto* g : gauges()) collector.register_gauge(*g);
    for (auto* h : histograms()) collector.register_histogram(*h);
}

#undef DW_METRIC_NAME

DualWriteMetrics::~DualWriteMetrics() {
    if (!exported_) return;
    auto& collector = MetricsCollector::instance();
    for (auto* c : counters()) collector.unregister(*c);
    for (auto* g : gauges()) collector.unregister(*g);
    for (auto* h : histograms()) collector.unregister(*h);
}

std::vector<Counter*> DualWriteMetrics::counters() {
    return { &ops_total, &ops_success, &ops_partial, &ops_failed,
             &primary_failures, &secondary_failures,
             &retries_enqueued, &retry_attempts, &retry_successes,
             &retries_abandoned, &retries_cancelled,
             &validation_passes, &validation_checked, &validation_mismatches,
             &repairs_attempted, &repairs_succeeded };
}

std::vector<Gauge*> DualWriteMetrics::gauges() {
    return { &retry_queue_depth, &oldest_pending_retry_age_ms,
             &last_validation_mismatches, &last_validation_unix_ms };
}

std::vector<Histogram*> DualWriteMetrics::histograms() {
    return { &primary_latency_us, &secondary_latency_us, &validation_pass_ms };
}

} // namespace dualwrite
