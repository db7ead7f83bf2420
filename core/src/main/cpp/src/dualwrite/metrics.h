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
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace dualwrite {

// Metric types
enum class MetricType {
    Counter,
    Gauge,
    Histogram
};

// Base metric interface
class Metric {
public:
    virtual ~Metric() = default;
    virtual MetricType type() const = 0;
    virtual std::string name() const = 0;
    virtual void reset() = 0;
};

// Counter - monotonically increasing value
class Counter : public Metric {
public:
    explicit Counter(const std::string& name) : name_(name), value_(0) {}

    MetricType type() const override { return MetricType::Counter; }
    std::string name() const override { return name_; }
    void reset() override { value_.store(0); }

    void increment(uint64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    uint64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<uint64_t> value_;
};

// Gauge - value that can go up or down
class Gauge : public Metric {
public:
    explicit Gauge(const std::string& name) : name_(name), value_(0) {}

    MetricType type() const override { return MetricType::Gauge; }
    std::string name() const override { return name_; }
    void reset() override { value_.store(0); }

    void set(int64_t value) {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(int64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(int64_t delta = 1) {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    int64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

// Histogram over the most recent `window` samples. count and sum cover
// every sample ever recorded; min/max/percentiles cover the window.
class Histogram : public Metric {
public:
    static constexpr size_t kDefaultWindow = 4096;

    explicit Histogram(const std::string& name, size_t window = kDefaultWindow)
        : name_(name), window_(window ? window : 1) {}

    MetricType type() const override { return MetricType::Histogram; }
    std::string name() const override { return name_; }
    void reset() override;

    void record(uint64_t value);

    struct Stats {
        uint64_t count;
        uint64_t sum;
        uint64_t min;
        uint64_t max;
        double mean;
        uint64_t p50;
        uint64_t p95;
        uint64_t p99;
    };

    Stats get_stats() const;

private:
    std::string name_;
    size_t window_;
    mutable std::mutex mutex_;
    std::vector<uint64_t> values_;
    size_t next_ = 0;
    uint64_t count_ = 0;
    uint64_t sum_ = 0;
};

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    uint64_t elapsed_ns() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now - start_).count();
    }

    uint64_t elapsed_us() const {
        return elapsed_ns() / 1000;
    }

    uint64_t elapsed_ms() const {
        return elapsed_ns() / 1000000;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Records elapsed microseconds into a histogram on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram)
        : histogram_(histogram), timer_() {}

    ~ScopedTimer() {
        histogram_.record(timer_.elapsed_us());
    }

private:
    Histogram& histogram_;
    Timer timer_;
};

// Process-wide registry used for export. Metrics must be unregistered
// before they are destroyed.
class MetricsCollector {
public:
    static MetricsCollector& instance();

    void register_counter(Counter& counter);
    void register_gauge(Gauge& gauge);
    void register_histogram(Histogram& histogram);
    void unregister(const Metric& metric);

    using ExportFunc = std::function<void(const std::string& name,
                                          MetricType type,
                                          const std::string& value)>;
    void export_metrics(ExportFunc func) const;

private:
    MetricsCollector() = default;

    mutable std::mutex mutex_;
    std::vector<Counter*> counters_;
    std::vector<Gauge*> gauges_;
    std::vector<Histogram*> histograms_;
};

/**
 * Metric set for one engine, named "dualwrite.<service>.<metric>".
 * Registered with MetricsCollector when `exported` is true.
 */
struct DualWriteMetrics {
    DualWriteMetrics(const std::string& service, bool exported);
    ~DualWriteMetrics();

    DualWriteMetrics(const DualWriteMetrics&) = delete;
    DualWriteMetrics& operator=(const DualWriteMetrics&) = delete;

    // coordinator
    Counter ops_total;
    Counter ops_success;
    Counter ops_partial;
    Counter ops_failed;
    Counter primary_failures;
    Counter secondary_failures;
    Histogram primary_latency_us;
    Histogram secondary_latency_us;

    // retry queue
    Counter retries_enqueued;
    Counter retry_attempts;
    Counter retry_successes;
    Counter retries_abandoned;
    Counter retries_cancelled;
    Gauge retry_queue_depth;
    Gauge oldest_pending_retry_age_ms;   // -1 when the queue is empty

    // validator
    Counter validation_passes;
    Counter validation_checked;
    Counter validation_mismatches;
    Gauge last_validation_mismatches;
    Gauge last_validation_unix_ms;       // 0 before the first pass
    Histogram validation_pass_ms;
    Counter repairs_attempted;
    Counter repairs_succeeded;

private:
    std::vector<Counter*> counters();
    std::vector<Gauge*> gauges();
    std::vector<Histogram*> histograms();

    bool exported_;
};

} // namespace dualwrite
