#pragma once

#include "loadwatch/metrics/metric_types.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <vector>

namespace loadwatch::metrics {

// ============================================================================
// Metric interface
// ============================================================================

/**
 * @brief A named metric family that can render itself in text exposition format
 */
class IMetric {
public:
    IMetric(std::string name, std::string help);
    virtual ~IMetric() = default;

    IMetric(const IMetric&) = delete;
    IMetric& operator=(const IMetric&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& help() const noexcept { return help_; }
    [[nodiscard]] virtual MetricType type() const noexcept = 0;

    /**
     * @brief Write HELP, TYPE and sample lines
     */
    virtual void expose(std::ostream& os) const = 0;

protected:
    void write_header(std::ostream& os) const;

private:
    std::string name_;
    std::string help_;
};

// ============================================================================
// Counter
// ============================================================================

class Counter final : public IMetric {
public:
    using IMetric::IMetric;

    /// Negative or NaN deltas are ignored
    void inc(double delta = 1.0) noexcept;
    [[nodiscard]] double value() const noexcept { return value_.load(std::memory_order_relaxed); }

    [[nodiscard]] MetricType type() const noexcept override { return MetricType::COUNTER; }
    void expose(std::ostream& os) const override;

private:
    std::atomic<double> value_{0.0};
};

// ============================================================================
// Gauge
// ============================================================================

/**
 * @brief Settable gauge, optionally recomputed at exposition time
 *
 * When a collect callback is installed, value() and expose() report the
 * callback's result instead of the stored value.
 */
class Gauge final : public IMetric {
public:
    using CollectFn = std::function<double()>;

    using IMetric::IMetric;

    void set(double value) noexcept { value_.store(value, std::memory_order_relaxed); }
    void inc(double delta = 1.0) noexcept { value_.fetch_add(delta, std::memory_order_relaxed); }
    void dec(double delta = 1.0) noexcept { value_.fetch_sub(delta, std::memory_order_relaxed); }

    void set_collect(CollectFn collect);

    [[nodiscard]] double value() const;

    [[nodiscard]] MetricType type() const noexcept override { return MetricType::GAUGE; }
    void expose(std::ostream& os) const override;

private:
    std::atomic<double> value_{0.0};
    CollectFn collect_;
    mutable std::mutex collect_mutex_;
};

// ============================================================================
// Histogram
// ============================================================================

/**
 * @brief Labelled histogram with fixed bucket bounds
 *
 * Each series keeps one atomic counter per bucket (non-cumulative) plus an
 * atomic sum. The series map is guarded by a shared mutex; the exclusive
 * section is limited to inserting a previously unseen label combination.
 */
class HistogramFamily final : public IMetric {
public:
    struct SeriesSnapshot {
        LabelValues labels;
        std::vector<std::uint64_t> cumulative_counts;  ///< One per bound, then +Inf
        double sum = 0.0;
        std::uint64_t count = 0;
    };

    /**
     * @throws std::invalid_argument for invalid or reserved label names
     */
    HistogramFamily(std::string name, std::string help,
                    std::vector<std::string> label_names, HistogramBuckets buckets);

    /**
     * @brief Record one observation; NaN values are ignored
     * @throws std::invalid_argument if the label count does not match
     */
    void observe(const LabelValues& labels, double value);

    [[nodiscard]] std::optional<SeriesSnapshot> series(const LabelValues& labels) const;
    [[nodiscard]] std::vector<SeriesSnapshot> snapshot() const;
    [[nodiscard]] std::size_t series_count() const;

    [[nodiscard]] const std::vector<std::string>& label_names() const noexcept { return label_names_; }
    [[nodiscard]] const HistogramBuckets& buckets() const noexcept { return buckets_; }

    [[nodiscard]] MetricType type() const noexcept override { return MetricType::HISTOGRAM; }
    void expose(std::ostream& os) const override;

private:
    struct Series {
        explicit Series(std::size_t bucket_count);

        std::vector<std::atomic<std::uint64_t>> counts;
        std::atomic<double> sum{0.0};
    };

    std::vector<std::string> label_names_;
    HistogramBuckets buckets_;

    std::map<LabelValues, std::unique_ptr<Series>> series_;
    mutable std::shared_mutex mutex_;

    Series& find_or_create(const LabelValues& labels);
    SeriesSnapshot read(const LabelValues& labels, const Series& series) const;
};

// ============================================================================
// Registry
// ============================================================================

/**
 * @brief Owns metric families and renders them for a scraper
 *
 * Constructed explicitly by the application (or per test case); there is no
 * process-wide instance. Registration happens at startup; exposition may run
 * concurrently with metric updates.
 */
class MetricsRegistry {
public:
    MetricsRegistry() = default;

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /**
     * @throws std::invalid_argument on an invalid or duplicate name
     */
    Counter& add_counter(const std::string& name, const std::string& help);
    Gauge& add_gauge(const std::string& name, const std::string& help);
    HistogramFamily& add_histogram(const std::string& name, const std::string& help,
                                   std::vector<std::string> label_names,
                                   HistogramBuckets buckets);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Render every family in registration order
     *
     * A family whose rendering throws (for example a failing gauge collect
     * callback) is omitted; the others are still emitted.
     */
    [[nodiscard]] std::string expose() const;

    [[nodiscard]] static const char* content_type() noexcept;

private:
    std::vector<std::unique_ptr<IMetric>> metrics_;
    mutable std::mutex mutex_;

    template<typename T>
    T& add(std::unique_ptr<T> metric);
};

} // namespace loadwatch::metrics
