#include "loadwatch/metrics/registry.h"
#include "loadwatch/utils/logger.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace loadwatch::metrics {

namespace {

void write_labels(std::ostream& os,
                  const std::vector<std::string>& names,
                  const LabelValues& values,
                  const std::string* le = nullptr) {
    if (names.empty() && le == nullptr) {
        return;
    }
    os << '{';
    bool first = true;
    for (std::size_t i = 0; i < names.size() && i < values.size(); ++i) {
        if (!first) os << ',';
        os << names[i] << "=\"" << escape_label_value(values[i]) << '"';
        first = false;
    }
    if (le != nullptr) {
        if (!first) os << ',';
        os << "le=\"" << *le << '"';
    }
    os << '}';
}

} // namespace

// ============================================================================
// IMetric
// ============================================================================

IMetric::IMetric(std::string name, std::string help)
    : name_(std::move(name))
    , help_(std::move(help)) {
    if (!is_valid_metric_name(name_)) {
        throw std::invalid_argument("invalid metric name: '" + name_ + "'");
    }
}

void IMetric::write_header(std::ostream& os) const {
    os << "# HELP " << name_ << ' ' << escape_help(help_) << '\n';
    os << "# TYPE " << name_ << ' ' << to_string(type()) << '\n';
}

// ============================================================================
// Counter
// ============================================================================

void Counter::inc(double delta) noexcept {
    if (std::isnan(delta) || delta < 0.0) {
        return;
    }
    value_.fetch_add(delta, std::memory_order_relaxed);
}

void Counter::expose(std::ostream& os) const {
    write_header(os);
    os << name() << ' ' << format_value(value()) << '\n';
}

// ============================================================================
// Gauge
// ============================================================================

void Gauge::set_collect(CollectFn collect) {
    std::lock_guard<std::mutex> lock(collect_mutex_);
    collect_ = std::move(collect);
}

double Gauge::value() const {
    CollectFn collect;
    {
        std::lock_guard<std::mutex> lock(collect_mutex_);
        collect = collect_;
    }
    if (collect) {
        return collect();
    }
    return value_.load(std::memory_order_relaxed);
}

void Gauge::expose(std::ostream& os) const {
    // Evaluate first so a failing callback leaves no partial family behind
    double current = value();
    write_header(os);
    os << name() << ' ' << format_value(current) << '\n';
}

// ============================================================================
// HistogramFamily
// ============================================================================

HistogramFamily::Series::Series(std::size_t bucket_count)
    : counts(bucket_count) {
}

HistogramFamily::HistogramFamily(std::string name, std::string help,
                                 std::vector<std::string> label_names,
                                 HistogramBuckets buckets)
    : IMetric(std::move(name), std::move(help))
    , label_names_(std::move(label_names))
    , buckets_(std::move(buckets)) {
    for (const auto& label : label_names_) {
        if (!is_valid_label_name(label)) {
            throw std::invalid_argument("invalid label name: '" + label + "'");
        }
        if (label == "le") {
            throw std::invalid_argument("label name 'le' is reserved for histogram buckets");
        }
    }
}

void HistogramFamily::observe(const LabelValues& labels, double value) {
    if (labels.size() != label_names_.size()) {
        throw std::invalid_argument("histogram " + this->name() + " expects " +
                                    std::to_string(label_names_.size()) + " label values, got " +
                                    std::to_string(labels.size()));
    }
    if (std::isnan(value)) {
        return;
    }

    Series& series = find_or_create(labels);
    series.counts[buckets_.bucket_index(value)].fetch_add(1, std::memory_order_relaxed);
    series.sum.fetch_add(value, std::memory_order_relaxed);
}

HistogramFamily::Series& HistogramFamily::find_or_create(const LabelValues& labels) {
    {
        std::shared_lock lock(mutex_);
        auto it = series_.find(labels);
        if (it != series_.end()) {
            return *it->second;
        }
    }

    // Allocate before taking the exclusive lock
    auto fresh = std::make_unique<Series>(buckets_.size() + 1);

    std::unique_lock lock(mutex_);
    auto [it, inserted] = series_.try_emplace(labels, std::move(fresh));
    return *it->second;
}

HistogramFamily::SeriesSnapshot HistogramFamily::read(const LabelValues& labels,
                                                      const Series& series) const {
    SeriesSnapshot snap;
    snap.labels = labels;
    snap.cumulative_counts.reserve(series.counts.size());

    std::uint64_t running = 0;
    for (const auto& bucket : series.counts) {
        running += bucket.load(std::memory_order_relaxed);
        snap.cumulative_counts.push_back(running);
    }
    snap.count = running;
    snap.sum = series.sum.load(std::memory_order_relaxed);
    return snap;
}

std::optional<HistogramFamily::SeriesSnapshot> HistogramFamily::series(const LabelValues& labels) const {
    std::shared_lock lock(mutex_);
    auto it = series_.find(labels);
    if (it == series_.end()) {
        return std::nullopt;
    }
    return read(it->first, *it->second);
}

std::vector<HistogramFamily::SeriesSnapshot> HistogramFamily::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<SeriesSnapshot> out;
    out.reserve(series_.size());
    for (const auto& [labels, series] : series_) {
        out.push_back(read(labels, *series));
    }
    return out;
}

std::size_t HistogramFamily::series_count() const {
    std::shared_lock lock(mutex_);
    return series_.size();
}

void HistogramFamily::expose(std::ostream& os) const {
    auto all = snapshot();

    write_header(os);
    const auto& bounds = buckets_.bounds();
    const std::string inf = "+Inf";

    for (const auto& snap : all) {
        for (std::size_t i = 0; i < bounds.size(); ++i) {
            std::string le = format_value(bounds[i]);
            os << name() << "_bucket";
            write_labels(os, label_names_, snap.labels, &le);
            os << ' ' << snap.cumulative_counts[i] << '\n';
        }
        os << name() << "_bucket";
        write_labels(os, label_names_, snap.labels, &inf);
        os << ' ' << snap.count << '\n';

        os << name() << "_sum";
        write_labels(os, label_names_, snap.labels);
        os << ' ' << format_value(snap.sum) << '\n';

        os << name() << "_count";
        write_labels(os, label_names_, snap.labels);
        os << ' ' << snap.count << '\n';
    }
}

// ============================================================================
// MetricsRegistry
// ============================================================================

template<typename T>
T& MetricsRegistry::add(std::unique_ptr<T> metric) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : metrics_) {
        if (existing->name() == metric->name()) {
            throw std::invalid_argument("metric already registered: " + metric->name());
        }
    }
    T& ref = *metric;
    metrics_.push_back(std::move(metric));
    return ref;
}

Counter& MetricsRegistry::add_counter(const std::string& name, const std::string& help) {
    return add(std::make_unique<Counter>(name, help));
}

Gauge& MetricsRegistry::add_gauge(const std::string& name, const std::string& help) {
    return add(std::make_unique<Gauge>(name, help));
}

HistogramFamily& MetricsRegistry::add_histogram(const std::string& name, const std::string& help,
                                                std::vector<std::string> label_names,
                                                HistogramBuckets buckets) {
    return add(std::make_unique<HistogramFamily>(name, help, std::move(label_names),
                                                 std::move(buckets)));
}

bool MetricsRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& metric : metrics_) {
        if (metric->name() == name) return true;
    }
    return false;
}

std::size_t MetricsRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.size();
}

std::string MetricsRegistry::expose() const {
    std::vector<const IMetric*> families;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        families.reserve(metrics_.size());
        for (const auto& metric : metrics_) {
            families.push_back(metric.get());
        }
    }

    std::ostringstream out;
    for (const IMetric* family : families) {
        std::ostringstream block;
        try {
            family->expose(block);
            out << block.str();
        } catch (const std::exception& e) {
            LoggerFactory::get_logger("metrics").log(
                LogLevel::WARN, std::string("skipping metric during exposition: ") + e.what(),
                {{"metric", family->name()}});
        }
    }
    return out.str();
}

const char* MetricsRegistry::content_type() noexcept {
    return "text/plain; version=0.0.4; charset=utf-8";
}

} // namespace loadwatch::metrics
