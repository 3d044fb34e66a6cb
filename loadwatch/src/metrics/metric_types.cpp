#include "loadwatch/metrics/metric_types.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace loadwatch::metrics {

std::string to_string(MetricType type) {
    switch (type) {
        case MetricType::COUNTER:   return "counter";
        case MetricType::GAUGE:     return "gauge";
        case MetricType::HISTOGRAM: return "histogram";
    }
    return "untyped";
}

// ============================================================================
// HistogramBuckets
// ============================================================================

HistogramBuckets::HistogramBuckets(std::vector<double> bounds)
    : bounds_(std::move(bounds)) {
    if (bounds_.empty()) {
        throw std::invalid_argument("histogram requires at least one bucket bound");
    }
    for (std::size_t i = 0; i < bounds_.size(); ++i) {
        if (!std::isfinite(bounds_[i])) {
            throw std::invalid_argument("histogram bucket bounds must be finite");
        }
        if (i > 0 && bounds_[i] <= bounds_[i - 1]) {
            throw std::invalid_argument("histogram bucket bounds must be strictly increasing");
        }
    }
}

HistogramBuckets HistogramBuckets::default_duration_ms() {
    return HistogramBuckets(std::vector<double>{50, 100, 200, 400, 800, 1600, 3200});
}

std::size_t HistogramBuckets::bucket_index(double value) const noexcept {
    // First bound >= value; bounds_.end() maps to the +Inf bucket
    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value);
    return static_cast<std::size_t>(it - bounds_.begin());
}

// ============================================================================
// Exposition helpers
// ============================================================================

std::string escape_label_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string escape_help(std::string_view help) {
    std::string out;
    out.reserve(help.size());
    for (char c : help) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string format_value(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return "NaN";
    }
    return std::string(buf, ptr);
}

namespace {

bool is_name_start(char c, bool allow_colon) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           (allow_colon && c == ':');
}

bool is_name_char(char c, bool allow_colon) {
    return is_name_start(c, allow_colon) || (c >= '0' && c <= '9');
}

} // namespace

bool is_valid_metric_name(std::string_view name) {
    if (name.empty() || !is_name_start(name.front(), true)) return false;
    return std::all_of(name.begin(), name.end(), [](char c) { return is_name_char(c, true); });
}

bool is_valid_label_name(std::string_view name) {
    if (name.empty() || !is_name_start(name.front(), false)) return false;
    if (name.starts_with("__")) return false;
    return std::all_of(name.begin(), name.end(), [](char c) { return is_name_char(c, false); });
}

} // namespace loadwatch::metrics
