#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace loadwatch::metrics {

// ============================================================================
// Core metric types
// ============================================================================

enum class MetricType : int {
    COUNTER = 0,
    GAUGE = 1,
    HISTOGRAM = 2
};

[[nodiscard]] std::string to_string(MetricType type);

/// Label values of one series, in the family's label-name order
using LabelValues = std::vector<std::string>;

/**
 * @brief Fixed, strictly increasing histogram upper bounds
 *
 * An observation v belongs to the first bucket whose bound is >= v; in the
 * cumulative exposition it therefore counts toward that bucket and every
 * larger one. Values above the last bound land in the implicit +Inf bucket.
 */
class HistogramBuckets {
public:
    /**
     * @throws std::invalid_argument if bounds is empty, contains a NaN or
     *         infinity, or is not strictly increasing
     */
    explicit HistogramBuckets(std::vector<double> bounds);

    /// 50, 100, 200, 400, 800, 1600, 3200 (milliseconds)
    [[nodiscard]] static HistogramBuckets default_duration_ms();

    /**
     * @brief Index of the bucket that receives the observation
     * @return Index into bounds(), or bounds().size() for the +Inf bucket
     */
    [[nodiscard]] std::size_t bucket_index(double value) const noexcept;

    [[nodiscard]] const std::vector<double>& bounds() const noexcept { return bounds_; }
    [[nodiscard]] std::size_t size() const noexcept { return bounds_.size(); }

private:
    std::vector<double> bounds_;
};

// ============================================================================
// Exposition helpers
// ============================================================================

/// Escapes backslash, double quote and newline for a label value
[[nodiscard]] std::string escape_label_value(std::string_view value);

/// Escapes backslash and newline for HELP text
[[nodiscard]] std::string escape_help(std::string_view help);

/// Shortest round-trip decimal form; "+Inf", "-Inf" and "NaN" for specials
[[nodiscard]] std::string format_value(double value);

/// True for [a-zA-Z_:][a-zA-Z0-9_:]*
[[nodiscard]] bool is_valid_metric_name(std::string_view name);

/// True for [a-zA-Z_][a-zA-Z0-9_]* not starting with "__"
[[nodiscard]] bool is_valid_label_name(std::string_view name);

} // namespace loadwatch::metrics
