#pragma once

#include "loadwatch/analysis/analyzer.h"

#include <string>

namespace loadwatch::analysis {

/**
 * @brief Per-metric colouring band
 */
enum class MetricBand : int {
    PASS = 0,
    WARN = 1,
    FAIL = 2
};

[[nodiscard]] const char* to_string(MetricBand band) noexcept;

/// PASS at or above the PASS rate, WARN at or above the UNSTABLE rate, else FAIL
[[nodiscard]] MetricBand band_for_success_rate(double success_rate_pct, const Thresholds& thresholds) noexcept;

/// PASS at or below the PASS latency, WARN at or below the UNSTABLE latency, else FAIL
[[nodiscard]] MetricBand band_for_avg_response(double avg_response_ms, const Thresholds& thresholds) noexcept;

struct RenderOptions {
    std::string title = "Load Test Performance Report";
    std::string source;   ///< Input file name shown in the header, optional
};

/**
 * @brief Plain-text summary for terminals and CI logs
 */
[[nodiscard]] std::string render_text(const PerformanceReport& report, const RenderOptions& options = {});

/**
 * @brief Self-contained HTML document; all text is escaped, no scripts
 */
[[nodiscard]] std::string render_html(const PerformanceReport& report, const RenderOptions& options = {});

/**
 * @brief Machine-readable report (pretty-printed JSON)
 */
[[nodiscard]] std::string render_json(const PerformanceReport& report, const RenderOptions& options = {});

} // namespace loadwatch::analysis
