#pragma once

#include "loadwatch/analysis/sample_record.h"

#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace loadwatch::analysis {

// ============================================================================
// Verdict and thresholds
// ============================================================================

enum class Verdict : int {
    PASS = 0,
    UNSTABLE = 1,
    FAIL = 2
};

[[nodiscard]] const char* to_string(Verdict verdict) noexcept;

/**
 * @brief Process exit status for CI gating: PASS 0, FAIL 1, UNSTABLE 2
 */
[[nodiscard]] int exit_code(Verdict verdict) noexcept;

/**
 * @brief Tier boundaries; a tier requires both of its conditions
 *
 * The same values drive classification and the per-metric colouring of the
 * rendered report.
 */
struct Thresholds {
    double pass_min_success_rate_pct = 95.0;
    double pass_max_avg_response_ms = 1000.0;
    double unstable_min_success_rate_pct = 90.0;
    double unstable_max_avg_response_ms = 2000.0;

    bool operator==(const Thresholds&) const = default;
};

/**
 * @brief PASS if both PASS conditions hold, else UNSTABLE if both UNSTABLE
 *        conditions hold, else FAIL
 */
[[nodiscard]] Verdict classify(double success_rate_pct, double avg_response_ms,
                               const Thresholds& thresholds = {}) noexcept;

// ============================================================================
// Report
// ============================================================================

/**
 * @brief Summary of one load-test run; built once by analyze()
 */
struct PerformanceReport {
    std::size_t total_count = 0;
    std::size_t success_count = 0;
    std::size_t error_count = 0;
    std::size_t malformed_count = 0;

    double success_rate_pct = 0.0;
    double error_rate_pct = 0.0;

    double avg_response_ms = 0.0;
    double min_response_ms = 0.0;
    double max_response_ms = 0.0;

    double duration_sec = 0.0;
    double throughput_rps = 0.0;
    /// duration_sec was zero or clamped from a negative span, so throughput is reported as 0
    bool throughput_degenerate = false;

    Verdict verdict = Verdict::FAIL;
    Thresholds thresholds;

    bool operator==(const PerformanceReport&) const = default;
};

enum class AnalysisError : int {
    EMPTY_INPUT = 0   ///< No valid records; no statistic is defined
};

[[nodiscard]] const char* to_string(AnalysisError error) noexcept;

// ============================================================================
// Analysis
// ============================================================================

/**
 * @brief Summarise a run and classify it
 *
 * records must be in the harness' original order: the run duration is the
 * timestamp of the last record minus that of the first, clamped at zero.
 * malformed_count is carried into the report but does not enter any rate.
 */
[[nodiscard]] std::expected<PerformanceReport, AnalysisError>
analyze(std::span<const SampleRecord> records, std::size_t malformed_count = 0,
        const Thresholds& thresholds = {});

[[nodiscard]] std::expected<PerformanceReport, AnalysisError>
analyze(const SampleBatch& batch, const Thresholds& thresholds = {});

} // namespace loadwatch::analysis
