#include "loadwatch/analysis/analyzer.h"

#include <algorithm>

namespace loadwatch::analysis {

const char* to_string(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::PASS:     return "PASS";
        case Verdict::UNSTABLE: return "UNSTABLE";
        case Verdict::FAIL:     return "FAIL";
    }
    return "FAIL";
}

int exit_code(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::PASS:     return 0;
        case Verdict::UNSTABLE: return 2;
        case Verdict::FAIL:     return 1;
    }
    return 1;
}

const char* to_string(AnalysisError error) noexcept {
    switch (error) {
        case AnalysisError::EMPTY_INPUT: return "no valid sample records to analyze";
    }
    return "unknown analysis error";
}

Verdict classify(double success_rate_pct, double avg_response_ms,
                 const Thresholds& thresholds) noexcept {
    if (success_rate_pct >= thresholds.pass_min_success_rate_pct &&
        avg_response_ms <= thresholds.pass_max_avg_response_ms) {
        return Verdict::PASS;
    }
    if (success_rate_pct >= thresholds.unstable_min_success_rate_pct &&
        avg_response_ms <= thresholds.unstable_max_avg_response_ms) {
        return Verdict::UNSTABLE;
    }
    return Verdict::FAIL;
}

std::expected<PerformanceReport, AnalysisError>
analyze(std::span<const SampleRecord> records, std::size_t malformed_count,
        const Thresholds& thresholds) {
    if (records.empty()) {
        return std::unexpected(AnalysisError::EMPTY_INPUT);
    }

    PerformanceReport report;
    report.total_count = records.size();
    report.malformed_count = malformed_count;
    report.thresholds = thresholds;

    double elapsed_sum = 0.0;
    report.min_response_ms = records.front().elapsed_ms;
    report.max_response_ms = records.front().elapsed_ms;

    for (const auto& record : records) {
        if (record.success) {
            ++report.success_count;
        }
        elapsed_sum += record.elapsed_ms;
        report.min_response_ms = std::min(report.min_response_ms, record.elapsed_ms);
        report.max_response_ms = std::max(report.max_response_ms, record.elapsed_ms);
    }

    const auto total = static_cast<double>(report.total_count);
    report.error_count = report.total_count - report.success_count;
    report.success_rate_pct = static_cast<double>(report.success_count) / total * 100.0;
    report.error_rate_pct = 100.0 - report.success_rate_pct;
    report.avg_response_ms = elapsed_sum / total;

    // Order as given, not min/max: an unordered source yields a degenerate span
    const auto first_ms = records.front().timestamp_ms;
    const auto last_ms = records.back().timestamp_ms;
    if (last_ms > first_ms) {
        // Computed in double: the int64 difference can overflow
        const double span_ms = static_cast<double>(last_ms) - static_cast<double>(first_ms);
        report.duration_sec = span_ms / 1000.0;
        report.throughput_rps = total / report.duration_sec;
    } else {
        report.duration_sec = 0.0;
        report.throughput_rps = 0.0;
        report.throughput_degenerate = true;
    }

    report.verdict = classify(report.success_rate_pct, report.avg_response_ms, thresholds);
    return report;
}

std::expected<PerformanceReport, AnalysisError>
analyze(const SampleBatch& batch, const Thresholds& thresholds) {
    return analyze(std::span<const SampleRecord>(batch.records), batch.malformed_count, thresholds);
}

} // namespace loadwatch::analysis
