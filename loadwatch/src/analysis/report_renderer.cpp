#include "loadwatch/analysis/report_renderer.h"

#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace loadwatch::analysis {

const char* to_string(MetricBand band) noexcept {
    switch (band) {
        case MetricBand::PASS: return "pass";
        case MetricBand::WARN: return "warn";
        case MetricBand::FAIL: return "fail";
    }
    return "fail";
}

MetricBand band_for_success_rate(double success_rate_pct, const Thresholds& thresholds) noexcept {
    if (success_rate_pct >= thresholds.pass_min_success_rate_pct) return MetricBand::PASS;
    if (success_rate_pct >= thresholds.unstable_min_success_rate_pct) return MetricBand::WARN;
    return MetricBand::FAIL;
}

MetricBand band_for_avg_response(double avg_response_ms, const Thresholds& thresholds) noexcept {
    if (avg_response_ms <= thresholds.pass_max_avg_response_ms) return MetricBand::PASS;
    if (avg_response_ms <= thresholds.unstable_max_avg_response_ms) return MetricBand::WARN;
    return MetricBand::FAIL;
}

namespace {

std::string html_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string fixed(double value, int precision = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string throughput_text(const PerformanceReport& report) {
    if (report.throughput_degenerate) {
        return "0.00 req/s (undefined: run duration is zero or timestamps are out of order)";
    }
    return fixed(report.throughput_rps) + " req/s";
}

const char* verdict_colour(Verdict verdict) {
    switch (verdict) {
        case Verdict::PASS:     return "#1a7f37";
        case Verdict::UNSTABLE: return "#9a6700";
        case Verdict::FAIL:     return "#cf222e";
    }
    return "#cf222e";
}

} // namespace

// ============================================================================
// Text
// ============================================================================

std::string render_text(const PerformanceReport& report, const RenderOptions& options) {
    const auto& t = report.thresholds;
    const auto rate_band = band_for_success_rate(report.success_rate_pct, t);
    const auto avg_band = band_for_avg_response(report.avg_response_ms, t);

    std::ostringstream os;
    os << "=== " << options.title << " ===\n";
    if (!options.source.empty()) {
        os << "Source: " << options.source << "\n";
    }
    os << "\nRequests\n";
    os << "  Total:        " << report.total_count << "\n";
    os << "  Successful:   " << report.success_count << "\n";
    os << "  Failed:       " << report.error_count << "\n";
    os << "  Malformed:    " << report.malformed_count << " (excluded from all rates)\n";
    os << "  Success rate: " << fixed(report.success_rate_pct) << "% [" << to_string(rate_band) << "]\n";
    os << "  Error rate:   " << fixed(report.error_rate_pct) << "%\n";

    os << "\nResponse time\n";
    os << "  Average:      " << fixed(report.avg_response_ms) << " ms [" << to_string(avg_band) << "]\n";
    os << "  Min:          " << fixed(report.min_response_ms) << " ms\n";
    os << "  Max:          " << fixed(report.max_response_ms) << " ms\n";

    os << "\nThroughput\n";
    os << "  Duration:     " << fixed(report.duration_sec, 3) << " s\n";
    os << "  Throughput:   " << throughput_text(report) << "\n";

    os << "\nThresholds\n";
    os << "  PASS:     success rate >= " << fixed(t.pass_min_success_rate_pct)
       << "% and avg response <= " << fixed(t.pass_max_avg_response_ms) << " ms\n";
    os << "  UNSTABLE: success rate >= " << fixed(t.unstable_min_success_rate_pct)
       << "% and avg response <= " << fixed(t.unstable_max_avg_response_ms) << " ms\n";
    os << "  FAIL:     otherwise\n";

    os << "\nVerdict: " << to_string(report.verdict) << "\n";
    if (report.malformed_count > 0) {
        os << "Note: " << report.malformed_count
           << " malformed sample rows were skipped; check the load-test harness output.\n";
    }
    return os.str();
}

// ============================================================================
// HTML
// ============================================================================

std::string render_html(const PerformanceReport& report, const RenderOptions& options) {
    const auto& t = report.thresholds;
    const auto rate_band = band_for_success_rate(report.success_rate_pct, t);
    const auto avg_band = band_for_avg_response(report.avg_response_ms, t);

    std::ostringstream out;
    out << "<!doctype html><html><head><meta charset=\"utf-8\"><title>"
        << html_escape(options.title) << "</title>";
    out << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">";
    out << "<style>body{font-family:Arial,sans-serif;margin:24px;} "
           ".card{display:inline-block;margin:8px;padding:12px;border:1px solid #ddd;"
           "border-radius:8px;min-width:160px;} "
           ".pass{color:#1a7f37;} .warn{color:#9a6700;} .fail{color:#cf222e;} "
           ".verdict{font-size:1.6em;font-weight:bold;padding:12px;border-radius:8px;color:#fff;} "
           ".notice{background:#fff8c5;border:1px solid #d4a72c;padding:8px;border-radius:6px;} "
           "table{border-collapse:collapse;} td,th{border:1px solid #ddd;padding:6px;text-align:left;}"
           "</style>";
    out << "</head><body>";
    out << "<h1>" << html_escape(options.title) << "</h1>";
    if (!options.source.empty()) {
        out << "<p>Source: " << html_escape(options.source) << "</p>";
    }

    out << "<div class='verdict' style='background:" << verdict_colour(report.verdict) << "'>"
        << "Verdict: " << to_string(report.verdict) << "</div>";

    if (report.malformed_count > 0) {
        out << "<p class='notice'>" << report.malformed_count
            << " malformed sample rows were skipped and are not counted as successes or errors. "
               "Check the load-test harness output.</p>";
    }
    if (report.throughput_degenerate) {
        out << "<p class='notice'>Throughput is undefined: the run duration is zero or the "
               "sample timestamps are out of order. It is reported as 0.</p>";
    }

    out << "<h2>Requests</h2>";
    out << "<div class='card'>Total: " << report.total_count << "</div>";
    out << "<div class='card'>Successful: " << report.success_count << "</div>";
    out << "<div class='card " << (report.error_count ? "fail" : "") << "'>Failed: "
        << report.error_count << "</div>";
    out << "<div class='card " << (report.malformed_count ? "warn" : "") << "'>Malformed: "
        << report.malformed_count << "</div>";
    out << "<div class='card " << to_string(rate_band) << "'>Success rate: "
        << fixed(report.success_rate_pct) << " %</div>";
    out << "<div class='card'>Error rate: " << fixed(report.error_rate_pct) << " %</div>";

    out << "<h2>Response time</h2>";
    out << "<div class='card " << to_string(avg_band) << "'>Average: "
        << fixed(report.avg_response_ms) << " ms</div>";
    out << "<div class='card'>Min: " << fixed(report.min_response_ms) << " ms</div>";
    out << "<div class='card'>Max: " << fixed(report.max_response_ms) << " ms</div>";

    out << "<h2>Throughput</h2>";
    out << "<div class='card'>Duration: " << fixed(report.duration_sec, 3) << " s</div>";
    out << "<div class='card " << (report.throughput_degenerate ? "warn" : "") << "'>Throughput: "
        << html_escape(throughput_text(report)) << "</div>";

    out << "<h2>Threshold bands</h2><table>"
           "<tr><th>Tier</th><th>Success rate</th><th>Average response</th></tr>";
    out << "<tr class='pass'><td>PASS</td><td>&ge; " << fixed(t.pass_min_success_rate_pct)
        << " %</td><td>&le; " << fixed(t.pass_max_avg_response_ms) << " ms</td></tr>";
    out << "<tr class='warn'><td>UNSTABLE</td><td>&ge; " << fixed(t.unstable_min_success_rate_pct)
        << " %</td><td>&le; " << fixed(t.unstable_max_avg_response_ms) << " ms</td></tr>";
    out << "<tr class='fail'><td>FAIL</td><td colspan='2'>otherwise</td></tr>";
    out << "</table>";
    out << "<p>Both conditions of a tier must hold.</p>";

    out << "</body></html>\n";
    return out.str();
}

// ============================================================================
// JSON
// ============================================================================

std::string render_json(const PerformanceReport& report, const RenderOptions& options) {
    const auto& t = report.thresholds;

    nlohmann::json j;
    j["title"] = options.title;
    if (!options.source.empty()) {
        j["source"] = options.source;
    }
    j["verdict"] = to_string(report.verdict);
    j["requests"] = {
        {"total", report.total_count},
        {"success", report.success_count},
        {"error", report.error_count},
        {"malformed", report.malformed_count},
        {"success_rate_pct", report.success_rate_pct},
        {"error_rate_pct", report.error_rate_pct},
        {"success_rate_band", to_string(band_for_success_rate(report.success_rate_pct, t))},
    };
    j["response_time_ms"] = {
        {"avg", report.avg_response_ms},
        {"min", report.min_response_ms},
        {"max", report.max_response_ms},
        {"avg_band", to_string(band_for_avg_response(report.avg_response_ms, t))},
    };
    j["throughput"] = {
        {"duration_sec", report.duration_sec},
        {"rps", report.throughput_rps},
        {"degenerate", report.throughput_degenerate},
    };
    j["thresholds"] = {
        {"pass_min_success_rate_pct", t.pass_min_success_rate_pct},
        {"pass_max_avg_response_ms", t.pass_max_avg_response_ms},
        {"unstable_min_success_rate_pct", t.unstable_min_success_rate_pct},
        {"unstable_max_avg_response_ms", t.unstable_max_avg_response_ms},
    };
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace loadwatch::analysis
