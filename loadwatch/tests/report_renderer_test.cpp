#include <gtest/gtest.h>

#include "loadwatch/analysis/report_renderer.h"

#include <nlohmann/json.hpp>

#include <string>

using namespace loadwatch::analysis;

namespace {

class ReportRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        report_.total_count = 200;
        report_.success_count = 184;
        report_.error_count = 16;
        report_.success_rate_pct = 92.0;
        report_.error_rate_pct = 8.0;
        report_.avg_response_ms = 640.0;
        report_.min_response_ms = 12.0;
        report_.max_response_ms = 2900.0;
        report_.duration_sec = 20.0;
        report_.throughput_rps = 10.0;
        report_.verdict = Verdict::UNSTABLE;
    }

    PerformanceReport report_;
};

TEST(MetricBandTest, SuccessRateBands) {
    Thresholds t;
    EXPECT_EQ(band_for_success_rate(95.0, t), MetricBand::PASS);
    EXPECT_EQ(band_for_success_rate(94.0, t), MetricBand::WARN);
    EXPECT_EQ(band_for_success_rate(90.0, t), MetricBand::WARN);
    EXPECT_EQ(band_for_success_rate(89.0, t), MetricBand::FAIL);
}

TEST(MetricBandTest, AverageResponseBands) {
    Thresholds t;
    EXPECT_EQ(band_for_avg_response(1000.0, t), MetricBand::PASS);
    EXPECT_EQ(band_for_avg_response(1000.5, t), MetricBand::WARN);
    EXPECT_EQ(band_for_avg_response(2000.0, t), MetricBand::WARN);
    EXPECT_EQ(band_for_avg_response(2001.0, t), MetricBand::FAIL);
}

// ============================================================================
// Text
// ============================================================================

TEST_F(ReportRendererTest, TextContainsVerdictAndStatistics) {
    RenderOptions options;
    options.source = "results.jtl";

    const std::string text = render_text(report_, options);
    EXPECT_EQ(text.rfind("=== Load Test Performance Report ===", 0), 0u);
    EXPECT_NE(text.find("Source: results.jtl"), std::string::npos);
    EXPECT_NE(text.find("Success rate: 92.00% [warn]"), std::string::npos);
    EXPECT_NE(text.find("Average:      640.00 ms [pass]"), std::string::npos);
    EXPECT_NE(text.find("Throughput:   10.00 req/s"), std::string::npos);
    EXPECT_NE(text.find("Verdict: UNSTABLE"), std::string::npos);
    EXPECT_EQ(text.find("malformed sample rows were skipped"), std::string::npos);
}

TEST_F(ReportRendererTest, TextFlagsMalformedAndDegenerateThroughput) {
    report_.malformed_count = 3;
    report_.duration_sec = 0.0;
    report_.throughput_rps = 0.0;
    report_.throughput_degenerate = true;

    const std::string text = render_text(report_);
    EXPECT_NE(text.find("Malformed:    3"), std::string::npos);
    EXPECT_NE(text.find("3 malformed sample rows were skipped"), std::string::npos);
    EXPECT_NE(text.find("0.00 req/s (undefined"), std::string::npos);
}

// ============================================================================
// HTML
// ============================================================================

TEST_F(ReportRendererTest, HtmlIsSelfContainedAndEscaped) {
    RenderOptions options;
    options.title = "<script>alert('x')</script> & co";
    options.source = "\"run\".jtl";

    const std::string html = render_html(report_, options);
    EXPECT_EQ(html.rfind("<!doctype html>", 0), 0u);
    EXPECT_EQ(html.find("<script"), std::string::npos);
    EXPECT_NE(html.find("&lt;script&gt;alert(&#39;x&#39;)&lt;/script&gt; &amp; co"), std::string::npos);
    EXPECT_NE(html.find("&quot;run&quot;.jtl"), std::string::npos);
    EXPECT_NE(html.find("Verdict: UNSTABLE"), std::string::npos);
}

TEST_F(ReportRendererTest, HtmlColoursMetricsByBand) {
    const std::string html = render_html(report_);
    EXPECT_NE(html.find("<div class='card warn'>Success rate: 92.00 %</div>"), std::string::npos);
    EXPECT_NE(html.find("<div class='card pass'>Average: 640.00 ms</div>"), std::string::npos);
    EXPECT_NE(html.find("<td>&ge; 95.00 %</td><td>&le; 1000.00 ms</td>"), std::string::npos);
    EXPECT_NE(html.find("<td>&ge; 90.00 %</td><td>&le; 2000.00 ms</td>"), std::string::npos);
}

TEST_F(ReportRendererTest, HtmlNotices) {
    EXPECT_EQ(render_html(report_).find("class='notice'"), std::string::npos);

    report_.malformed_count = 7;
    report_.throughput_degenerate = true;
    const std::string html = render_html(report_);
    EXPECT_NE(html.find("7 malformed sample rows were skipped"), std::string::npos);
    EXPECT_NE(html.find("Throughput is undefined"), std::string::npos);
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(ReportRendererTest, JsonFields) {
    report_.malformed_count = 2;

    RenderOptions options;
    options.source = "results.jtl";
    auto j = nlohmann::json::parse(render_json(report_, options));

    EXPECT_EQ(j["title"], "Load Test Performance Report");
    EXPECT_EQ(j["source"], "results.jtl");
    EXPECT_EQ(j["verdict"], "UNSTABLE");
    EXPECT_EQ(j["requests"]["total"], 200);
    EXPECT_EQ(j["requests"]["malformed"], 2);
    EXPECT_EQ(j["requests"]["success_rate_band"], "warn");
    EXPECT_DOUBLE_EQ(j["response_time_ms"]["max"].get<double>(), 2900.0);
    EXPECT_EQ(j["response_time_ms"]["avg_band"], "pass");
    EXPECT_EQ(j["throughput"]["degenerate"], false);
    EXPECT_DOUBLE_EQ(j["thresholds"]["unstable_max_avg_response_ms"].get<double>(), 2000.0);
}

TEST_F(ReportRendererTest, JsonToleratesInvalidUtf8InTitleAndSource) {
    RenderOptions options;
    options.title = "Nightly \xff run";
    options.source = "r\xfe.jtl";

    std::string rendered;
    ASSERT_NO_THROW(rendered = render_json(report_, options));
    auto j = nlohmann::json::parse(rendered);
    EXPECT_EQ(j["title"], "Nightly \xEF\xBF\xBD run");
    EXPECT_EQ(j["source"], "r\xEF\xBF\xBD.jtl");
    EXPECT_EQ(j["verdict"], "UNSTABLE");
}

TEST_F(ReportRendererTest, JsonOmitsEmptySource) {
    auto j = nlohmann::json::parse(render_json(report_));
    EXPECT_FALSE(j.contains("source"));
}

} // namespace
