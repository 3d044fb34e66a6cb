#include <gtest/gtest.h>

#include "loadwatch/config/app_config.h"
#include "loadwatch/utils/logger.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace loadwatch;

namespace {

bool mentions(const std::vector<std::string>& problems, const std::string& key) {
    return std::any_of(problems.begin(), problems.end(),
                       [&](const std::string& p) { return p.find(key) != std::string::npos; });
}

TEST(AppConfigTest, EmptyDocumentYieldsDefaults) {
    auto config = AppConfig::from_toml_string("");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->server.bind_address, "0.0.0.0");
    EXPECT_EQ(config->server.port, 3000);
    EXPECT_EQ(config->server.read_timeout_ms, 5000);
    EXPECT_EQ(config->server.max_request_bytes, 65536u);
    EXPECT_EQ(config->logging.level, "info");
    EXPECT_EQ(config->logging.format, "text");
    EXPECT_TRUE(config->logging.file.empty());
    EXPECT_EQ(config->metrics.duration_buckets_ms,
              (std::vector<double>{50, 100, 200, 400, 800, 1600, 3200}));
    EXPECT_TRUE(config->metrics.collect_process_metrics);
    EXPECT_EQ(config->metrics.metrics_path, "/metrics");
    EXPECT_EQ(config->thresholds, analysis::Thresholds{});
    EXPECT_TRUE(config->validate().empty());
}

TEST(AppConfigTest, ReadsAllSections) {
    auto config = AppConfig::from_toml_string(R"(
[server]
bind_address = "127.0.0.1"
port = 8080
read_timeout_ms = 250
max_request_bytes = 1024

[logging]
level = "debug"
format = "json"
colors = false

[metrics]
duration_buckets_ms = [10, 20.5, 40]
collect_process_metrics = false
metrics_path = "/internal/metrics"

[thresholds]
pass_min_success_rate_pct = 99
pass_max_avg_response_ms = 250.0
unstable_min_success_rate_pct = 97.5
unstable_max_avg_response_ms = 500
)");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->server.bind_address, "127.0.0.1");
    EXPECT_EQ(config->server.port, 8080);
    EXPECT_EQ(config->server.read_timeout_ms, 250);
    EXPECT_EQ(config->server.max_request_bytes, 1024u);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_EQ(config->logging.format, "json");
    EXPECT_FALSE(config->logging.colors);
    EXPECT_EQ(config->metrics.duration_buckets_ms, (std::vector<double>{10, 20.5, 40}));
    EXPECT_FALSE(config->metrics.collect_process_metrics);
    EXPECT_EQ(config->metrics.metrics_path, "/internal/metrics");
    EXPECT_DOUBLE_EQ(config->thresholds.pass_min_success_rate_pct, 99.0);
    EXPECT_DOUBLE_EQ(config->thresholds.pass_max_avg_response_ms, 250.0);
    EXPECT_DOUBLE_EQ(config->thresholds.unstable_min_success_rate_pct, 97.5);
    EXPECT_DOUBLE_EQ(config->thresholds.unstable_max_avg_response_ms, 500.0);
    EXPECT_TRUE(config->validate().empty());
}

TEST(AppConfigTest, SyntaxErrorYieldsNullopt) {
    EXPECT_FALSE(AppConfig::from_toml_string("[server\nport = 1").has_value());
}

TEST(AppConfigTest, TypeMismatchYieldsNullopt) {
    EXPECT_FALSE(AppConfig::from_toml_string("[server]\nport = \"eighty\"").has_value());
    EXPECT_FALSE(AppConfig::from_toml_string("[metrics]\nduration_buckets_ms = [1, \"x\"]").has_value());
    EXPECT_FALSE(AppConfig::from_toml_string("server = 5").has_value());
}

TEST(AppConfigTest, MissingFileYieldsNullopt) {
    EXPECT_FALSE(AppConfig::from_toml_file("/nonexistent/loadwatch.toml").has_value());
}

TEST(AppConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "loadwatch_config_test.toml";
    {
        std::ofstream out(path);
        out << "[server]\nport = 4321\n";
    }
    auto config = AppConfig::from_toml_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server.port, 4321);
}

TEST(AppConfigTest, ValidateReportsEveryProblem) {
    AppConfig config;
    config.server.port = 70000;
    config.logging.format = "xml";
    config.metrics.duration_buckets_ms = {100, 50};
    config.thresholds.pass_min_success_rate_pct = 120;
    config.thresholds.unstable_max_avg_response_ms = -1;

    auto problems = config.validate();
    EXPECT_TRUE(mentions(problems, "server.port"));
    EXPECT_TRUE(mentions(problems, "logging.format"));
    EXPECT_TRUE(mentions(problems, "strictly increasing"));
    EXPECT_TRUE(mentions(problems, "pass_min_success_rate_pct must be within"));
    EXPECT_TRUE(mentions(problems, "unstable_max_avg_response_ms must not be negative"));
}

TEST(AppConfigTest, ValidateRejectsUnstableTierStricterThanPass) {
    AppConfig config;
    config.thresholds.unstable_min_success_rate_pct = 97;
    config.thresholds.unstable_max_avg_response_ms = 800;

    auto problems = config.validate();
    EXPECT_EQ(problems.size(), 2u);
}

TEST(AppConfigTest, ValidateRejectsEmptyBuckets) {
    AppConfig config;
    config.metrics.duration_buckets_ms.clear();
    EXPECT_TRUE(mentions(config.validate(), "must not be empty"));
}

TEST(AppConfigTest, EnvironmentOverridesPortAndLevel) {
    setenv("PORT", "9091", 1);
    setenv("LOADWATCH_LOG_LEVEL", "debug", 1);
    AppConfig config;
    config.apply_env();
    unsetenv("PORT");
    unsetenv("LOADWATCH_LOG_LEVEL");

    EXPECT_EQ(config.server.port, 9091);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(AppConfigTest, InvalidEnvironmentValuesIgnored) {
    setenv("PORT", "abc", 1);
    setenv("LOADWATCH_LOG_LEVEL", "loud", 1);
    AppConfig config;
    config.apply_env();
    unsetenv("PORT");
    unsetenv("LOADWATCH_LOG_LEVEL");

    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigureLoggingTest, UnwritableFileFallsBackToConsole) {
    LoggingSettings settings;
    settings.file = "/nonexistent/dir/loadwatch.log";
    EXPECT_FALSE(configure_logging(settings));

    settings.file.clear();
    settings.level = "debug";
    EXPECT_TRUE(configure_logging(settings));
    EXPECT_TRUE(LoggerFactory::get_logger("config_test").is_enabled(LogLevel::DEBUG));

    EXPECT_TRUE(configure_logging(LoggingSettings{}));
    EXPECT_FALSE(LoggerFactory::get_logger("config_test").is_enabled(LogLevel::DEBUG));
}

} // namespace
