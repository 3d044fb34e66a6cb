#pragma once

#include "loadwatch/analysis/analyzer.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace loadwatch {

// ============================================================================
// Sections
// ============================================================================

struct ServerSettings {
    std::string bind_address = "0.0.0.0";
    int port = 3000;
    int read_timeout_ms = 5000;
    std::size_t max_request_bytes = 65536;
};

struct LoggingSettings {
    std::string level = "info";
    std::string format = "text";   ///< "text" or "json"
    std::string file;              ///< Empty means console
    bool colors = true;
};

struct MetricsSettings {
    std::vector<double> duration_buckets_ms{50, 100, 200, 400, 800, 1600, 3200};
    bool collect_process_metrics = true;
    std::string metrics_path = "/metrics";
};

/**
 * @brief Complete application configuration
 *
 * Every field has a default, so an empty TOML document is a valid config.
 * Loading only checks syntax and types; call validate() for value ranges.
 */
struct AppConfig {
    ServerSettings server;
    LoggingSettings logging;
    MetricsSettings metrics;
    analysis::Thresholds thresholds;

    /**
     * @brief Load from a TOML file
     * @return std::nullopt on I/O, syntax or type errors (reason is logged)
     */
    static std::optional<AppConfig> from_toml_file(const std::filesystem::path& path);

    static std::optional<AppConfig> from_toml_string(const std::string& toml_content);

    /// PORT and LOADWATCH_LOG_LEVEL override the loaded values
    void apply_env();

    /// Every problem found, empty when the config is usable
    [[nodiscard]] std::vector<std::string> validate() const;
};

/**
 * @brief Point LoggerFactory at the configured level, format and destination
 * @return false if the log file could not be opened (console is used instead)
 */
bool configure_logging(const LoggingSettings& settings);

} // namespace loadwatch
