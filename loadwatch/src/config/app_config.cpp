#include "loadwatch/config/app_config.h"
#include "loadwatch/utils/logger.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <type_traits>

#include <toml++/toml.hpp>

namespace loadwatch {

namespace {

using Errors = std::vector<std::string>;

std::string key_path(std::string_view section, std::string_view key) {
    std::string path(section);
    path += '.';
    path += key;
    return path;
}

const toml::table* section_of(const toml::table& root, std::string_view name, Errors& errors) {
    const toml::node* node = root.get(name);
    if (!node) return nullptr;
    if (!node->is_table()) {
        errors.push_back(std::string(name) + ": expected a table");
        return nullptr;
    }
    return node->as_table();
}

template <typename T>
void read_value(const toml::table& table, std::string_view section, std::string_view key,
                T& out, Errors& errors) {
    const toml::node* node = table.get(key);
    if (!node) return;

    if constexpr (std::is_same_v<T, int>) {
        auto v = node->value<std::int64_t>();
        if (!v || *v < INT_MIN || *v > INT_MAX) {
            errors.push_back(key_path(section, key) + ": expected an integer");
            return;
        }
        out = static_cast<int>(*v);
    } else if constexpr (std::is_same_v<T, std::size_t>) {
        auto v = node->value<std::int64_t>();
        if (!v || *v < 0) {
            errors.push_back(key_path(section, key) + ": expected a non-negative integer");
            return;
        }
        out = static_cast<std::size_t>(*v);
    } else {
        auto v = node->value<T>();
        if (!v) {
            if constexpr (std::is_same_v<T, bool>) {
                errors.push_back(key_path(section, key) + ": expected a boolean");
            } else if constexpr (std::is_same_v<T, double>) {
                errors.push_back(key_path(section, key) + ": expected a number");
            } else {
                errors.push_back(key_path(section, key) + ": expected a string");
            }
            return;
        }
        out = *v;
    }
}

void read_buckets(const toml::table& table, std::vector<double>& out, Errors& errors) {
    const toml::node* node = table.get("duration_buckets_ms");
    if (!node) return;

    const toml::array* arr = node->as_array();
    if (!arr) {
        errors.push_back("metrics.duration_buckets_ms: expected an array of numbers");
        return;
    }

    std::vector<double> buckets;
    buckets.reserve(arr->size());
    for (const auto& elem : *arr) {
        auto v = elem.value<double>();
        if (!v) {
            errors.push_back("metrics.duration_buckets_ms: expected an array of numbers");
            return;
        }
        buckets.push_back(*v);
    }
    out = std::move(buckets);
}

std::optional<AppConfig> from_table(const toml::table& root) {
    AppConfig config;
    Errors errors;

    if (const auto* server = section_of(root, "server", errors)) {
        read_value(*server, "server", "bind_address", config.server.bind_address, errors);
        read_value(*server, "server", "port", config.server.port, errors);
        read_value(*server, "server", "read_timeout_ms", config.server.read_timeout_ms, errors);
        read_value(*server, "server", "max_request_bytes", config.server.max_request_bytes, errors);
    }

    if (const auto* logging = section_of(root, "logging", errors)) {
        read_value(*logging, "logging", "level", config.logging.level, errors);
        read_value(*logging, "logging", "format", config.logging.format, errors);
        read_value(*logging, "logging", "file", config.logging.file, errors);
        read_value(*logging, "logging", "colors", config.logging.colors, errors);
    }

    if (const auto* metrics = section_of(root, "metrics", errors)) {
        read_buckets(*metrics, config.metrics.duration_buckets_ms, errors);
        read_value(*metrics, "metrics", "collect_process_metrics",
                   config.metrics.collect_process_metrics, errors);
        read_value(*metrics, "metrics", "metrics_path", config.metrics.metrics_path, errors);
    }

    if (const auto* t = section_of(root, "thresholds", errors)) {
        auto& th = config.thresholds;
        read_value(*t, "thresholds", "pass_min_success_rate_pct", th.pass_min_success_rate_pct, errors);
        read_value(*t, "thresholds", "pass_max_avg_response_ms", th.pass_max_avg_response_ms, errors);
        read_value(*t, "thresholds", "unstable_min_success_rate_pct", th.unstable_min_success_rate_pct, errors);
        read_value(*t, "thresholds", "unstable_max_avg_response_ms", th.unstable_max_avg_response_ms, errors);
    }

    if (!errors.empty()) {
        auto& logger = LoggerFactory::get_logger("config");
        for (const auto& e : errors) {
            logger.error("Invalid configuration: " + e);
        }
        return std::nullopt;
    }
    return config;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_known_level(const std::string& level) {
    static const char* const kLevels[] = {
        "trace", "debug", "info", "warn", "warning", "error", "fatal", "off"
    };
    const auto lower = lowercase(level);
    return std::any_of(std::begin(kLevels), std::end(kLevels),
                       [&](const char* l) { return lower == l; });
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

std::optional<AppConfig> AppConfig::from_toml_file(const std::filesystem::path& path) {
    auto& logger = LoggerFactory::get_logger("config");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        logger.with_field("path", path.string()).error("Configuration file not found");
        return std::nullopt;
    }

    try {
        auto root = toml::parse_file(path.string());
        auto config = from_table(root);
        if (config) {
            logger.with_field("path", path.string()).debug("Configuration loaded");
        }
        return config;
    } catch (const toml::parse_error& e) {
        logger.with_field("path", path.string())
              .with_field("line", static_cast<long long>(e.source().begin.line))
              .error("Failed to parse TOML: " + std::string(e.description()));
        return std::nullopt;
    }
}

std::optional<AppConfig> AppConfig::from_toml_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        return from_table(root);
    } catch (const toml::parse_error& e) {
        LoggerFactory::get_logger("config")
            .with_field("line", static_cast<long long>(e.source().begin.line))
            .error("Failed to parse TOML: " + std::string(e.description()));
        return std::nullopt;
    }
}

void AppConfig::apply_env() {
    auto& logger = LoggerFactory::get_logger("config");

    if (const char* port_env = std::getenv("PORT")) {
        std::string_view text(port_env);
        int port = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            server.port = port;
        } else {
            logger.with_field("value", std::string(text)).warn("Ignoring non-numeric PORT");
        }
    }

    if (const char* level_env = std::getenv("LOADWATCH_LOG_LEVEL")) {
        if (is_known_level(level_env)) {
            logging.level = level_env;
        } else {
            logger.with_field("value", std::string(level_env))
                  .warn("Ignoring unknown LOADWATCH_LOG_LEVEL");
        }
    }
}

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> AppConfig::validate() const {
    std::vector<std::string> problems;

    if (server.port < 1 || server.port > 65535) {
        problems.push_back("server.port must be between 1 and 65535");
    }
    if (server.bind_address.empty()) {
        problems.push_back("server.bind_address must not be empty");
    }
    if (server.read_timeout_ms <= 0) {
        problems.push_back("server.read_timeout_ms must be positive");
    }
    if (server.max_request_bytes == 0) {
        problems.push_back("server.max_request_bytes must be positive");
    }

    if (!is_known_level(logging.level)) {
        problems.push_back("logging.level '" + logging.level + "' is not a known level");
    }
    if (logging.format != "text" && logging.format != "json") {
        problems.push_back("logging.format must be 'text' or 'json'");
    }

    const auto& buckets = metrics.duration_buckets_ms;
    if (buckets.empty()) {
        problems.push_back("metrics.duration_buckets_ms must not be empty");
    } else {
        for (std::size_t i = 0; i < buckets.size(); ++i) {
            if (!std::isfinite(buckets[i])) {
                problems.push_back("metrics.duration_buckets_ms must contain finite values");
                break;
            }
            if (i > 0 && buckets[i] <= buckets[i - 1]) {
                problems.push_back("metrics.duration_buckets_ms must be strictly increasing");
                break;
            }
        }
    }
    if (metrics.metrics_path.empty() || metrics.metrics_path.front() != '/') {
        problems.push_back("metrics.metrics_path must start with '/'");
    }

    const auto& t = thresholds;
    auto is_rate = [](double v) { return v >= 0.0 && v <= 100.0; };
    if (!is_rate(t.pass_min_success_rate_pct)) {
        problems.push_back("thresholds.pass_min_success_rate_pct must be within 0..100");
    }
    if (!is_rate(t.unstable_min_success_rate_pct)) {
        problems.push_back("thresholds.unstable_min_success_rate_pct must be within 0..100");
    }
    if (t.pass_max_avg_response_ms < 0.0) {
        problems.push_back("thresholds.pass_max_avg_response_ms must not be negative");
    }
    if (t.unstable_max_avg_response_ms < 0.0) {
        problems.push_back("thresholds.unstable_max_avg_response_ms must not be negative");
    }
    if (t.unstable_min_success_rate_pct > t.pass_min_success_rate_pct) {
        problems.push_back("thresholds.unstable_min_success_rate_pct must not exceed "
                           "thresholds.pass_min_success_rate_pct");
    }
    if (t.unstable_max_avg_response_ms < t.pass_max_avg_response_ms) {
        problems.push_back("thresholds.unstable_max_avg_response_ms must not be below "
                           "thresholds.pass_max_avg_response_ms");
    }

    return problems;
}

// ============================================================================
// Logging setup
// ============================================================================

bool configure_logging(const LoggingSettings& settings) {
    LoggerFactory::set_global_level(log_level_from_string(settings.level));

    if (settings.format == "json") {
        LoggerFactory::set_default_formatter(std::make_shared<JsonFormatter>());
    } else {
        LoggerFactory::set_default_formatter(std::make_shared<TextFormatter>());
    }

    if (!settings.file.empty()) {
        auto file_sink = std::make_shared<FileSink>(settings.file);
        if (file_sink->is_open()) {
            LoggerFactory::set_default_sink(file_sink);
            return true;
        }
        LoggerFactory::set_default_sink(std::make_shared<ConsoleSink>(settings.colors));
        return false;
    }

    LoggerFactory::set_default_sink(std::make_shared<ConsoleSink>(settings.colors));
    return true;
}

} // namespace loadwatch
