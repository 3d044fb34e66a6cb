#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace loadwatch {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

[[nodiscard]] std::string to_string(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive, "WARNING" accepted)
 * @return Parsed level, INFO for unknown names
 */
[[nodiscard]] LogLevel log_level_from_string(const std::string& level_str);

// ============================================================================
// Log message
// ============================================================================

using LogFields = std::unordered_map<std::string, std::string>;

struct LogMessage {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;

    /// Structured key-value fields
    LogFields fields;

    LogMessage() = default;
    LogMessage(LogLevel lvl, std::string comp, std::string msg,
               std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());
};

// ============================================================================
// Formatters
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogMessage& message) = 0;
};

/**
 * @brief `[2026-01-01T12:00:00.123Z] [INFO ] [component] message {key=value}`
 */
class TextFormatter : public ILogFormatter {
public:
    explicit TextFormatter(bool include_thread_id = false);
    std::string format(const LogMessage& message) override;

private:
    bool include_thread_id_;
};

/**
 * @brief One JSON object per line
 */
class JsonFormatter : public ILogFormatter {
public:
    explicit JsonFormatter(bool pretty_print = false);
    std::string format(const LogMessage& message) override;

private:
    bool pretty_print_;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(LogLevel level, const std::string& formatted_message) = 0;
    virtual void flush() = 0;
};

class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override;

private:
    bool use_colors_;
    std::mutex mutex_;

    static const char* color_code(LogLevel level);
};

class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override;
    [[nodiscard]] bool is_open() const;

private:
    std::string filename_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

/**
 * @brief Collects formatted lines in memory (tests, diagnostics)
 */
class MemorySink : public ILogSink {
public:
    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    void clear();

private:
    std::vector<std::string> lines_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Component logger with level filtering and structured fields
 *
 * The configuration lock is held only long enough to copy the sink list and
 * formatter; formatting and sink I/O run outside it.
 */
class Logger {
public:
    explicit Logger(std::string component);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void log(LogLevel level, const std::string& message);

    /// Emit with an explicit field set; pending with_field() values are left untouched
    void log(LogLevel level, const std::string& message, LogFields fields);

    // ========================================================================
    // Structured fields (fluent); consumed by the next emitted message
    // ========================================================================

    Logger& with_field(const std::string& key, const std::string& value);

    template<typename T>
    Logger& with_field(const std::string& key, T value);

    Logger& clear_fields();

    // ========================================================================
    // Configuration
    // ========================================================================

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level() const;
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void flush();

    [[nodiscard]] const std::string& component() const;

private:
    std::string component_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    LogFields fields_;
    std::mutex fields_mutex_;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::shared_ptr<ILogFormatter> formatter_;
    mutable std::mutex config_mutex_;

    void do_log(LogLevel level, const std::string& message, LogFields fields);
};

// ============================================================================
// Global logger registry
// ============================================================================

class LoggerFactory {
public:
    static Logger& get_logger(const std::string& component);

    /// Applies to every registered logger and to loggers created later
    static void set_global_level(LogLevel level);
    static void set_default_sink(std::shared_ptr<ILogSink> sink);
    static void set_default_formatter(std::shared_ptr<ILogFormatter> formatter);
    static void flush_all();

private:
    static std::mutex registry_mutex_;
    static std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
    static std::shared_ptr<ILogSink> default_sink_;
    static std::shared_ptr<ILogFormatter> default_formatter_;
    static std::atomic<LogLevel> global_level_;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename T>
Logger& Logger::with_field(const std::string& key, T value) {
    if constexpr (std::is_same_v<T, bool>) {
        return with_field(key, std::string(value ? "true" : "false"));
    } else if constexpr (std::is_arithmetic_v<T>) {
        return with_field(key, std::to_string(value));
    } else {
        static_assert(std::is_convertible_v<T, std::string>,
                      "Type not supported for logging field");
        return with_field(key, std::string(value));
    }
}

} // namespace loadwatch
