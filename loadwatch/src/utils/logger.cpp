#include "loadwatch/utils/logger.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace loadwatch {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

std::string thread_id_string(std::thread::id id) {
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

} // namespace

// ============================================================================
// LogLevel utilities
// ============================================================================

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel log_level_from_string(const std::string& level_str) {
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_str == "TRACE") return LogLevel::TRACE;
    if (upper_str == "DEBUG") return LogLevel::DEBUG;
    if (upper_str == "INFO")  return LogLevel::INFO;
    if (upper_str == "WARN" || upper_str == "WARNING") return LogLevel::WARN;
    if (upper_str == "ERROR") return LogLevel::ERROR;
    if (upper_str == "FATAL") return LogLevel::FATAL;
    if (upper_str == "OFF")   return LogLevel::OFF;

    return LogLevel::INFO;
}

LogMessage::LogMessage(LogLevel lvl, std::string comp, std::string msg,
                       std::chrono::system_clock::time_point ts)
    : level(lvl)
    , component(std::move(comp))
    , message(std::move(msg))
    , timestamp(ts)
    , thread_id(std::this_thread::get_id()) {
}

// ============================================================================
// TextFormatter
// ============================================================================

TextFormatter::TextFormatter(bool include_thread_id)
    : include_thread_id_(include_thread_id) {
}

std::string TextFormatter::format(const LogMessage& message) {
    std::ostringstream oss;

    oss << "[" << format_timestamp(message.timestamp) << "] ";
    oss << "[" << std::setw(5) << std::left << to_string(message.level) << "] ";

    if (!message.component.empty()) {
        oss << "[" << message.component << "] ";
    }

    if (include_thread_id_) {
        oss << "[thread=" << message.thread_id << "] ";
    }

    oss << message.message;

    if (!message.fields.empty()) {
        // Sorted so that identical messages format identically
        std::vector<std::pair<std::string, std::string>> sorted(message.fields.begin(),
                                                                message.fields.end());
        std::sort(sorted.begin(), sorted.end());

        oss << " {";
        bool first = true;
        for (const auto& [key, value] : sorted) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// ============================================================================
// JsonFormatter
// ============================================================================

JsonFormatter::JsonFormatter(bool pretty_print)
    : pretty_print_(pretty_print) {
}

std::string JsonFormatter::format(const LogMessage& message) {
    nlohmann::json j;
    j["timestamp"] = format_timestamp(message.timestamp);
    j["level"] = to_string(message.level);
    if (!message.component.empty()) {
        j["component"] = message.component;
    }
    j["thread_id"] = thread_id_string(message.thread_id);
    j["message"] = message.message;

    if (!message.fields.empty()) {
        j["fields"] = nlohmann::json::object();
        for (const auto& [key, value] : message.fields) {
            j["fields"][key] = value;
        }
    }

    // Replace invalid UTF-8 rather than throw from the logging path
    return j.dump(pretty_print_ ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {
}

const char* ConsoleSink::color_code(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[37m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        case LogLevel::OFF:   return "";
    }
    return "";
}

void ConsoleSink::write(LogLevel level, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (use_colors_) {
        std::cerr << color_code(level) << formatted_message << "\033[0m\n";
    } else {
        std::cerr << formatted_message << '\n';
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& filename, bool append)
    : filename_(filename) {
    auto mode = std::ios::out | (append ? std::ios::app : std::ios::trunc);
    file_.open(filename_, mode);
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(LogLevel /*level*/, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << formatted_message << '\n';
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

bool FileSink::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

// ============================================================================
// MemorySink
// ============================================================================

void MemorySink::write(LogLevel /*level*/, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(formatted_message);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , formatter_(std::make_shared<TextFormatter>()) {
}

void Logger::trace(const std::string& message) { log(LogLevel::TRACE, message); }
void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message)  { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message)  { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }
void Logger::fatal(const std::string& message) { log(LogLevel::FATAL, message); }

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        clear_fields();
        return;
    }
    LogFields fields;
    {
        std::lock_guard<std::mutex> lock(fields_mutex_);
        fields.swap(fields_);
    }
    do_log(level, message, std::move(fields));
}

void Logger::log(LogLevel level, const std::string& message, LogFields fields) {
    if (!is_enabled(level)) return;
    do_log(level, message, std::move(fields));
}

Logger& Logger::with_field(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(fields_mutex_);
    fields_[key] = value;
    return *this;
}

Logger& Logger::clear_fields() {
    std::lock_guard<std::mutex> lock(fields_mutex_);
    fields_.clear();
    return *this;
}

void Logger::set_level(LogLevel level) {
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return min_level_.load(std::memory_order_relaxed);
}

bool Logger::is_enabled(LogLevel level) const {
    auto min = get_level();
    return min != LogLevel::OFF && level != LogLevel::OFF &&
           static_cast<int>(level) >= static_cast<int>(min);
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.clear();
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;
    std::lock_guard<std::mutex> lock(config_mutex_);
    formatter_ = std::move(formatter);
}

void Logger::flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        sink->flush();
    }
}

const std::string& Logger::component() const {
    return component_;
}

void Logger::do_log(LogLevel level, const std::string& message, LogFields fields) {
    LogMessage msg(level, component_, message);
    msg.fields = std::move(fields);

    std::vector<std::shared_ptr<ILogSink>> sinks;
    std::shared_ptr<ILogFormatter> formatter;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        sinks = sinks_;
        formatter = formatter_;
    }

    if (sinks.empty() || !formatter) {
        return;
    }

    try {
        std::string formatted = formatter->format(msg);
        for (auto& sink : sinks) {
            sink->write(level, formatted);
        }
    } catch (const std::exception& e) {
        std::cerr << "loadwatch logger failure: " << e.what() << '\n';
    }
}

// ============================================================================
// LoggerFactory
// ============================================================================

std::mutex LoggerFactory::registry_mutex_;
std::unordered_map<std::string, std::unique_ptr<Logger>> LoggerFactory::loggers_;
std::shared_ptr<ILogSink> LoggerFactory::default_sink_ = std::make_shared<ConsoleSink>(false);
std::shared_ptr<ILogFormatter> LoggerFactory::default_formatter_ = std::make_shared<TextFormatter>();
std::atomic<LogLevel> LoggerFactory::global_level_{LogLevel::INFO};

Logger& LoggerFactory::get_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = loggers_.find(component);
    if (it != loggers_.end()) {
        return *it->second;
    }

    auto logger = std::make_unique<Logger>(component);
    logger->set_level(global_level_.load());
    logger->add_sink(default_sink_);
    logger->set_formatter(default_formatter_);

    auto& ref = *logger;
    loggers_.emplace(component, std::move(logger));
    return ref;
}

void LoggerFactory::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_level_.store(level);
    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
}

void LoggerFactory::set_default_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_sink_ = sink;
    for (auto& [name, logger] : loggers_) {
        logger->clear_sinks();
        logger->add_sink(sink);
    }
}

void LoggerFactory::set_default_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_formatter_ = formatter;
    for (auto& [name, logger] : loggers_) {
        logger->set_formatter(formatter);
    }
}

void LoggerFactory::flush_all() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (auto& [name, logger] : loggers_) {
        logger->flush();
    }
}

} // namespace loadwatch
