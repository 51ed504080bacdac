#include "infrastructure/logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>

namespace ip6gen::infrastructure {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : console_stream_(&std::cerr) {}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_level_ = level;
}

Logger::LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return min_level_;
}

void Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_ = filename;
}

void Logger::enable_console_output(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_ = enable;
}

void Logger::enable_json_format(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    json_format_ = enable;
}

void Logger::set_console_stream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_stream_ = &stream;
}

void Logger::set_max_history(size_t max_entries) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    max_history_ = max_entries;
    while (history_.size() > max_history_) {
        history_.pop_front();
    }
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const Metadata& metadata) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (level < min_level_) return;

    LogEntry entry{level, component, message, std::chrono::system_clock::now(), metadata,
                   std::this_thread::get_id()};
    std::string line = json_format_ ? format_json_entry(entry) : format_log_entry(entry);

    if (console_output_ && console_stream_ != nullptr) {
        *console_stream_ << line << std::endl;
    }
    write_to_file(line);

    if (max_history_ > 0) {
        history_.push_back(std::move(entry));
        if (history_.size() > max_history_) {
            history_.pop_front();
        }
    }
}

void Logger::trace(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::TRACE, component, message, metadata);
}
void Logger::debug(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::DEBUG_LEVEL, component, message, metadata);
}
void Logger::info(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::INFO, component, message, metadata);
}
void Logger::warning(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::WARNING, component, message, metadata);
}
void Logger::error(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::ERROR, component, message, metadata);
}
void Logger::critical(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::CRITICAL, component, message, metadata);
}

std::vector<Logger::LogEntry> Logger::get_recent_logs(size_t count) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    size_t start = history_.size() > count ? history_.size() - count : 0;
    return std::vector<LogEntry>(history_.begin() + static_cast<std::ptrdiff_t>(start), history_.end());
}

std::vector<Logger::LogEntry> Logger::get_logs_by_level(LogLevel level, size_t count) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::vector<LogEntry> logs;
    for (const auto& entry : history_) {
        if (logs.size() >= count) break;
        if (entry.level == level) {
            logs.push_back(entry);
        }
    }
    return logs;
}

std::vector<Logger::LogEntry> Logger::get_logs_by_component(const std::string& component, size_t count) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::vector<LogEntry> logs;
    for (const auto& entry : history_) {
        if (logs.size() >= count) break;
        if (entry.component == component) {
            logs.push_back(entry);
        }
    }
    return logs;
}

void Logger::clear_history() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    history_.clear();
}

void Logger::write_to_file(const std::string& line) {
    if (log_file_.empty()) return;
    std::ofstream ofs(log_file_, std::ios::app);
    if (!ofs.is_open()) return;
    ofs << line << std::endl;
}

std::string Logger::format_log_entry(const LogEntry& entry) const {
    std::ostringstream oss;
    oss << "[" << format_timestamp(entry.timestamp) << "] [" << log_level_to_string(entry.level)
        << "] [" << entry.component << "] " << entry.message;

    std::map<std::string, std::string> sorted(entry.metadata.begin(), entry.metadata.end());
    for (const auto& [key, value] : sorted) {
        oss << " " << key << "=" << value;
    }
    return oss.str();
}

std::string Logger::format_json_entry(const LogEntry& entry) const {
    nlohmann::json j;
    j["timestamp"] = format_timestamp(entry.timestamp);
    j["level"] = log_level_to_string(entry.level);
    j["component"] = entry.component;
    j["message"] = entry.message;
    if (!entry.metadata.empty()) {
        j["metadata"] = entry.metadata;
    }
    return j.dump();
}

std::string Logger::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG_LEVEL: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::optional<Logger::LogLevel> Logger::string_to_log_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG_LEVEL;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

}
