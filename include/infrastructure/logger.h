#pragma once

#include <chrono>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ip6gen::infrastructure {

class Logger {
public:
    enum class LogLevel {
        TRACE,
        DEBUG_LEVEL,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    using Metadata = std::unordered_map<std::string, std::string>;

    struct LogEntry {
        LogLevel level;
        std::string component;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        Metadata metadata;
        std::thread::id thread_id;
    };

    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;
    void set_log_file(const std::string& filename);
    void enable_console_output(bool enable);
    void enable_json_format(bool enable);
    // Console sink; defaults to std::cerr so stdout carries only results.
    void set_console_stream(std::ostream& stream);
    void set_max_history(size_t max_entries);

    bool is_enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& component, const std::string& message,
             const Metadata& metadata = {});

    void trace(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void debug(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void info(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void warning(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void error(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void critical(const std::string& component, const std::string& message, const Metadata& metadata = {});

    std::vector<LogEntry> get_recent_logs(size_t count = 100) const;
    std::vector<LogEntry> get_logs_by_level(LogLevel level, size_t count = 100) const;
    std::vector<LogEntry> get_logs_by_component(const std::string& component, size_t count = 100) const;
    void clear_history();

    static std::string log_level_to_string(LogLevel level);
    static std::optional<LogLevel> string_to_log_level(const std::string& level);

private:
    Logger();

    std::string format_log_entry(const LogEntry& entry) const;
    std::string format_json_entry(const LogEntry& entry) const;
    void write_to_file(const std::string& line);

    mutable std::mutex log_mutex_;
    LogLevel min_level_{LogLevel::WARNING};
    std::string log_file_;
    bool console_output_{true};
    bool json_format_{false};
    std::ostream* console_stream_;
    std::deque<LogEntry> history_;
    size_t max_history_{1000};
};

#define LOG_TRACE(component, message, ...) \
    ::ip6gen::infrastructure::Logger::instance().trace(component, message, ##__VA_ARGS__)

#define LOG_DEBUG(component, message, ...) \
    ::ip6gen::infrastructure::Logger::instance().debug(component, message, ##__VA_ARGS__)

#define LOG_INFO(component, message, ...) \
    ::ip6gen::infrastructure::Logger::instance().info(component, message, ##__VA_ARGS__)

#define LOG_WARNING(component, message, ...) \
    ::ip6gen::infrastructure::Logger::instance().warning(component, message, ##__VA_ARGS__)

#define LOG_ERROR(component, message, ...) \
    ::ip6gen::infrastructure::Logger::instance().error(component, message, ##__VA_ARGS__)

#define LOG_CRITICAL(component, message, ...) \
    ::ip6gen::infrastructure::Logger::instance().critical(component, message, ##__VA_ARGS__)

}
