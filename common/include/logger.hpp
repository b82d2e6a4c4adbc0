#pragma once

#include <string>
#include <string_view>
#include <mutex>
#include <fstream>
#include <format>
#include <source_location>
#include <filesystem>
#include <optional>

namespace mailcore {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5
};

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "fatal".
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger {
public:
    static Logger& instance();

    void init(LogLevel level = LogLevel::Info,
              bool console = true,
              const std::filesystem::path& file = "",
              size_t max_file_size = 10 * 1024 * 1024,
              size_t max_files = 5);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_; }

    template<typename... Args>
    void log(LogLevel level, const std::source_location& loc,
             std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level)) return;
        write(level, loc, std::format(fmt, std::forward<Args>(args)...));
    }

    void log(LogLevel level, std::string_view msg,
             const std::source_location& loc = std::source_location::current()) {
        if (!enabled(level)) return;
        write(level, loc, std::string(msg));
    }

    // Closes the log file; later messages go to the console only.
    void shutdown();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::source_location& loc, const std::string& message);
    void rotate_if_needed();
    static const char* level_name(LogLevel level);
    static const char* level_color(LogLevel level);
    static std::string timestamp();

    LogLevel level_ = LogLevel::Info;
    bool console_ = true;
    std::filesystem::path log_file_;
    std::ofstream file_stream_;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    size_t current_size_ = 0;
    std::mutex mutex_;
};

#define LOG_TRACE(msg) mailcore::Logger::instance().log(mailcore::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) mailcore::Logger::instance().log(mailcore::LogLevel::Debug, msg)
#define LOG_INFO(msg) mailcore::Logger::instance().log(mailcore::LogLevel::Info, msg)
#define LOG_WARNING(msg) mailcore::Logger::instance().log(mailcore::LogLevel::Warning, msg)
#define LOG_ERROR(msg) mailcore::Logger::instance().log(mailcore::LogLevel::Error, msg)
#define LOG_FATAL(msg) mailcore::Logger::instance().log(mailcore::LogLevel::Fatal, msg)

#define LOG_TRACE_FMT(fmt, ...) \
    mailcore::Logger::instance().log(mailcore::LogLevel::Trace, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_DEBUG_FMT(fmt, ...) \
    mailcore::Logger::instance().log(mailcore::LogLevel::Debug, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_INFO_FMT(fmt, ...) \
    mailcore::Logger::instance().log(mailcore::LogLevel::Info, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_WARNING_FMT(fmt, ...) \
    mailcore::Logger::instance().log(mailcore::LogLevel::Warning, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_ERROR_FMT(fmt, ...) \
    mailcore::Logger::instance().log(mailcore::LogLevel::Error, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_FATAL_FMT(fmt, ...) \
    mailcore::Logger::instance().log(mailcore::LogLevel::Fatal, std::source_location::current(), fmt, __VA_ARGS__)

}  // namespace mailcore
