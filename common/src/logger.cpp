#include "logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace mailcore {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(LogLevel level, bool console, const std::filesystem::path& file,
                  size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;
    console_ = console;
    max_file_size_ = max_file_size;
    max_files_ = std::max<size_t>(max_files, 1);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    log_file_.clear();
    current_size_ = 0;

    if (!file.empty()) {
        log_file_ = file;
        std::error_code ec;
        if (auto parent = file.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        file_stream_.open(file, std::ios::app);
        if (file_stream_.is_open()) {
            auto size = std::filesystem::file_size(file, ec);
            current_size_ = ec ? 0 : static_cast<size_t>(size);
        } else {
            std::cerr << "Cannot open log file " << file << ", logging to console only\n";
        }
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

void Logger::write(LogLevel level, const std::source_location& loc, const std::string& message) {
    std::string filename = std::filesystem::path(loc.file_name()).filename().string();
    std::string formatted = std::format("[{}] [{}] [{}:{}] {}",
                                        timestamp(), level_name(level),
                                        filename, loc.line(),
                                        message);

    std::lock_guard<std::mutex> lock(mutex_);

    if (console_) {
        std::cerr << level_color(level) << formatted << "\033[0m\n";
    }

    if (file_stream_.is_open()) {
        rotate_if_needed();
        file_stream_ << formatted << "\n";
        file_stream_.flush();
        current_size_ += formatted.length() + 1;
    }
}

void Logger::rotate_if_needed() {
    if (current_size_ < max_file_size_) return;

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::filesystem::path old_file = log_file_;
        old_file += "." + std::to_string(i);

        if (!std::filesystem::exists(old_file, ec)) continue;

        if (i + 1 >= max_files_) {
            std::filesystem::remove(old_file, ec);
        } else {
            std::filesystem::path new_file = log_file_;
            new_file += "." + std::to_string(i + 1);
            std::filesystem::rename(old_file, new_file, ec);
        }
    }

    std::filesystem::path rotated = log_file_;
    rotated += ".1";
    std::filesystem::rename(log_file_, rotated, ec);

    file_stream_.open(log_file_, std::ios::app);
    current_size_ = 0;
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

const char* Logger::level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "\033[90m";
        case LogLevel::Debug:   return "\033[36m";
        case LogLevel::Info:    return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error:   return "\033[31m";
        case LogLevel::Fatal:   return "\033[35m";
    }
    return "";
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace mailcore
