#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chunksync::engine {

namespace {
std::string now_string() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&now_c, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "info") {
        return LogLevel::kInfo;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

Logger::Logger(const std::string& file_path) : file_path_(file_path) {
    ensure_stream();
}

void Logger::ensure_stream() {
    if (file_path_.empty() || stream_.is_open()) {
        return;
    }
    const auto parent = std::filesystem::path(file_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    stream_.open(file_path_, std::ios::app);
    if (!stream_) {
        throw std::runtime_error("Failed to open log file: " + file_path_);
    }
}

void Logger::set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

std::string Logger::level_to_string(LogLevel level) const {
    switch (level) {
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
        default:
            return "INFO";
    }
}

void Logger::log(LogLevel level, std::string_view message) {
    const std::string stamp = now_string();
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    ensure_stream();
    if (stream_.is_open()) {
        stream_ << stamp << " [" << level_to_string(level) << "] " << message << '\n';
        stream_.flush();
    }
    if (console_) {
        std::clog << stamp << " [" << level_to_string(level) << "] " << message << '\n';
    }
}

}  // namespace chunksync::engine
