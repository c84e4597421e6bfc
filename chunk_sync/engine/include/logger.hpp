#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

enum class LogLevel {
    kInfo,
    kWarn,
    kError,
};

namespace chunksync::engine {

// "info", "warn" or "error"; throws std::invalid_argument otherwise.
LogLevel parse_log_level(const std::string& name);

// Log sink shared by every pipeline stage. Lines go to std::clog and, when a
// path is configured, are appended to that file as well.
class Logger {
public:
    explicit Logger(const std::string& file_path = {});
    void log(LogLevel level, std::string_view message);

    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

    void set_console(bool enabled);
    // Messages below level are dropped from every sink.
    void set_min_level(LogLevel level);
    const std::string& file_path() const { return file_path_; }

private:
    std::string level_to_string(LogLevel level) const;
    void ensure_stream();

    std::mutex mutex_;
    std::ofstream stream_;
    std::string file_path_;
    bool console_ = true;
    LogLevel min_level_ = LogLevel::kInfo;
};

}  // namespace chunksync::engine
