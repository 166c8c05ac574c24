/*
 * PeerChat - utility helpers
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerchat {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);

LogLevel log_level();

std::optional<LogLevel> parse_log_level(const std::string& text);

void log(LogLevel level, const std::string& message);

inline void log_info(const std::string& message) {
    log(LogLevel::Info, message);
}

inline void log_warn(const std::string& message) {
    log(LogLevel::Warn, message);
}

inline void log_error(const std::string& message) {
    log(LogLevel::Error, message);
}

inline void log_debug(const std::string& message) {
    log(LogLevel::Debug, message);
}

class FileLogger;

// Mirrors every emitted log line into `logger` as well as stderr. Pass
// nullptr to stop mirroring. The logger must outlive the attachment.
void attach_file_logger(FileLogger* logger);

std::vector<uint8_t> random_bytes(std::size_t count);

std::string hex_encode(const std::vector<uint8_t>& data);

uint64_t monotonic_millis();

uint64_t wall_clock_millis();

std::string trim(const std::string& input);

std::vector<std::string> split(const std::string& input, char delimiter);

class FileLogger {
public:
    explicit FileLogger(std::string path);
    ~FileLogger();

    void write(const std::string& line);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace peerchat
