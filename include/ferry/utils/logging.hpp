#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace ferry::utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

// Where the "ferry" logger writes. With to_stdout off and no file,
// records are dropped.
struct LogOptions {
    LogLevel level = LogLevel::INFO;
    std::string pattern;
    bool to_stdout = true;
    std::string file;  // appended to when non-empty
};

// Installs the "ferry" logger as the spdlog default, replacing any
// previous one. Throws spdlog::spdlog_ex if the log file cannot be opened.
void init_logging(const LogOptions& options);
void init_logging(LogLevel level = LogLevel::INFO);

void set_log_level(LogLevel level);
LogLevel get_log_level();

const char* log_level_to_string(LogLevel level);

// Case-insensitive; unknown names map to INFO
LogLevel string_to_log_level(const std::string& str);

}  // namespace ferry::utils
