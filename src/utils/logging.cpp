#include "ferry/utils/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::utils {

namespace {

constexpr const char* LOGGER_NAME = "ferry";
constexpr const char* DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

struct LevelName {
    LogLevel level;
    spdlog::level::level_enum spd;
    std::string_view name;
};

// First entry per level is the canonical name
constexpr std::array<LevelName, 10> LEVEL_NAMES{{
    {LogLevel::TRACE, spdlog::level::trace, "trace"},
    {LogLevel::DEBUG, spdlog::level::debug, "debug"},
    {LogLevel::INFO, spdlog::level::info, "info"},
    {LogLevel::WARN, spdlog::level::warn, "warn"},
    {LogLevel::WARN, spdlog::level::warn, "warning"},
    {LogLevel::ERROR, spdlog::level::err, "error"},
    {LogLevel::ERROR, spdlog::level::err, "err"},
    {LogLevel::CRITICAL, spdlog::level::critical, "critical"},
    {LogLevel::OFF, spdlog::level::off, "off"},
    {LogLevel::OFF, spdlog::level::off, "none"},
}};

std::atomic<LogLevel> current_level{LogLevel::INFO};

const LevelName& lookup(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry;
        }
    }
    return LEVEL_NAMES[2];
}

}  // namespace

void init_logging(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.to_stdout) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!options.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(options.pattern.empty() ? DEFAULT_PATTERN : options.pattern);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(std::move(logger));
    set_log_level(options.level);
}

void init_logging(LogLevel level) {
    LogOptions options;
    options.level = level;
    init_logging(options);
}

void set_log_level(LogLevel level) {
    current_level = level;
    spdlog::set_level(lookup(level).spd);
}

LogLevel get_log_level() {
    return current_level;
}

const char* log_level_to_string(LogLevel level) {
    return lookup(level).name.data();
}

LogLevel string_to_log_level(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "fatal") return LogLevel::CRITICAL;
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return LogLevel::INFO;
}

}  // namespace ferry::utils
