#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "config_types.hpp" // Include for LoggingConfig

namespace webhunter {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static void init(const LoggingConfig& config, LogLevel app_log_level);
    static void set_log_level(LogLevel level);
    static void shutdown();

    // Returns the process logger, creating a console-only one if init() has not run yet.
    // Lock-free once a logger exists.
    static std::shared_ptr<spdlog::logger> get();

private:
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    static std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_INFO(...) ::webhunter::Logger::get()->info(__VA_ARGS__)
#define LOG_ERROR(...) ::webhunter::Logger::get()->error(__VA_ARGS__)
#define LOG_WARNING(...) ::webhunter::Logger::get()->warn(__VA_ARGS__)
#define LOG_DEBUG(...) ::webhunter::Logger::get()->debug(__VA_ARGS__)
#define LOG_CRITICAL(...) ::webhunter::Logger::get()->critical(__VA_ARGS__)

}
