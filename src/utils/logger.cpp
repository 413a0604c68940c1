#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace webhunter {

namespace {
std::mutex init_mutex;
constexpr const char* kLoggerName = "webhunter";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

LogLevel parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") {
        return LogLevel::DEBUG;
    } else if (upper == "WARNING" || upper == "WARN") {
        return LogLevel::WARNING;
    } else if (upper == "ERROR") {
        return LogLevel::ERROR;
    } else if (upper == "CRITICAL") {
        return LogLevel::CRITICAL;
    }
    return LogLevel::INFO;
}

void Logger::init(const LoggingConfig& config, LogLevel app_log_level) {
    std::lock_guard<std::mutex> lock(init_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console_output) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);
    }

    if (config.file_output && !config.file_path.empty()) {
        try {
            std::filesystem::path log_path(config.file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024,
                static_cast<size_t>(config.max_files));
            file_sink->set_pattern(kPattern);
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            std::cerr << "Could not open log file " << config.file_path << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(app_log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    std::atomic_store(&logger_, logger);
}

void Logger::set_log_level(LogLevel level) {
    get()->set_level(to_spdlog_level(level));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(init_mutex);
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (logger) {
        logger->flush();
        spdlog::drop(kLoggerName);
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    // Hot path for every LOG_* call; the mutex is only taken before init()
    auto logger = std::atomic_load(&logger_);
    if (logger) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(init_mutex);
    logger = std::atomic_load(&logger_);
    if (!logger) {
        logger = spdlog::get(kLoggerName);
        if (!logger) {
            logger = spdlog::stdout_color_mt(kLoggerName);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        }
        std::atomic_store(&logger_, logger);
    }
    return logger;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

}
