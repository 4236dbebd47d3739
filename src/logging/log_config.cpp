/*
 * log_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Global spdlog configuration implementation

**************************************************/

#include "log_config.hpp"

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <unordered_map>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace docflow::logging {

namespace {
    std::mutex registry_mutex_;
    std::vector<spdlog::sink_ptr> sinks_;
    spdlog::level::level_enum level_ = spdlog::level::info;
    std::string pattern_ = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
}

void LogConfig::initialize(const config::LoggingConfig& config) {
    auto sinks = buildSinks(config);

    std::lock_guard lock(registry_mutex_);
    sinks_ = std::move(sinks);
    level_ = parseLevel(config.level);
    pattern_ = config.pattern;

    for (auto& [name, logger] : loggers_) {
        logger->sinks() = sinks_;
        logger->set_level(level_);
        logger->set_pattern(pattern_);
    }

    auto it = loggers_.find("docflow");
    if (it == loggers_.end()) {
        auto logger = std::make_shared<spdlog::logger>("docflow", sinks_.begin(),
                                                       sinks_.end());
        logger->set_level(level_);
        logger->set_pattern(pattern_);
        logger->flush_on(spdlog::level::err);
        it = loggers_.emplace("docflow", std::move(logger)).first;
    }
    spdlog::set_default_logger(it->second);

    spdlog::set_error_handler([](const std::string& msg) {
        std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
    });

    initialized_.store(true, std::memory_order_release);
    spdlog::debug("Logging initialized at level {}", config.level);
}

auto LogConfig::getLogger(std::string_view name)
    -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(registry_mutex_);
    std::string key{name};
    if (auto it = loggers_.find(key); it != loggers_.end()) {
        return it->second;
    }

    auto logger =
        std::make_shared<spdlog::logger>(key, sinks_.begin(), sinks_.end());
    if (sinks_.empty()) {
        logger->sinks() = spdlog::default_logger()->sinks();
    }
    logger->set_level(level_);
    logger->set_pattern(pattern_);
    logger->flush_on(spdlog::level::err);
    loggers_.emplace(key, logger);
    return logger;
}

auto LogConfig::parseLevel(std::string_view name) noexcept
    -> spdlog::level::level_enum {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical" || name == "fatal") return spdlog::level::critical;
    if (name == "off" || name == "none") return spdlog::level::off;
    return spdlog::level::info;
}

void LogConfig::setGlobalLevel(spdlog::level::level_enum level) noexcept {
    {
        std::lock_guard lock(registry_mutex_);
        level_ = level;
        for (auto& [name, logger] : loggers_) {
            logger->set_level(level);
        }
    }
    spdlog::set_level(level);
}

void LogConfig::flushAll() noexcept {
    try {
        spdlog::apply_all(
            [](const std::shared_ptr<spdlog::logger>& l) { l->flush(); });
        std::lock_guard lock(registry_mutex_);
        for (auto& [name, logger] : loggers_) {
            logger->flush();
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to flush loggers: %s\n", e.what());
    }
}

auto LogConfig::buildSinks(const config::LoggingConfig& config)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        auto console_sink =
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(parseLevel(config.level));
        sinks.push_back(console_sink);
    }

    if (config.enableFile) {
        auto parent = std::filesystem::path(config.logFile).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logFile, config.maxFileSize, config.maxFiles);
        file_sink->set_level(spdlog::level::trace);  // Log everything to file
        sinks.push_back(file_sink);
    }

    return sinks;
}

}  // namespace docflow::logging
