/*
 * log_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Global spdlog configuration for the docflow library

**************************************************/

#ifndef DOCFLOW_LOGGING_LOG_CONFIG_HPP
#define DOCFLOW_LOGGING_LOG_CONFIG_HPP

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace docflow::logging {

/**
 * @brief Builds docflow loggers from a LoggingConfig.
 *
 * Library code logs through the spdlog default logger; initialize()
 * replaces it with one writing to the configured sinks.
 */
class LogConfig {
public:
    /**
     * @brief Install the default "docflow" logger.
     *
     * Calling it again replaces the sinks of every logger created so far.
     */
    static void initialize(const config::LoggingConfig& config = {});

    /**
     * @brief Get or create a named logger sharing the configured sinks.
     */
    static auto getLogger(std::string_view name)
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Parse a level name, falling back to info for unknown names.
     */
    static auto parseLevel(std::string_view name) noexcept
        -> spdlog::level::level_enum;

    static void setGlobalLevel(spdlog::level::level_enum level) noexcept;

    static void flushAll() noexcept;

    [[nodiscard]] static bool isInitialized() noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

private:
    static auto buildSinks(const config::LoggingConfig& config)
        -> std::vector<spdlog::sink_ptr>;

    static inline std::atomic<bool> initialized_{false};
};

}  // namespace docflow::logging

#endif  // DOCFLOW_LOGGING_LOG_CONFIG_HPP
