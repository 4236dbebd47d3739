/*
 * retry_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Default retry policy configuration

**************************************************/

#ifndef DOCFLOW_CONFIG_SECTIONS_RETRY_CONFIG_HPP
#define DOCFLOW_CONFIG_SECTIONS_RETRY_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string_view>

#include "../config_section.hpp"
#include "retry/retry.hpp"

namespace docflow::config {

/**
 * @brief Retry configuration applied to storage operations
 */
struct RetryConfig : ConfigSection<RetryConfig> {
    /// Configuration path
    static constexpr std::string_view PATH = "/docflow/retry";

    int maxAttempts{retry::DEFAULT_RETRY_ATTEMPTS};  ///< Attempts incl. first
    size_t initialDelayMs{
        static_cast<size_t>(retry::DEFAULT_RETRY_DELAY.count())};
    double multiplier{retry::RETRY_BACKOFF_MULTIPLIER};

    /**
     * @brief Policy fragment for RetryExecutor::makeRetrier.
     */
    [[nodiscard]] retry::RetryOptions toOptions() const {
        retry::RetryOptions options;
        options.maxAttempts = maxAttempts;
        options.initialDelay = std::chrono::milliseconds(initialDelayMs);
        options.backoffMultiplier = multiplier;
        return options;
    }

    [[nodiscard]] json serialize() const {
        return {{"maxAttempts", maxAttempts},
                {"initialDelayMs", initialDelayMs},
                {"multiplier", multiplier}};
    }

    [[nodiscard]] static RetryConfig deserialize(const json& j) {
        RetryConfig cfg;
        cfg.maxAttempts = j.value("maxAttempts", cfg.maxAttempts);
        cfg.initialDelayMs = j.value("initialDelayMs", cfg.initialDelayMs);
        cfg.multiplier = j.value("multiplier", cfg.multiplier);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {{"type", "object"},
                {"properties",
                 {{"maxAttempts",
                   {{"type", "integer"},
                    {"minimum", 1},
                    {"maximum", 10},
                    {"default", 3}}},
                  {"initialDelayMs",
                   {{"type", "integer"},
                    {"minimum", 0},
                    {"maximum", MAX_DURATION_MS},
                    {"default", 1000}}},
                  {"multiplier",
                   {{"type", "number"}, {"minimum", 1.0}, {"default", 2.0}}}}}};
    }
};

}  // namespace docflow::config

#endif  // DOCFLOW_CONFIG_SECTIONS_RETRY_CONFIG_HPP
