/*
 * connection_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Connection lifecycle configuration

**************************************************/

#ifndef DOCFLOW_CONFIG_SECTIONS_CONNECTION_CONFIG_HPP
#define DOCFLOW_CONFIG_SECTIONS_CONNECTION_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string_view>

#include "../config_section.hpp"

namespace docflow::config {

/**
 * @brief Settings of the cached connection handle
 *
 * @example
 * ```json
 * {
 *   "docflow": {
 *     "connection": {
 *       "connectTimeoutMs": 10000,
 *       "idleTimeoutMs": 30000,
 *       "enableIdleReaper": true,
 *       "idleCheckIntervalMs": 1000,
 *       "connectAttempts": 1
 *     }
 *   }
 * }
 * ```
 */
struct ConnectionConfig : ConfigSection<ConnectionConfig> {
    /// Configuration path
    static constexpr std::string_view PATH = "/docflow/connection";

    size_t connectTimeoutMs{10000};    ///< Bound on opening a connection
    size_t idleTimeoutMs{30000};       ///< Inactivity before auto-close
    bool enableIdleReaper{true};       ///< Run the background eviction task
    size_t idleCheckIntervalMs{1000};  ///< Reaper polling interval
    int connectAttempts{1};            ///< Attempts per acquire (1 = no retry)
    size_t connectRetryDelayMs{1000};  ///< Delay before the first reconnect

    [[nodiscard]] std::chrono::milliseconds connectTimeout() const {
        return std::chrono::milliseconds(connectTimeoutMs);
    }

    [[nodiscard]] std::chrono::milliseconds idleTimeout() const {
        return std::chrono::milliseconds(idleTimeoutMs);
    }

    [[nodiscard]] std::chrono::milliseconds idleCheckInterval() const {
        return std::chrono::milliseconds(idleCheckIntervalMs);
    }

    [[nodiscard]] json serialize() const {
        return {{"connectTimeoutMs", connectTimeoutMs},
                {"idleTimeoutMs", idleTimeoutMs},
                {"enableIdleReaper", enableIdleReaper},
                {"idleCheckIntervalMs", idleCheckIntervalMs},
                {"connectAttempts", connectAttempts},
                {"connectRetryDelayMs", connectRetryDelayMs}};
    }

    [[nodiscard]] static ConnectionConfig deserialize(const json& j) {
        ConnectionConfig cfg;
        cfg.connectTimeoutMs = j.value("connectTimeoutMs", cfg.connectTimeoutMs);
        cfg.idleTimeoutMs = j.value("idleTimeoutMs", cfg.idleTimeoutMs);
        cfg.enableIdleReaper = j.value("enableIdleReaper", cfg.enableIdleReaper);
        cfg.idleCheckIntervalMs =
            j.value("idleCheckIntervalMs", cfg.idleCheckIntervalMs);
        cfg.connectAttempts = j.value("connectAttempts", cfg.connectAttempts);
        cfg.connectRetryDelayMs =
            j.value("connectRetryDelayMs", cfg.connectRetryDelayMs);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties",
             {{"connectTimeoutMs",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", MAX_DURATION_MS},
                {"default", 10000}}},
              {"idleTimeoutMs",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", MAX_DURATION_MS},
                {"default", 30000}}},
              {"enableIdleReaper", {{"type", "boolean"}, {"default", true}}},
              {"idleCheckIntervalMs",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", MAX_DURATION_MS},
                {"default", 1000}}},
              {"connectAttempts",
               {{"type", "integer"},
                {"minimum", 1},
                {"maximum", 10},
                {"default", 1}}},
              {"connectRetryDelayMs",
               {{"type", "integer"},
                {"minimum", 0},
                {"maximum", MAX_DURATION_MS},
                {"default", 1000}}}}}};
    }
};

}  // namespace docflow::config

#endif  // DOCFLOW_CONFIG_SECTIONS_CONNECTION_CONFIG_HPP
