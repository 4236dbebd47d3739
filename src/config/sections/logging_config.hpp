/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Logging configuration section

**************************************************/

#ifndef DOCFLOW_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define DOCFLOW_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "../config_section.hpp"

namespace docflow::config {

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * {
 *   "docflow": {
 *     "logging": {
 *       "level": "info",
 *       "enableConsole": true,
 *       "enableFile": true,
 *       "logFile": "logs/docflow.log",
 *       "maxFileSize": 10485760,
 *       "maxFiles": 5
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/docflow/logging";

    std::string level{"info"};  ///< trace, debug, info, warn, error, critical, off
    std::string pattern{"[%H:%M:%S.%e] [%^%l%$] [%n] %v"};
    bool enableConsole{true};
    bool enableFile{false};
    std::string logFile{"logs/docflow.log"};
    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation
    size_t maxFiles{5};                    ///< Max number of rotated files

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"pattern", pattern},
                {"enableConsole", enableConsole},
                {"enableFile", enableFile},
                {"logFile", logFile},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logFile = j.value("logFile", cfg.logFile);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties",
             {{"level",
               {{"type", "string"},
                {"enum",
                 {"trace", "debug", "info", "warn", "error", "critical",
                  "off"}},
                {"default", "info"}}},
              {"pattern", {{"type", "string"}}},
              {"enableConsole", {{"type", "boolean"}, {"default", true}}},
              {"enableFile", {{"type", "boolean"}, {"default", false}}},
              {"logFile", {{"type", "string"}}},
              {"maxFileSize", {{"type", "integer"}, {"minimum", 1024}}},
              {"maxFiles", {{"type", "integer"}, {"minimum", 1}}}}}};
    }
};

}  // namespace docflow::config

#endif  // DOCFLOW_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
