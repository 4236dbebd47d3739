/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Loads the docflow configuration document from disk and the
environment

**************************************************/

#ifndef DOCFLOW_CONFIG_CONFIG_LOADER_HPP
#define DOCFLOW_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>

#include "sections/connection_config.hpp"
#include "sections/history_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/retry_config.hpp"

namespace docflow::config {

/// Overrides ConnectionConfig::connectTimeoutMs
inline constexpr const char* ENV_CONNECTION_TIMEOUT_MS =
    "DOCFLOW_CONNECTION_TIMEOUT_MS";

/// Overrides ConnectionConfig::idleTimeoutMs
inline constexpr const char* ENV_IDLE_TIMEOUT_MS = "DOCFLOW_IDLE_TIMEOUT_MS";

/**
 * @brief Every configuration section of the library.
 */
struct DocflowConfig {
    ConnectionConfig connection;
    RetryConfig retry;
    HistoryConfig history;
    LoggingConfig logging;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static DocflowConfig fromJson(const json& document);
};

/**
 * @brief Read a JSON configuration file and apply environment overrides.
 *
 * @param path File holding a document with a top-level "docflow" object.
 * @throws ConfigIOException if the file cannot be read
 * @throws InvalidConfigException if it is not valid JSON or holds values of
 * the wrong type or outside the range the section schema declares
 */
[[nodiscard]] DocflowConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief Apply DOCFLOW_* environment variables on top of config.
 *
 * @throws InvalidConfigException if a variable is not an integer from 1 to
 * MAX_DURATION_MS
 */
void applyEnvironmentOverrides(DocflowConfig& config);

}  // namespace docflow::config

#endif  // DOCFLOW_CONFIG_CONFIG_LOADER_HPP
