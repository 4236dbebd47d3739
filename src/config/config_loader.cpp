/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <string>

#include "exception.hpp"

namespace docflow::config {

namespace {

template <typename Section>
void insertSection(json& document, const Section& section) {
    document[json::json_pointer(std::string(Section::PATH))] =
        section.toJson();
}

/**
 * Checks the section stored at Section::PATH against the type, range,
 * length and enum rules its schema declares. j.value() converts a negative
 * number into a huge unsigned field, so this runs before deserializing.
 */
template <typename Section>
void checkAgainstSchema(const json& document) {
    const json::json_pointer pointer{std::string(Section::PATH)};
    if (!document.contains(pointer)) {
        return;
    }
    const json& values = document.at(pointer);
    if (!values.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION(
            std::format("{} must be an object", Section::PATH));
    }

    const json schema = Section::schema();
    for (const auto& property : schema.at("properties").items()) {
        auto it = values.find(property.key());
        if (it == values.end()) {
            continue;
        }
        const json& rules = property.value();
        const auto field = std::format("{}/{}", Section::PATH, property.key());

        if (rules.value("type", std::string{}) == "integer" && !it->is_number_integer()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("{} must be an integer, got {}", field, it->dump()));
        }
        if (it->is_number()) {
            const auto value = it->get<double>();
            if (rules.contains("minimum") &&
                value < rules.at("minimum").get<double>()) {
                THROW_INVALID_CONFIG_EXCEPTION(
                    std::format("{} must be at least {}, got {}", field,
                                rules.at("minimum").dump(), it->dump()));
            }
            if (rules.contains("maximum") &&
                value > rules.at("maximum").get<double>()) {
                THROW_INVALID_CONFIG_EXCEPTION(
                    std::format("{} must be at most {}, got {}", field,
                                rules.at("maximum").dump(), it->dump()));
            }
        }
        if (it->is_string() && rules.contains("minLength") &&
            it->get_ref<const std::string&>().size() <
                rules.at("minLength").get<size_t>()) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("{} must not be empty", field));
        }
        if (rules.contains("enum")) {
            const auto& allowed = rules.at("enum");
            if (std::find(allowed.begin(), allowed.end(), *it) ==
                allowed.end()) {
                THROW_INVALID_CONFIG_EXCEPTION(
                    std::format("{} must be one of {}, got {}", field,
                                allowed.dump(), it->dump()));
            }
        }
    }
}

/// Parses a positive integer environment variable; returns false if unset.
bool readPositiveEnv(const char* name, size_t& out) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return false;
    }

    std::string_view text(raw);
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0 ||
        value > static_cast<size_t>(MAX_DURATION_MS)) {
        THROW_INVALID_CONFIG_EXCEPTION(std::format(
            "Environment variable {} must be an integer from 1 to {}, got '{}'",
            name, MAX_DURATION_MS, text));
    }
    out = value;
    return true;
}

}  // namespace

json DocflowConfig::toJson() const {
    json document = json::object();
    insertSection(document, connection);
    insertSection(document, retry);
    insertSection(document, history);
    insertSection(document, logging);
    return document;
}

DocflowConfig DocflowConfig::fromJson(const json& document) {
    DocflowConfig config;
    try {
        checkAgainstSchema<ConnectionConfig>(document);
        checkAgainstSchema<RetryConfig>(document);
        checkAgainstSchema<HistoryConfig>(document);
        checkAgainstSchema<LoggingConfig>(document);

        config.connection = ConnectionConfig::fromDocument(document);
        config.retry = RetryConfig::fromDocument(document);
        config.history = HistoryConfig::fromDocument(document);
        config.logging = LoggingConfig::fromDocument(document);
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION(
            std::format("Invalid configuration value: {}", e.what()));
    }
    return config;
}

DocflowConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONFIG_IO_EXCEPTION(
            std::format("Cannot open configuration file {}", path.string()));
    }

    json document;
    try {
        document = json::parse(file, nullptr, true, true);
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIG_EXCEPTION(std::format(
            "Configuration file {} is not valid JSON: {}", path.string(),
            e.what()));
    }

    auto config = DocflowConfig::fromJson(document);
    applyEnvironmentOverrides(config);
    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

void applyEnvironmentOverrides(DocflowConfig& config) {
    if (readPositiveEnv(ENV_CONNECTION_TIMEOUT_MS,
                        config.connection.connectTimeoutMs)) {
        spdlog::debug("{} overrides connect timeout: {}ms",
                      ENV_CONNECTION_TIMEOUT_MS,
                      config.connection.connectTimeoutMs);
    }
    if (readPositiveEnv(ENV_IDLE_TIMEOUT_MS, config.connection.idleTimeoutMs)) {
        spdlog::debug("{} overrides idle timeout: {}ms", ENV_IDLE_TIMEOUT_MS,
                      config.connection.idleTimeoutMs);
    }
}

}  // namespace docflow::config
