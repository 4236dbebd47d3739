/*
 * history_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DOCFLOW_CONFIG_SECTIONS_HISTORY_CONFIG_HPP
#define DOCFLOW_CONFIG_SECTIONS_HISTORY_CONFIG_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "../config_section.hpp"

namespace docflow::config {

/**
 * @brief Chat history store configuration
 */
struct HistoryConfig : ConfigSection<HistoryConfig> {
    /// Configuration path
    static constexpr std::string_view PATH = "/docflow/history";

    /// Prefix of every session document key
    std::string keyPrefix{"chat_history::"};

    /// Exchanges returned by SessionHistoryStore::getRecentMessages
    size_t contextWindowLength{5};

    [[nodiscard]] json serialize() const {
        return {{"keyPrefix", keyPrefix},
                {"contextWindowLength", contextWindowLength}};
    }

    [[nodiscard]] static HistoryConfig deserialize(const json& j) {
        HistoryConfig cfg;
        cfg.keyPrefix = j.value("keyPrefix", cfg.keyPrefix);
        cfg.contextWindowLength =
            j.value("contextWindowLength", cfg.contextWindowLength);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {{"type", "object"},
                {"properties",
                 {{"keyPrefix",
                   {{"type", "string"},
                    {"minLength", 1},
                    {"default", "chat_history::"}}},
                  {"contextWindowLength",
                   {{"type", "integer"},
                    {"minimum", 1},
                    {"maximum", 1000},
                    {"default", 5}}}}}};
    }
};

}  // namespace docflow::config

#endif  // DOCFLOW_CONFIG_SECTIONS_HISTORY_CONFIG_HPP
