/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: CRTP base of the typed configuration sections

**************************************************/

#ifndef DOCFLOW_CONFIG_CONFIG_SECTION_HPP
#define DOCFLOW_CONFIG_CONFIG_SECTION_HPP

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace docflow::config {

using json = nlohmann::json;

/// Upper bound of every millisecond setting (SQLite takes timeouts as int)
inline constexpr std::int64_t MAX_DURATION_MS = 2147483647;

/**
 * @brief Requirements on a section struct.
 *
 * PATH is a JSON pointer into the whole configuration document, e.g.
 * "/docflow/retry".
 */
template <typename T>
concept ConfigSectionDerived = requires(T section, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { section.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief Shared JSON plumbing for configuration sections.
 *
 * Sections are plain aggregates with defaulted fields; deserialize() takes
 * every field it finds and keeps the default for the rest.
 *
 * @code
 * struct RetryConfig : ConfigSection<RetryConfig> {
 *     static constexpr std::string_view PATH = "/docflow/retry";
 *     int maxAttempts{3};
 *     json serialize() const;
 *     static RetryConfig deserialize(const json& j);
 *     static json generateSchema();
 * };
 * @endcode
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived&>(*this).serialize();
    }

    /**
     * @throws json::exception if a field has the wrong type
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @return The section, or nullopt if a field has the wrong type.
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(
        const json& j) noexcept {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Section stored at PATH inside a whole document; defaults when
     * the document has none.
     */
    [[nodiscard]] static Derived fromDocument(const json& document) {
        const json::json_pointer pointer{std::string(Derived::PATH)};
        if (!document.contains(pointer)) {
            return Derived{};
        }
        return Derived::deserialize(document.at(pointer));
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == other.toJson();
    }
};

}  // namespace docflow::config

#endif  // DOCFLOW_CONFIG_CONFIG_SECTION_HPP
