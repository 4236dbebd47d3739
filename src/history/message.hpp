/*
 * message.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DOCFLOW_HISTORY_MESSAGE_HPP
#define DOCFLOW_HISTORY_MESSAGE_HPP

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace docflow::history {

using json = nlohmann::json;

/**
 * @brief One chat message as persisted in a session document.
 *
 * Stored as {"type": role, "data": {"content": ..., "additional_kwargs":
 * {...}}}. The store only keeps the order of messages and never looks at
 * their fields.
 */
struct Message {
    std::string role;     ///< "human", "ai", "system", ...
    std::string content;
    json additionalKwargs = json::object();

    [[nodiscard]] json toJson() const;

    /**
     * @brief Read a stored message; missing fields default to empty.
     * @throws StorageError (Internal) if the value is not an object
     */
    [[nodiscard]] static Message fromJson(const json& j);

    bool operator==(const Message&) const = default;
};

[[nodiscard]] inline Message humanMessage(std::string content) {
    return Message{"human", std::move(content)};
}

[[nodiscard]] inline Message aiMessage(std::string content) {
    return Message{"ai", std::move(content)};
}

/**
 * @brief Stored array form of a message sequence, in order.
 */
[[nodiscard]] json messagesToJson(const std::vector<Message>& messages);

/**
 * @throws StorageError (Internal) if the value is not an array of objects
 */
[[nodiscard]] std::vector<Message> messagesFromJson(const json& array);

}  // namespace docflow::history

#endif  // DOCFLOW_HISTORY_MESSAGE_HPP
