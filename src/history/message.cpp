/*
 * message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "message.hpp"

#include <format>

#include "error/error.hpp"

namespace docflow::history {

json Message::toJson() const {
    return {{"type", role},
            {"data",
             {{"content", content}, {"additional_kwargs", additionalKwargs}}}};
}

Message Message::fromJson(const json& j) {
    if (!j.is_object()) {
        THROW_STORAGE_ERROR(
            ErrorKind::Internal,
            std::format("Stored message is not an object: {}", j.dump()));
    }

    Message message;
    message.role = j.value("type", std::string{});
    if (auto it = j.find("data"); it != j.end() && it->is_object()) {
        message.content = it->value("content", std::string{});
        message.additionalKwargs =
            it->value("additional_kwargs", json::object());
    }
    return message;
}

json messagesToJson(const std::vector<Message>& messages) {
    json array = json::array();
    for (const auto& message : messages) {
        array.push_back(message.toJson());
    }
    return array;
}

std::vector<Message> messagesFromJson(const json& array) {
    if (!array.is_array()) {
        THROW_STORAGE_ERROR(ErrorKind::Internal,
                            "Stored messages field is not an array");
    }

    std::vector<Message> messages;
    messages.reserve(array.size());
    for (const auto& item : array) {
        messages.push_back(Message::fromJson(item));
    }
    return messages;
}

}  // namespace docflow::history
