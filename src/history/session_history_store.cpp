/*
 * session_history_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session_history_store.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <format>
#include <utility>

#include "error/error.hpp"

namespace docflow::history {

namespace {

std::vector<storage::MutateInSpec> appendSpecs(const json& messages) {
    return {storage::MutateInSpec::arrayAppend("messages", messages),
            storage::MutateInSpec::upsert("updatedAt", currentTimestamp())};
}

}  // namespace

std::string currentTimestamp() {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}

SessionHistoryStore::SessionHistoryStore(config::HistoryConfig config)
    : config_(std::move(config)) {}

std::string SessionHistoryStore::documentKey(
    std::string_view sessionId) const {
    if (sessionId.empty()) {
        THROW_VALIDATION_ERROR(
            "Session ID is missing. Please ensure a valid Session ID is "
            "provided.");
    }
    auto key = std::format("{}{}", config_.keyPrefix, sessionId);
    storage::validateDocumentId(key);
    return key;
}

std::vector<Message> SessionHistoryStore::getMessages(
    storage::Collection& collection, std::string_view sessionId) const {
    const auto key = documentKey(sessionId);

    storage::GetResult result;
    try {
        result = collection.get(key);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::DocumentNotFound) {
            return {};
        }
        rethrowWithContext(e, std::format("Failed to read chat history {}",
                                          key));
    }

    auto it = result.content.find("messages");
    if (it == result.content.end()) {
        return {};
    }
    try {
        return messagesFromJson(*it);
    } catch (const Error& e) {
        rethrowWithContext(e, std::format("Failed to read chat history {}",
                                          key));
    } catch (const json::exception& e) {
        THROW_STORAGE_ERROR(
            ErrorKind::Internal,
            std::format("Failed to read chat history {}: {}", key, e.what()));
    }
}

std::vector<Message> SessionHistoryStore::getRecentMessages(
    storage::Collection& collection, std::string_view sessionId,
    std::size_t k) const {
    if (k == 0) {
        THROW_VALIDATION_ERROR("Context window length must be at least 1");
    }

    auto messages = getMessages(collection, sessionId);
    const std::size_t window = 2 * k;
    if (messages.size() > window) {
        messages.erase(messages.begin(),
                       messages.end() - static_cast<std::ptrdiff_t>(window));
    }
    return messages;
}

std::vector<Message> SessionHistoryStore::getRecentMessages(
    storage::Collection& collection, std::string_view sessionId) const {
    return getRecentMessages(collection, sessionId,
                             config_.contextWindowLength);
}

void SessionHistoryStore::addMessages(
    storage::Collection& collection, std::string_view sessionId,
    const std::vector<Message>& messages) const {
    const auto key = documentKey(sessionId);
    if (messages.empty()) {
        return;
    }

    const auto stored = messagesToJson(messages);
    if (appendToDocument(collection, key, stored)) {
        spdlog::debug("SessionHistoryStore: appended {} message(s) to {}",
                      messages.size(), key);
        return;
    }

    // First write to this session
    if (createDocument(collection, sessionId, key, messages)) {
        return;
    }

    spdlog::debug("SessionHistoryStore: {} was created concurrently, "
                  "appending instead",
                  key);
    if (appendToDocument(collection, key, stored)) {
        return;
    }

    // Cleared between the other writer's create and our append
    spdlog::debug("SessionHistoryStore: {} was cleared concurrently, "
                  "creating it again",
                  key);
    if (createDocument(collection, sessionId, key, messages)) {
        return;
    }

    THROW_STORAGE_ERROR(
        ErrorKind::TemporaryFailure,
        std::format("Failed to append messages to {}: the document kept "
                    "changing concurrently",
                    key));
}

bool SessionHistoryStore::appendToDocument(storage::Collection& collection,
                                           const std::string& key,
                                           const json& messages) const {
    try {
        collection.mutateIn(key, appendSpecs(messages));
        return true;
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::DocumentNotFound) {
            rethrowWithContext(
                e, std::format("Failed to append messages to {}", key));
        }
    }
    return false;
}

bool SessionHistoryStore::createDocument(
    storage::Collection& collection, std::string_view sessionId,
    const std::string& key, const std::vector<Message>& messages) const {
    auto all = getMessages(collection, sessionId);
    all.insert(all.end(), messages.begin(), messages.end());
    const json document = {{"sessionId", std::string(sessionId)},
                           {"messages", messagesToJson(all)},
                           {"updatedAt", currentTimestamp()}};
    try {
        collection.insert(key, document);
        spdlog::info("SessionHistoryStore: created chat history {}", key);
        return true;
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::DocumentExists) {
            rethrowWithContext(
                e, std::format("Failed to create chat history {}", key));
        }
    }
    return false;
}

void SessionHistoryStore::addMessage(storage::Collection& collection,
                                     std::string_view sessionId,
                                     const Message& message) const {
    addMessages(collection, sessionId, std::vector<Message>{message});
}

void SessionHistoryStore::clear(storage::Collection& collection,
                                std::string_view sessionId) const {
    const auto key = documentKey(sessionId);
    try {
        collection.remove(key);
        spdlog::info("SessionHistoryStore: cleared chat history {}", key);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::DocumentNotFound) {
            return;
        }
        rethrowWithContext(e,
                           std::format("Failed to clear chat history {}", key));
    }
}

}  // namespace docflow::history
