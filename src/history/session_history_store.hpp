/*
 * session_history_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Per-session chat history persisted as one document per session

**************************************************/

#ifndef DOCFLOW_HISTORY_SESSION_HISTORY_STORE_HPP
#define DOCFLOW_HISTORY_SESSION_HISTORY_STORE_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "config/sections/history_config.hpp"
#include "message.hpp"
#include "storage/storage.hpp"

namespace docflow::history {

/**
 * @brief Reads, appends to and clears session documents.
 *
 * A session document lives under HistoryConfig::keyPrefix + sessionId and
 * holds {sessionId, messages, updatedAt}. It is created by the first
 * append. Appends use the store's atomic sub-document array append, so
 * concurrent writers to one session never lose each other's messages.
 *
 * Storage failures other than the absorbed DocumentNotFound cases are
 * rethrown as StorageError of the same kind with the operation and key
 * prefixed to the message.
 */
class SessionHistoryStore {
public:
    explicit SessionHistoryStore(config::HistoryConfig config = {});

    /**
     * @brief Document key for a session.
     * @throws ValidationError if the id is empty or the key too long
     */
    [[nodiscard]] std::string documentKey(std::string_view sessionId) const;

    /**
     * @brief All messages of a session in append order.
     *
     * @return Empty if the session has no document.
     */
    [[nodiscard]] std::vector<Message> getMessages(
        storage::Collection& collection, std::string_view sessionId) const;

    /**
     * @brief The last k exchanges of a session.
     *
     * An exchange is a human message and its answer, so this returns at most
     * 2 * k messages, oldest first.
     *
     * @throws ValidationError if k is zero
     */
    [[nodiscard]] std::vector<Message> getRecentMessages(
        storage::Collection& collection, std::string_view sessionId,
        std::size_t k) const;

    /**
     * @brief getRecentMessages() with HistoryConfig::contextWindowLength.
     */
    [[nodiscard]] std::vector<Message> getRecentMessages(
        storage::Collection& collection, std::string_view sessionId) const;

    /**
     * @brief Append messages, creating the session document on first use.
     *
     * A create that loses to another writer appends to that writer's
     * document, and an append that finds the document cleared creates it
     * again. Each of these races is retried once; a session that keeps
     * changing raises StorageError (TemporaryFailure).
     */
    void addMessages(storage::Collection& collection,
                     std::string_view sessionId,
                     const std::vector<Message>& messages) const;

    void addMessage(storage::Collection& collection,
                    std::string_view sessionId, const Message& message) const;

    /**
     * @brief Delete the session document; missing documents are ignored.
     */
    void clear(storage::Collection& collection,
               std::string_view sessionId) const;

    [[nodiscard]] const config::HistoryConfig& config() const noexcept {
        return config_;
    }

private:
    /// False if the document does not exist
    bool appendToDocument(storage::Collection& collection,
                          const std::string& key,
                          const json& messages) const;

    /// False if another writer created the document first
    bool createDocument(storage::Collection& collection,
                        std::string_view sessionId, const std::string& key,
                        const std::vector<Message>& messages) const;

    config::HistoryConfig config_;
};

/**
 * @brief Current UTC time as ISO-8601 with milliseconds, e.g.
 * 2026-10-19T08:30:00.250Z.
 */
[[nodiscard]] std::string currentTimestamp();

}  // namespace docflow::history

#endif  // DOCFLOW_HISTORY_SESSION_HISTORY_STORE_HPP
