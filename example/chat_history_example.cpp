/*
 * chat_history_example.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Records a short conversation in a SQLite-backed session
history and prints it back

Usage: docflow_chat_history_example [config.json] [session-id]

**************************************************/

#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "docflow.hpp"

using namespace docflow;

int main(int argc, char** argv) {
    try {
        auto config = argc > 1 ? config::loadConfig(argv[1])
                               : config::DocflowConfig{};
        if (argc <= 1) {
            config::applyEnvironmentOverrides(config);
        }
        logging::LogConfig::initialize(config.logging);

        auto sessionId = history::resolveSessionId(argc > 2 ? argv[2] : "demo");

        auto credentials = std::make_shared<storage::StaticCredentialSupplier>();
        credentials->set("chat", {"sqlite://chat_history.db", "demo", "demo"});

        auto manager = createConnectionManager(config.connection, credentials);
        auto collection =
            manager->openCollection(std::string("chat"), {"chat", "", "history"});

        SessionHistoryStore store(config.history);
        auto retrier = RetryExecutor().makeRetrier(config.retry.toOptions());

        // Appends are not idempotent, so only reads go through the retrier
        store.addMessages(*collection, sessionId,
                          {history::humanMessage("What is docflow?"),
                           history::aiMessage("A chat history store with "
                                              "connection caching.")});

        auto messages = retrier(
            [&] { return store.getRecentMessages(*collection, sessionId); });
        for (const auto& message : messages) {
            std::cout << message.role << ": " << message.content << '\n';
        }

        manager->close();
        logging::LogConfig::flushAll();
    } catch (const ConnectionError& e) {
        spdlog::critical("{} {}", e.message(), e.description());
        return 2;
    } catch (const std::exception& e) {
        spdlog::critical("docflow example failed: {}", e.what());
        return 1;
    }
    return 0;
}
