// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Docflow - Document storage connection and chat history library
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

/*
 * test_session_history_store.cpp
 *
 * Tests for SessionHistoryStore
 * - Round trips against the SQLite store
 * - Missing sessions read as empty and clear silently
 * - Context window reads of the most recent exchanges
 * - First-write fallback and the concurrent create and clear races
 *   (mocked collection)
 * - Error wrapping keeps the kind
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <format>
#include <memory>
#include <regex>
#include <string>
#include <thread>
#include <vector>

#include "history/session_history_store.hpp"
#include "storage/sqlite/sqlite_store.hpp"
#include "support/mock_storage.hpp"

using namespace docflow;
using namespace docflow::history;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

// ==================== SQLite-backed Tests ====================

class SessionHistoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage::sqlite::SqliteConnector connector;
        cluster_ = connector.connect({"sqlite://:memory:", "u", "p"}, 1000ms);
        collection_ = cluster_->collection({"chat", "_default", "history"});
    }

    void TearDown() override { cluster_->close(); }

    SessionHistoryStore store_;
    std::shared_ptr<storage::Cluster> cluster_;
    std::shared_ptr<storage::Collection> collection_;
};

TEST_F(SessionHistoryStoreTest, DocumentKeyUsesPrefix) {
    EXPECT_EQ(store_.documentKey("s1"), "chat_history::s1");

    config::HistoryConfig config;
    config.keyPrefix = "memory::";
    EXPECT_EQ(SessionHistoryStore(config).documentKey("s1"), "memory::s1");
}

TEST_F(SessionHistoryStoreTest, DocumentKeyRejectsBadIds) {
    EXPECT_THROW((void)store_.documentKey(""), ValidationError);
    EXPECT_THROW((void)store_.documentKey(std::string(300, 'x')),
                 ValidationError);
}

TEST_F(SessionHistoryStoreTest, UnknownSessionIsEmpty) {
    EXPECT_TRUE(store_.getMessages(*collection_, "unknown").empty());
}

TEST_F(SessionHistoryStoreTest, ClearUnknownSessionIsNotAnError) {
    EXPECT_NO_THROW(store_.clear(*collection_, "unknown"));
}

TEST_F(SessionHistoryStoreTest, FirstAppendCreatesDocument) {
    auto m1 = humanMessage("hello");
    store_.addMessages(*collection_, "s1", {m1});

    EXPECT_EQ(store_.getMessages(*collection_, "s1"),
              std::vector<Message>{m1});

    auto document = collection_->get("chat_history::s1").content;
    EXPECT_EQ(document["sessionId"], "s1");
    EXPECT_EQ(document["messages"].size(), 1u);
    EXPECT_TRUE(document["updatedAt"].is_string());
}

TEST_F(SessionHistoryStoreTest, AppendsPreserveOrder) {
    auto m1 = humanMessage("question");
    auto m2 = aiMessage("answer");
    auto m3 = humanMessage("follow up");

    store_.addMessages(*collection_, "s1", {m1});
    store_.addMessages(*collection_, "s1", {m2});
    store_.addMessage(*collection_, "s1", m3);

    EXPECT_EQ(store_.getMessages(*collection_, "s1"),
              (std::vector<Message>{m1, m2, m3}));
}

TEST_F(SessionHistoryStoreTest, SessionsAreIndependent) {
    store_.addMessage(*collection_, "s1", humanMessage("one"));
    store_.addMessage(*collection_, "s2", humanMessage("two"));

    store_.clear(*collection_, "s1");
    EXPECT_TRUE(store_.getMessages(*collection_, "s1").empty());
    ASSERT_EQ(store_.getMessages(*collection_, "s2").size(), 1u);
}

TEST_F(SessionHistoryStoreTest, ClearThenAppendStartsOver) {
    store_.addMessage(*collection_, "s1", humanMessage("old"));
    store_.clear(*collection_, "s1");
    store_.addMessage(*collection_, "s1", humanMessage("new"));

    auto messages = store_.getMessages(*collection_, "s1");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].content, "new");
}

TEST_F(SessionHistoryStoreTest, EmptyAppendDoesNotCreateDocument) {
    store_.addMessages(*collection_, "s1", {});
    EXPECT_THROW((void)collection_->get("chat_history::s1"), StorageError);
}

TEST_F(SessionHistoryStoreTest, ConcurrentWritersKeepAllMessages) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 10;

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                store_.addMessage(
                    *collection_, "shared",
                    humanMessage(std::to_string(t) + ":" + std::to_string(i)));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    auto messages = store_.getMessages(*collection_, "shared");
    EXPECT_EQ(messages.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(TimestampTest, IsIso8601Utc) {
    static const std::regex iso(
        R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(currentTimestamp(), iso))
        << currentTimestamp();
}

TEST_F(SessionHistoryStoreTest, RecentMessagesKeepLastExchanges) {
    std::vector<Message> all;
    for (int i = 0; i < 3; ++i) {
        all.push_back(humanMessage(std::format("q{}", i)));
        all.push_back(aiMessage(std::format("a{}", i)));
    }
    store_.addMessages(*collection_, "s1", all);

    // Window wider than the history
    EXPECT_EQ(store_.getRecentMessages(*collection_, "s1", 5), all);
    // Window exactly covering it
    EXPECT_EQ(store_.getRecentMessages(*collection_, "s1", 3), all);
    // Window narrower than the history
    EXPECT_EQ(store_.getRecentMessages(*collection_, "s1", 1),
              (std::vector<Message>{all[4], all[5]}));
    EXPECT_EQ(store_.getRecentMessages(*collection_, "s1", 2),
              (std::vector<Message>{all[2], all[3], all[4], all[5]}));
}

TEST_F(SessionHistoryStoreTest, RecentMessagesUseConfiguredWindow) {
    config::HistoryConfig config;
    config.contextWindowLength = 1;
    SessionHistoryStore store(config);

    store.addMessages(*collection_, "s1",
                      {humanMessage("q0"), aiMessage("a0"),
                       humanMessage("q1"), aiMessage("a1")});
    auto recent = store.getRecentMessages(*collection_, "s1");
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].content, "q1");
    EXPECT_EQ(recent[1].content, "a1");
}

TEST_F(SessionHistoryStoreTest, RecentMessagesRejectEmptyWindow) {
    EXPECT_THROW((void)store_.getRecentMessages(*collection_, "s1", 0),
                 ValidationError);
    EXPECT_TRUE(store_.getRecentMessages(*collection_, "unknown").empty());
}

// ==================== Mocked Collection Tests ====================

class SessionHistoryStoreMockTest : public ::testing::Test {
protected:
    test::MockCollection collection_;
    SessionHistoryStore store_;
};

TEST_F(SessionHistoryStoreMockTest, AppendUsesAtomicMutation) {
    EXPECT_CALL(collection_, mutateIn("chat_history::s1", _))
        .WillOnce([](const std::string&,
                     const std::vector<storage::MutateInSpec>& specs) {
            EXPECT_EQ(specs.size(), 2u);
            EXPECT_EQ(specs[0].operation,
                      storage::MutateInSpec::Operation::ArrayAppend);
            EXPECT_EQ(specs[0].path, "messages");
            EXPECT_EQ(specs[1].operation,
                      storage::MutateInSpec::Operation::Upsert);
            EXPECT_EQ(specs[1].path, "updatedAt");
            return storage::MutationResult{2};
        });
    EXPECT_CALL(collection_, insert(_, _)).Times(0);
    EXPECT_CALL(collection_, upsert(_, _)).Times(0);

    store_.addMessage(collection_, "s1", humanMessage("hi"));
}

TEST_F(SessionHistoryStoreMockTest, ConcurrentCreateFallsBackToAppend) {
    InSequence seq;
    EXPECT_CALL(collection_, mutateIn("chat_history::s1", _))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, get("chat_history::s1"))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, insert("chat_history::s1", _))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentExists)));
    EXPECT_CALL(collection_, mutateIn("chat_history::s1", _))
        .WillOnce(Return(storage::MutationResult{3}));

    EXPECT_NO_THROW(store_.addMessage(collection_, "s1", humanMessage("hi")));
}

TEST_F(SessionHistoryStoreMockTest, ClearDuringConcurrentCreateCreatesAgain) {
    InSequence seq;
    EXPECT_CALL(collection_, mutateIn("chat_history::s1", _))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, get("chat_history::s1"))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, insert("chat_history::s1", _))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentExists)));
    EXPECT_CALL(collection_, mutateIn("chat_history::s1", _))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, get("chat_history::s1"))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, insert("chat_history::s1", _))
        .WillOnce([](const std::string&, const storage::json& document) {
            EXPECT_EQ(document["messages"].size(), 1u);
            return storage::MutationResult{1};
        });

    EXPECT_NO_THROW(store_.addMessage(collection_, "s1", humanMessage("hi")));
}

TEST_F(SessionHistoryStoreMockTest, SessionThatKeepsChangingIsTemporaryFailure) {
    EXPECT_CALL(collection_, mutateIn(_, _))
        .Times(2)
        .WillRepeatedly(
            Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, get(_))
        .Times(2)
        .WillRepeatedly(
            Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, insert(_, _))
        .Times(2)
        .WillRepeatedly(Throw(test::storageError(ErrorKind::DocumentExists)));

    try {
        store_.addMessage(collection_, "s1", humanMessage("hi"));
        FAIL() << "Expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TemporaryFailure);
        EXPECT_THAT(e.message(), HasSubstr("chat_history::s1"));
    }
}

TEST_F(SessionHistoryStoreMockTest, FallbackCreateWritesFullDocument) {
    EXPECT_CALL(collection_, mutateIn(_, _))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, get(_))
        .WillOnce(Throw(test::storageError(ErrorKind::DocumentNotFound)));
    EXPECT_CALL(collection_, insert("chat_history::s1", _))
        .WillOnce([](const std::string&, const storage::json& document) {
            EXPECT_EQ(document["sessionId"], "s1");
            EXPECT_EQ(document["messages"].size(), 2u);
            EXPECT_TRUE(document.contains("updatedAt"));
            return storage::MutationResult{1};
        });

    store_.addMessages(collection_, "s1",
                       {humanMessage("q"), aiMessage("a")});
}

TEST_F(SessionHistoryStoreMockTest, AppendFailureKeepsKindAndAddsContext) {
    EXPECT_CALL(collection_, mutateIn(_, _))
        .WillOnce(Throw(test::storageError(ErrorKind::Timeout, "slow")));

    try {
        store_.addMessage(collection_, "s1", humanMessage("hi"));
        FAIL() << "Expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
        EXPECT_THAT(e.message(), HasSubstr("chat_history::s1"));
        EXPECT_THAT(e.message(), HasSubstr("slow"));
    }
}

TEST_F(SessionHistoryStoreMockTest, ReadFailurePropagates) {
    EXPECT_CALL(collection_, get(_))
        .WillOnce(Throw(test::storageError(ErrorKind::Internal, "corrupt")));

    try {
        (void)store_.getMessages(collection_, "s1");
        FAIL() << "Expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Internal);
        EXPECT_THAT(e.message(), HasSubstr("Failed to read chat history"));
    }
}

TEST_F(SessionHistoryStoreMockTest, ClearFailurePropagates) {
    EXPECT_CALL(collection_, remove(_))
        .WillOnce(Throw(test::storageError(ErrorKind::TemporaryFailure)));
    EXPECT_THROW(store_.clear(collection_, "s1"), StorageError);
}

TEST_F(SessionHistoryStoreMockTest, MalformedMessagesNameTheSession) {
    EXPECT_CALL(collection_, get(_))
        .WillOnce(Return(storage::GetResult{
            {{"sessionId", "s1"}, {"messages", "not an array"}}, 1}));

    try {
        (void)store_.getMessages(collection_, "s1");
        FAIL() << "Expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Internal);
        EXPECT_THAT(e.message(),
                    HasSubstr("Failed to read chat history chat_history::s1"));
    }

    EXPECT_CALL(collection_, get(_))
        .WillOnce(Return(storage::GetResult{
            {{"messages", {{{"type", 42}}}}}, 2}));
    try {
        (void)store_.getMessages(collection_, "s1");
        FAIL() << "Expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Internal);
        EXPECT_THAT(e.message(), HasSubstr("chat_history::s1"));
    }
}

TEST_F(SessionHistoryStoreMockTest, DocumentWithoutMessagesReadsEmpty) {
    EXPECT_CALL(collection_, get(_))
        .WillOnce(Return(storage::GetResult{{{"sessionId", "s1"}}, 1}));
    EXPECT_TRUE(store_.getMessages(collection_, "s1").empty());
}
