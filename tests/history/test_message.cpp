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
 * test_message.cpp
 *
 * Tests for chat message conversion and session id resolution
 */

#include <gtest/gtest.h>

#include "history/message.hpp"
#include "history/session_id.hpp"
#include "error/error.hpp"

using namespace docflow;
using namespace docflow::history;

TEST(MessageTest, StoredLayout) {
    Message message{"human", "hello", {{"name", "alice"}}};
    EXPECT_EQ(message.toJson(),
              (json{{"type", "human"},
                    {"data",
                     {{"content", "hello"},
                      {"additional_kwargs", {{"name", "alice"}}}}}}));
}

TEST(MessageTest, ReadsStoredLayout) {
    json stored = {{"type", "ai"},
                   {"data", {{"content", "hi"}, {"additional_kwargs", {}}}}};
    auto message = Message::fromJson(stored);
    EXPECT_EQ(message.role, "ai");
    EXPECT_EQ(message.content, "hi");
}

TEST(MessageTest, MissingFieldsDefaultToEmpty) {
    auto message = Message::fromJson(json::object());
    EXPECT_TRUE(message.role.empty());
    EXPECT_TRUE(message.content.empty());
    EXPECT_TRUE(message.additionalKwargs.is_object());
}

TEST(MessageTest, MalformedValuesAreInternalErrors) {
    EXPECT_THROW((void)Message::fromJson(json("text")), StorageError);
    EXPECT_THROW((void)messagesFromJson(json::object()), StorageError);
}

TEST(MessageTest, SequenceKeepsOrder) {
    std::vector<Message> messages{humanMessage("q"), aiMessage("a"),
                                  humanMessage("q2")};
    auto stored = messagesToJson(messages);
    ASSERT_EQ(stored.size(), 3u);
    EXPECT_EQ(messagesFromJson(stored), messages);
}

TEST(SessionIdTest, TrimsWhitespace) {
    EXPECT_EQ(resolveSessionId("  s1\t\n"), "s1");
    EXPECT_EQ(resolveSessionId("a b"), "a b");
}

TEST(SessionIdTest, RejectsBlankIds) {
    try {
        (void)resolveSessionId(" \t ");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.message(),
                  "Session ID is missing. Please ensure a valid Session ID is "
                  "provided.");
    }
    EXPECT_THROW((void)resolveSessionId(""), ValidationError);
}
