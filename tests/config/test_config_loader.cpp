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
 * test_config_loader.cpp
 *
 * Tests for configuration sections and the loader
 * - Section defaults and JSON pointer lookup
 * - Document round trip
 * - File loading errors
 * - Environment overrides
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "config/config_loader.hpp"
#include "config/exception.hpp"

using namespace docflow::config;
using namespace std::chrono_literals;

TEST(ConfigSectionTest, Defaults) {
    ConnectionConfig connection;
    EXPECT_EQ(connection.connectTimeout(), 10000ms);
    EXPECT_EQ(connection.idleTimeout(), 30000ms);
    EXPECT_EQ(connection.connectAttempts, 1);

    RetryConfig retry;
    auto options = retry.toOptions();
    EXPECT_EQ(options.maxAttempts, 3);
    EXPECT_EQ(options.initialDelay, 1000ms);
    EXPECT_DOUBLE_EQ(*options.backoffMultiplier, 2.0);

    EXPECT_EQ(HistoryConfig{}.keyPrefix, "chat_history::");
    EXPECT_EQ(HistoryConfig{}.contextWindowLength, 5u);
    EXPECT_EQ(LoggingConfig{}.level, "info");
}

TEST(ConfigSectionTest, PathsAndSchemas) {
    EXPECT_EQ(ConnectionConfig::path(), "/docflow/connection");
    EXPECT_EQ(RetryConfig::path(), "/docflow/retry");
    EXPECT_EQ(HistoryConfig::path(), "/docflow/history");
    EXPECT_EQ(LoggingConfig::path(), "/docflow/logging");

    auto schema = ConnectionConfig::schema();
    EXPECT_EQ(schema["type"], "object");
    EXPECT_TRUE(schema["properties"].contains("idleTimeoutMs"));
}

TEST(ConfigSectionTest, FromDocumentReadsNestedSection) {
    json document = {
        {"docflow", {{"connection", {{"idleTimeoutMs", 500}}}}}};

    auto connection = ConnectionConfig::fromDocument(document);
    EXPECT_EQ(connection.idleTimeoutMs, 500u);
    // Unspecified fields keep their defaults
    EXPECT_EQ(connection.connectTimeoutMs, 10000u);

    // Missing section yields defaults
    EXPECT_EQ(RetryConfig::fromDocument(document), RetryConfig{});
}

TEST(ConfigSectionTest, TryFromJsonRejectsWrongTypes) {
    EXPECT_FALSE(
        ConnectionConfig::tryFromJson({{"idleTimeoutMs", "soon"}}).has_value());
    EXPECT_TRUE(ConnectionConfig::tryFromJson(json::object()).has_value());
}

TEST(DocflowConfigTest, RoundTrip) {
    DocflowConfig config;
    config.connection.idleTimeoutMs = 1234;
    config.retry.maxAttempts = 5;
    config.history.keyPrefix = "memory::";
    config.logging.level = "debug";

    auto restored = DocflowConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.connection, config.connection);
    EXPECT_EQ(restored.retry, config.retry);
    EXPECT_EQ(restored.history, config.history);
    EXPECT_EQ(restored.logging, config.logging);
}

TEST(DocflowConfigTest, WrongValueTypeIsInvalidConfig) {
    json document = {{"docflow", {{"retry", {{"maxAttempts", "three"}}}}}};
    EXPECT_THROW(DocflowConfig::fromJson(document), InvalidConfigException);
}

TEST(DocflowConfigTest, NegativeDurationIsOutOfRange) {
    json document = {{"docflow", {{"connection", {{"idleTimeoutMs", -1}}}}}};
    try {
        (void)DocflowConfig::fromJson(document);
        FAIL() << "Expected InvalidConfigException";
    } catch (const InvalidConfigException& e) {
        EXPECT_NE(std::string(e.what()).find("idleTimeoutMs"),
                  std::string::npos);
    }

    document = {{"docflow", {{"connection", {{"connectTimeoutMs", -5000}}}}}};
    EXPECT_THROW(DocflowConfig::fromJson(document), InvalidConfigException);
}

TEST(DocflowConfigTest, ValuesOutsideSchemaBoundsAreRejected) {
    const json cases[] = {
        {{"docflow", {{"connection", {{"connectTimeoutMs", 0}}}}}},
        {{"docflow",
          {{"connection", {{"connectTimeoutMs", 4294967296LL}}}}}},
        {{"docflow", {{"connection", {{"idleCheckIntervalMs", 1.5}}}}}},
        {{"docflow", {{"connection", {{"connectAttempts", 11}}}}}},
        {{"docflow", {{"retry", {{"initialDelayMs", -1}}}}}},
        {{"docflow", {{"retry", {{"multiplier", 0.5}}}}}},
        {{"docflow", {{"history", {{"contextWindowLength", 0}}}}}},
        {{"docflow", {{"history", {{"keyPrefix", ""}}}}}},
        {{"docflow", {{"logging", {{"maxFiles", -1}}}}}},
        {{"docflow", {{"logging", {{"level", "verbose"}}}}}},
        {{"docflow", {{"retry", 3}}}},
    };
    for (const auto& document : cases) {
        EXPECT_THROW(DocflowConfig::fromJson(document), InvalidConfigException)
            << document.dump();
    }
}

TEST(DocflowConfigTest, BoundaryValuesAreAccepted) {
    json document = {
        {"docflow",
         {{"connection",
           {{"connectTimeoutMs", MAX_DURATION_MS}, {"idleTimeoutMs", 1}}},
          {"retry", {{"initialDelayMs", 0}, {"multiplier", 1.0}}},
          {"history", {{"contextWindowLength", 1}}}}}};

    auto config = DocflowConfig::fromJson(document);
    EXPECT_EQ(config.connection.connectTimeoutMs,
              static_cast<size_t>(MAX_DURATION_MS));
    EXPECT_EQ(config.connection.idleTimeoutMs, 1u);
    EXPECT_EQ(config.history.contextWindowLength, 1u);
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                "docflow_config_loader_test.json";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        unsetenv(ENV_CONNECTION_TIMEOUT_MS);
        unsetenv(ENV_IDLE_TIMEOUT_MS);
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigLoaderTest, LoadsFile) {
    write(R"({
        // comments are allowed
        "docflow": {
            "connection": {"idleTimeoutMs": 45000},
            "history": {"keyPrefix": "sessions::"}
        }
    })");

    auto config = loadConfig(path_);
    EXPECT_EQ(config.connection.idleTimeoutMs, 45000u);
    EXPECT_EQ(config.history.keyPrefix, "sessions::");
    EXPECT_EQ(config.retry.maxAttempts, 3);
}

TEST_F(ConfigLoaderTest, MissingFileIsIOError) {
    EXPECT_THROW(loadConfig(path_), ConfigIOException);
}

TEST_F(ConfigLoaderTest, MalformedFileIsInvalidConfig) {
    write("{ not json");
    EXPECT_THROW(loadConfig(path_), InvalidConfigException);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesApply) {
    write(R"({"docflow": {"connection": {"idleTimeoutMs": 45000}}})");
    setenv(ENV_CONNECTION_TIMEOUT_MS, "2500", 1);
    setenv(ENV_IDLE_TIMEOUT_MS, "60000", 1);

    auto config = loadConfig(path_);
    EXPECT_EQ(config.connection.connectTimeoutMs, 2500u);
    EXPECT_EQ(config.connection.idleTimeoutMs, 60000u);
}

TEST_F(ConfigLoaderTest, MalformedEnvironmentValueIsRejected) {
    DocflowConfig config;
    setenv(ENV_IDLE_TIMEOUT_MS, "30s", 1);
    EXPECT_THROW(applyEnvironmentOverrides(config), InvalidConfigException);

    setenv(ENV_IDLE_TIMEOUT_MS, "0", 1);
    EXPECT_THROW(applyEnvironmentOverrides(config), BadConfigException);

    setenv(ENV_IDLE_TIMEOUT_MS, "18446744073709551615", 1);
    EXPECT_THROW(applyEnvironmentOverrides(config), InvalidConfigException);
    EXPECT_EQ(config.connection.idleTimeoutMs, 30000u);
}
