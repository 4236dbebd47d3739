/*
 * credentials.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "credentials.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <format>

#include "error/error.hpp"

namespace docflow::storage {

namespace {

std::string readEnv(const std::string& variable) {
    const char* value = std::getenv(variable.c_str());
    return value ? std::string(value) : std::string();
}

}  // namespace

void StaticCredentialSupplier::set(const std::string& name,
                                   Credentials credentials) {
    std::lock_guard lock(mutex_);
    sets_[name] = std::move(credentials);
}

bool StaticCredentialSupplier::remove(const std::string& name) {
    std::lock_guard lock(mutex_);
    return sets_.erase(name) > 0;
}

Credentials StaticCredentialSupplier::getCredentials(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = sets_.find(name);
    if (it == sets_.end()) {
        THROW_VALIDATION_ERROR(
            std::format("Unknown credential set '{}'", name));
    }
    return it->second;
}

std::string EnvCredentialSupplier::variablePrefix(const std::string& name) {
    std::string prefix = "DOCFLOW_";
    for (unsigned char c : name) {
        prefix.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c))
                                         : '_');
    }
    prefix.push_back('_');
    return prefix;
}

Credentials EnvCredentialSupplier::getCredentials(const std::string& name) {
    const auto prefix = variablePrefix(name);
    Credentials credentials{readEnv(prefix + "CONNECTION_STRING"),
                            readEnv(prefix + "USERNAME"),
                            readEnv(prefix + "PASSWORD")};
    if (credentials.endpoint.empty() && credentials.username.empty() &&
        credentials.password.empty()) {
        spdlog::warn("No environment variables found for credential set '{}'",
                     name);
        THROW_VALIDATION_ERROR(std::format(
            "Unknown credential set '{}' (expected {}CONNECTION_STRING)", name,
            prefix));
    }
    return credentials;
}

}  // namespace docflow::storage
