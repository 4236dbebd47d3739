/*
 * credentials.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Credential suppliers backed by memory or the environment

**************************************************/

#ifndef DOCFLOW_STORAGE_CREDENTIALS_HPP
#define DOCFLOW_STORAGE_CREDENTIALS_HPP

#include <mutex>
#include <string>
#include <unordered_map>

#include "storage.hpp"

namespace docflow::storage {

/**
 * @brief Supplier holding credential sets registered at runtime.
 *
 * Replacing a set between two acquisitions makes the connection manager
 * reconnect with the new values.
 */
class StaticCredentialSupplier : public CredentialSupplier {
public:
    StaticCredentialSupplier() = default;

    void set(const std::string& name, Credentials credentials);
    bool remove(const std::string& name);

    Credentials getCredentials(const std::string& name) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, Credentials> sets_;
};

/**
 * @brief Supplier reading DOCFLOW_<NAME>_CONNECTION_STRING, _USERNAME and
 * _PASSWORD from the process environment on every call.
 *
 * The set name is upper-cased and every character outside [A-Z0-9] becomes
 * an underscore, so "chat-memory" reads DOCFLOW_CHAT_MEMORY_USERNAME.
 */
class EnvCredentialSupplier : public CredentialSupplier {
public:
    Credentials getCredentials(const std::string& name) override;

    /**
     * @brief Environment variable prefix used for a credential set.
     */
    [[nodiscard]] static std::string variablePrefix(const std::string& name);
};

}  // namespace docflow::storage

#endif  // DOCFLOW_STORAGE_CREDENTIALS_HPP
