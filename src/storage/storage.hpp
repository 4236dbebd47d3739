/*
 * storage.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Interfaces of the document storage collaborator

**************************************************/

#ifndef DOCFLOW_STORAGE_STORAGE_HPP
#define DOCFLOW_STORAGE_STORAGE_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

namespace docflow::storage {

/**
 * @brief Reference to one collection of JSON documents.
 *
 * Implementations report failures as docflow::StorageError with the kind
 * set (DocumentNotFound, DocumentExists, Timeout, ...). Collections are safe
 * for concurrent use once obtained.
 */
class Collection {
public:
    virtual ~Collection() = default;

    /**
     * @throws StorageError (DocumentNotFound) if the document is missing
     */
    virtual GetResult get(const std::string& id) = 0;

    /**
     * @brief Create a document; fails if one already exists.
     * @throws StorageError (DocumentExists)
     */
    virtual MutationResult insert(const std::string& id,
                                  const json& content) = 0;

    /**
     * @brief Create or replace a document.
     */
    virtual MutationResult upsert(const std::string& id,
                                  const json& content) = 0;

    /**
     * @throws StorageError (DocumentNotFound) if the document is missing
     */
    virtual MutationResult remove(const std::string& id) = 0;

    /**
     * @brief Apply sub-document mutations atomically to an existing document.
     * @throws StorageError (DocumentNotFound) if the document is missing
     */
    virtual MutationResult mutateIn(const std::string& id,
                                    const std::vector<MutateInSpec>& specs) = 0;
};

/**
 * @brief Live connection to the store; the cached handle.
 */
class Cluster {
public:
    virtual ~Cluster() = default;

    /**
     * @brief Resolve a collection reference.
     * @throws StorageError if the keyspace cannot be accessed
     */
    virtual std::shared_ptr<Collection> collection(
        const Keyspace& keyspace) = 0;

    /**
     * @brief Release the connection. Further use is undefined.
     */
    virtual void close() = 0;
};

/**
 * @brief Opens clusters; the connect primitive.
 */
class Connector {
public:
    virtual ~Connector() = default;

    /**
     * @param credentials Endpoint and account.
     * @param connectTimeout Upper bound enforced by the implementation.
     * @throws StorageError classified as AuthenticationFailure, Timeout or
     * Connection
     */
    virtual std::shared_ptr<Cluster> connect(
        const Credentials& credentials,
        std::chrono::milliseconds connectTimeout) = 0;
};

/**
 * @brief Source of named credential sets; values may change between calls.
 */
class CredentialSupplier {
public:
    virtual ~CredentialSupplier() = default;

    /**
     * @throws ValidationError if the set is unknown
     */
    virtual Credentials getCredentials(const std::string& name) = 0;
};

}  // namespace docflow::storage

#endif  // DOCFLOW_STORAGE_STORAGE_HPP
