/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Value types exchanged with the storage collaborator

**************************************************/

#ifndef DOCFLOW_STORAGE_TYPES_HPP
#define DOCFLOW_STORAGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace docflow::storage {

using json = nlohmann::json;

/// Scope or collection used when a keyspace leaves the name empty
inline constexpr std::string_view DEFAULT_KEYSPACE_NAME = "_default";

/// Maximum document id length in bytes accepted by the store
inline constexpr std::size_t MAX_DOCUMENT_ID_LENGTH = 250;

/**
 * @brief Connection credentials; also the fingerprint of a cached handle.
 */
struct Credentials {
    std::string endpoint;  ///< Connection string, e.g. sqlite://history.db
    std::string username;
    std::string password;

    /**
     * @throws ValidationError if any field is empty
     */
    void validate() const;

    bool operator==(const Credentials&) const = default;
};

/**
 * @brief Bucket/scope/collection triple naming a collection.
 *
 * Only the bucket is required; an empty scope or collection means
 * DEFAULT_KEYSPACE_NAME.
 */
struct Keyspace {
    std::string bucket;
    std::string scope;
    std::string collection;

    /**
     * @throws ValidationError if the bucket is empty
     */
    void validate() const;

    /**
     * @brief Copy with empty scope and collection names set to "_default".
     */
    [[nodiscard]] Keyspace withDefaults() const;

    /**
     * @brief Dotted form, e.g. "travel.inventory.chat".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Keyspace&) const = default;
};

/**
 * @brief Result of a successful read.
 */
struct GetResult {
    json content;
    std::uint64_t cas{0};
};

/**
 * @brief Result of a successful write.
 */
struct MutationResult {
    std::uint64_t cas{0};
};

/**
 * @brief One sub-document mutation applied by Collection::mutateIn.
 */
struct MutateInSpec {
    enum class Operation {
        Upsert,      ///< Set the field to value
        ArrayAppend  ///< Append every element of value to the array field
    };

    Operation operation;
    std::string path;
    json value;

    /**
     * @brief Append elements to an array field.
     *
     * @param path Top-level field name.
     * @param values Array of elements appended in order.
     */
    [[nodiscard]] static MutateInSpec arrayAppend(std::string path,
                                                  json values);

    /**
     * @brief Set a field, creating it if absent.
     */
    [[nodiscard]] static MutateInSpec upsert(std::string path, json value);
};

/**
 * @brief Reject empty ids and ids over MAX_DOCUMENT_ID_LENGTH bytes.
 * @throws ValidationError
 */
void validateDocumentId(std::string_view id);

}  // namespace docflow::storage

#endif  // DOCFLOW_STORAGE_TYPES_HPP
