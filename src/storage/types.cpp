/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <format>

#include "error/error.hpp"

namespace docflow::storage {

void Credentials::validate() const {
    if (endpoint.empty()) {
        THROW_VALIDATION_ERROR("Connection string is required");
    }
    if (username.empty()) {
        THROW_VALIDATION_ERROR("Username is required");
    }
    if (password.empty()) {
        THROW_VALIDATION_ERROR("Password is required");
    }
}

void Keyspace::validate() const {
    if (bucket.empty()) {
        THROW_VALIDATION_ERROR("Bucket name is required");
    }
}

Keyspace Keyspace::withDefaults() const {
    Keyspace resolved = *this;
    if (resolved.scope.empty()) {
        resolved.scope = DEFAULT_KEYSPACE_NAME;
    }
    if (resolved.collection.empty()) {
        resolved.collection = DEFAULT_KEYSPACE_NAME;
    }
    return resolved;
}

std::string Keyspace::toString() const {
    return std::format("{}.{}.{}", bucket, scope, collection);
}

MutateInSpec MutateInSpec::arrayAppend(std::string path, json values) {
    if (!values.is_array()) {
        values = json::array({std::move(values)});
    }
    return MutateInSpec{Operation::ArrayAppend, std::move(path),
                        std::move(values)};
}

MutateInSpec MutateInSpec::upsert(std::string path, json value) {
    return MutateInSpec{Operation::Upsert, std::move(path), std::move(value)};
}

void validateDocumentId(std::string_view id) {
    if (id.empty()) {
        THROW_VALIDATION_ERROR("Document ID is required");
    }
    if (id.size() > MAX_DOCUMENT_ID_LENGTH) {
        THROW_VALIDATION_ERROR(std::format(
            "Document ID is {} bytes long, the maximum is {} bytes",
            id.size(), MAX_DOCUMENT_ID_LENGTH));
    }
}

}  // namespace docflow::storage
