/*
 * error.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "error.hpp"

#include <format>

namespace docflow {

std::string_view errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Connection: return "connection";
        case ErrorKind::AuthenticationFailure: return "authentication failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::TemporaryFailure: return "temporary failure";
        case ErrorKind::DocumentNotFound: return "document not found";
        case ErrorKind::DocumentExists: return "document exists";
        case ErrorKind::BucketNotFound: return "bucket not found";
        case ErrorKind::ScopeNotFound: return "scope not found";
        case ErrorKind::CollectionNotFound: return "collection not found";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

bool isTransient(ErrorKind kind) noexcept {
    return kind == ErrorKind::Timeout || kind == ErrorKind::TemporaryFailure;
}

std::string_view describeConnectionFailure(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Timeout:
            return "Please ensure the database exists, is turned on, and the "
                   "connection string is correct.";
        case ErrorKind::AuthenticationFailure:
            return "Please check your username and password.";
        default:
            return "";
    }
}

void rethrowWithContext(const Error& cause, std::string_view context) {
    THROW_STORAGE_ERROR(cause.kind(),
                        std::format("{}: {}", context, cause.message()));
}

}  // namespace docflow
