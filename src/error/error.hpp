/*
 * error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Error taxonomy shared by the connection, retry, storage and
history modules. Every error carries an explicit ErrorKind that callers
classify on instead of the concrete exception class.

**************************************************/

#ifndef DOCFLOW_ERROR_ERROR_HPP
#define DOCFLOW_ERROR_ERROR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "atom/error/exception.hpp"

namespace docflow {

/**
 * @brief Discriminant attached to every docflow error.
 */
enum class ErrorKind : std::uint8_t {
    Validation,             ///< Caller supplied empty or malformed input
    Connection,             ///< Connect or handle access failed
    AuthenticationFailure,  ///< Credentials rejected by the store
    Timeout,                ///< Operation or connect timed out
    TemporaryFailure,       ///< Store temporarily unable to serve
    DocumentNotFound,       ///< Addressed document does not exist
    DocumentExists,         ///< Create-only write found an existing document
    BucketNotFound,         ///< Keyspace names a bucket the store lacks
    ScopeNotFound,          ///< Bucket has no scope of that name
    CollectionNotFound,     ///< Scope has no collection of that name
    Internal                ///< Anything else reported by the store
};

/**
 * @brief Convert an ErrorKind to its display name.
 */
[[nodiscard]] std::string_view errorKindToString(ErrorKind kind) noexcept;

/**
 * @brief Whether the kind describes a transient condition worth retrying.
 */
[[nodiscard]] bool isTransient(ErrorKind kind) noexcept;

/**
 * @brief Base class of all docflow errors.
 *
 * Keeps the plain message next to the kind so that wrapping layers can add
 * context without nesting the decorated what() text of the base exception.
 */
class Error : public atom::error::Exception {
public:
    Error(ErrorKind kind, const char* file, int line, const char* func,
          std::string message)
        : atom::error::Exception(file, line, func, message),
          kind_(kind),
          message_(std::move(message)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /**
     * @brief The message without source location decoration.
     */
    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }

private:
    ErrorKind kind_;
    std::string message_;
};

/**
 * @brief Caller supplied empty or missing required fields.
 */
class ValidationError : public Error {
public:
    ValidationError(const char* file, int line, const char* func,
                    std::string message)
        : Error(ErrorKind::Validation, file, line, func, std::move(message)) {}
};

/**
 * @brief Failure reported by a storage operation.
 */
class StorageError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Connect or collection access failure.
 *
 * The description is a user-facing hint matching the cause classification.
 */
class ConnectionError : public Error {
public:
    ConnectionError(ErrorKind kind, const char* file, int line,
                    const char* func, std::string message,
                    std::string description = {})
        : Error(kind, file, line, func, std::move(message)),
          description_(std::move(description)) {}

    [[nodiscard]] const std::string& description() const noexcept {
        return description_;
    }

private:
    std::string description_;
};

/**
 * @brief Credentials were rejected while connecting.
 */
class AuthenticationError : public ConnectionError {
public:
    AuthenticationError(const char* file, int line, const char* func,
                        std::string message, std::string description = {})
        : ConnectionError(ErrorKind::AuthenticationFailure, file, line, func,
                          std::move(message), std::move(description)) {}
};

/**
 * @brief Human-readable cause classification for a failed connect.
 */
[[nodiscard]] std::string_view describeConnectionFailure(
    ErrorKind kind) noexcept;

/**
 * @brief Throw a StorageError of the same kind with extra context prefixed.
 *
 * @param cause The original error.
 * @param context What was being attempted and against which resource.
 */
[[noreturn]] void rethrowWithContext(const Error& cause,
                                     std::string_view context);

#define THROW_VALIDATION_ERROR(...)                                      \
    throw docflow::ValidationError(ATOM_FILE_NAME, ATOM_FILE_LINE,       \
                                   ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_STORAGE_ERROR(kind, ...)                                    \
    throw docflow::StorageError(kind, ATOM_FILE_NAME, ATOM_FILE_LINE,     \
                                ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_CONNECTION_ERROR(kind, ...)                                 \
    throw docflow::ConnectionError(kind, ATOM_FILE_NAME, ATOM_FILE_LINE,  \
                                   ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_AUTHENTICATION_ERROR(...)                                   \
    throw docflow::AuthenticationError(ATOM_FILE_NAME, ATOM_FILE_LINE,    \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace docflow

#endif  // DOCFLOW_ERROR_ERROR_HPP
