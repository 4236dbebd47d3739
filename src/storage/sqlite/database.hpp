/*
 * database.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: RAII owner of one SQLite connection

**************************************************/

#ifndef DOCFLOW_STORAGE_SQLITE_DATABASE_HPP
#define DOCFLOW_STORAGE_SQLITE_DATABASE_HPP

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "error/error.hpp"

namespace docflow::storage::sqlite {

class Statement;
class Transaction;

/**
 * @brief Map an SQLite result code to the error kind reported to callers.
 *
 * BUSY and LOCKED are temporary failures, CANTOPEN, NOTADB and PERM are
 * connection failures, AUTH is an authentication failure and anything else
 * is internal. Extended result codes are reduced to their primary code.
 */
[[nodiscard]] ErrorKind kindFromResultCode(int code) noexcept;

/**
 * @brief One open SQLite connection in WAL mode.
 *
 * Not copyable. The connection closes with the object or on close();
 * statements still alive at that point keep it open until they finalize.
 */
class Database {
public:
    static constexpr int DEFAULT_OPEN_FLAGS =
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

    /**
     * @param path Database file or ":memory:".
     * @param busyTimeout How long statements wait on a locked file.
     * @param flags sqlite3_open_v2 flags.
     * @throws StorageError (Connection) if the file cannot be opened
     */
    explicit Database(const std::string& path,
                      std::chrono::milliseconds busyTimeout =
                          std::chrono::milliseconds(10000),
                      int flags = DEFAULT_OPEN_FLAGS);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Raw handle for statement preparation.
     * @throws ValidationError after close()
     */
    [[nodiscard]] sqlite3* handle();

    /**
     * @throws StorageError if the SQL does not compile
     */
    [[nodiscard]] std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief Start a BEGIN IMMEDIATE transaction.
     */
    [[nodiscard]] std::unique_ptr<Transaction> beginTransaction();

    /**
     * @brief Run one or more statements that return no rows.
     * @throws StorageError classified by the SQLite result code
     */
    void execute(const std::string& sql);

    [[nodiscard]] bool isValid() const noexcept { return open_.load(); }

    void close() noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    void requireOpen(const char* action) const;

    std::string path_;
    std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> handle_{
        nullptr, sqlite3_close_v2};
    std::atomic<bool> open_{false};
};

#define THROW_SQLITE_ERROR(code, ...)                                   \
    THROW_STORAGE_ERROR(                                                \
        docflow::storage::sqlite::kindFromResultCode(code), __VA_ARGS__)

}  // namespace docflow::storage::sqlite

#endif  // DOCFLOW_STORAGE_SQLITE_DATABASE_HPP
