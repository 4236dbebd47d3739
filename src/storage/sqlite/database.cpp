/*
 * database.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "database.hpp"

#include <spdlog/spdlog.h>

#include <format>

#include "statement.hpp"
#include "transaction.hpp"

namespace docflow::storage::sqlite {

ErrorKind kindFromResultCode(int code) noexcept {
    switch (code & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return ErrorKind::TemporaryFailure;
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
        case SQLITE_PERM:
            return ErrorKind::Connection;
        case SQLITE_AUTH:
            return ErrorKind::AuthenticationFailure;
        default:
            return ErrorKind::Internal;
    }
}

Database::Database(const std::string& path,
                   std::chrono::milliseconds busyTimeout, int flags)
    : path_(path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    handle_.reset(raw);
    if (rc != SQLITE_OK) {
        auto message = std::format(
            "Cannot open database {}: {}", path,
            raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
        spdlog::error("{}", message);
        THROW_STORAGE_ERROR(ErrorKind::Connection, std::move(message));
    }

    sqlite3_busy_timeout(handle_.get(), static_cast<int>(busyTimeout.count()));
    open_.store(true);

    execute("PRAGMA journal_mode = WAL;");
    execute("PRAGMA synchronous = NORMAL;");
    spdlog::debug("Opened database {} (busy timeout {}ms)", path,
                  busyTimeout.count());
}

Database::~Database() { close(); }

void Database::close() noexcept {
    if (!open_.exchange(false)) {
        return;
    }
    if (sqlite3_close_v2(handle_.release()) != SQLITE_OK) {
        spdlog::warn("Database {} did not close cleanly", path_);
    }
}

sqlite3* Database::handle() {
    requireOpen("use");
    return handle_.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    requireOpen("prepare a statement on");
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction() {
    requireOpen("begin a transaction on");
    return std::make_unique<Transaction>(*this);
}

void Database::execute(const std::string& sql) {
    requireOpen("execute SQL on");

    char* error = nullptr;
    const int rc =
        sqlite3_exec(handle_.get(), sql.c_str(), nullptr, nullptr, &error);
    if (rc == SQLITE_OK) {
        return;
    }

    std::string detail = error != nullptr ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    spdlog::error("SQL error on {}: {}", path_, detail);
    THROW_SQLITE_ERROR(rc, std::format("SQL error: {}", detail));
}

void Database::requireOpen(const char* action) const {
    if (!open_.load()) {
        THROW_VALIDATION_ERROR(
            std::format("Attempted to {} closed database {}", action, path_));
    }
}

}  // namespace docflow::storage::sqlite
