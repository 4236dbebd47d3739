/*
 * statement.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "statement.hpp"

#include <spdlog/spdlog.h>

#include <format>

#include "database.hpp"

namespace docflow::storage::sqlite {

Statement::Statement(Database& db, const std::string& sql)
    : db_(db), sql_(sql) {
    sqlite3_stmt* raw = nullptr;
    const int rc =
        sqlite3_prepare_v2(db_.handle(), sql_.c_str(), -1, &raw, nullptr);
    stmt_.reset(raw);
    if (rc != SQLITE_OK) {
        fail(rc, "prepare");
    }
    spdlog::trace("Prepared statement: {}", sql_);
}

Statement& Statement::bind(int index, int64_t value) {
    checkParameter(index);
    if (const int rc = sqlite3_bind_int64(stmt_.get(), index, value);
        rc != SQLITE_OK) {
        fail(rc, "bind integer parameter of");
    }
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    checkParameter(index);
    if (const int rc =
            sqlite3_bind_text(stmt_.get(), index, value.data(),
                              static_cast<int>(value.size()), SQLITE_TRANSIENT);
        rc != SQLITE_OK) {
        fail(rc, "bind text parameter of");
    }
    return *this;
}

void Statement::execute() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        fail(rc, "execute");
    }
}

bool Statement::step() {
    switch (const int rc = sqlite3_step(stmt_.get())) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            fail(rc, "step");
    }
}

int Statement::changes() const { return sqlite3_changes(db_.handle()); }

int64_t Statement::getInt64(int column) const {
    checkColumn(column);
    return sqlite3_column_int64(stmt_.get(), column);
}

std::string Statement::getText(int column) const {
    checkColumn(column);
    const auto* text = sqlite3_column_text(stmt_.get(), column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(
                           sqlite3_column_bytes(stmt_.get(), column)));
}

bool Statement::isNull(int column) const {
    checkColumn(column);
    return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

void Statement::checkParameter(int index) const {
    const int count = sqlite3_bind_parameter_count(stmt_.get());
    if (index < 1 || index > count) {
        THROW_VALIDATION_ERROR(std::format(
            "Parameter index {} out of range 1..{}", index, count));
    }
}

void Statement::checkColumn(int column) const {
    const int count = sqlite3_column_count(stmt_.get());
    if (column < 0 || column >= count) {
        THROW_VALIDATION_ERROR(std::format(
            "Column index {} out of range 0..{}", column, count - 1));
    }
}

void Statement::fail(int code, const char* action) const {
    auto message = std::format("Failed to {} statement '{}': {}", action, sql_,
                               sqlite3_errmsg(db_.handle()));
    spdlog::error("{}", message);
    THROW_SQLITE_ERROR(code, std::move(message));
}

}  // namespace docflow::storage::sqlite
