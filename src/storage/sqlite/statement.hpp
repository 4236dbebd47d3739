/*
 * statement.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DOCFLOW_STORAGE_SQLITE_STATEMENT_HPP
#define DOCFLOW_STORAGE_SQLITE_STATEMENT_HPP

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace docflow::storage::sqlite {

class Database;

/**
 * @brief Prepared statement bound to the Database that created it.
 *
 * Parameters are 1-based, result columns 0-based. Out-of-range indices
 * raise ValidationError; SQLite failures raise StorageError.
 */
class Statement {
public:
    Statement(Database& db, const std::string& sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::string& value);

    /**
     * @brief Run to completion, ignoring any rows.
     */
    void execute();

    /**
     * @brief Advance to the next row.
     * @return False once all rows are consumed.
     */
    bool step();

    /**
     * @brief Rows modified by the most recent write on the connection.
     */
    [[nodiscard]] int changes() const;

    [[nodiscard]] int64_t getInt64(int column) const;
    [[nodiscard]] std::string getText(int column) const;
    [[nodiscard]] bool isNull(int column) const;

    [[nodiscard]] const std::string& sql() const noexcept { return sql_; }

private:
    void checkParameter(int index) const;
    void checkColumn(int column) const;
    [[noreturn]] void fail(int code, const char* action) const;

    Database& db_;
    std::string sql_;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_{
        nullptr, sqlite3_finalize};
};

}  // namespace docflow::storage::sqlite

#endif  // DOCFLOW_STORAGE_SQLITE_STATEMENT_HPP
