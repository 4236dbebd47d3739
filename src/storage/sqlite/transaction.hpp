/*
 * transaction.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DOCFLOW_STORAGE_SQLITE_TRANSACTION_HPP
#define DOCFLOW_STORAGE_SQLITE_TRANSACTION_HPP

namespace docflow::storage::sqlite {

class Database;

/**
 * @brief BEGIN IMMEDIATE transaction rolled back unless committed.
 *
 * Taking the write lock up front keeps read-modify-write sequences of other
 * connections to the same file from interleaving.
 */
class Transaction {
public:
    /**
     * @throws StorageError (TemporaryFailure) if the write lock is held
     * elsewhere past the busy timeout
     */
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @throws StorageError if already finished or COMMIT fails
     */
    void commit();

    /**
     * @throws StorageError if already finished or ROLLBACK fails
     */
    void rollback();

    [[nodiscard]] bool isActive() const noexcept {
        return state_ == State::Active;
    }

private:
    enum class State { Active, Committed, RolledBack };

    void finish(const char* sql, State next);

    Database& db_;
    State state_{State::Active};
};

}  // namespace docflow::storage::sqlite

#endif  // DOCFLOW_STORAGE_SQLITE_TRANSACTION_HPP
