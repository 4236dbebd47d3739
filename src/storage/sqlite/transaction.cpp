/*
 * transaction.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace docflow::storage::sqlite {

Transaction::Transaction(Database& db) : db_(db) {
    db_.execute("BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
    if (!isActive()) {
        return;
    }
    try {
        rollback();
    } catch (const std::exception& e) {
        spdlog::error("Automatic rollback on {} failed: {}", db_.path(),
                      e.what());
    }
}

void Transaction::commit() { finish("COMMIT;", State::Committed); }

void Transaction::rollback() { finish("ROLLBACK;", State::RolledBack); }

void Transaction::finish(const char* sql, State next) {
    if (!isActive()) {
        THROW_STORAGE_ERROR(ErrorKind::Internal,
                            "Transaction already committed or rolled back");
    }
    // A failed ROLLBACK leaves nothing to retry, a failed COMMIT does
    if (next == State::RolledBack) {
        state_ = next;
    }
    db_.execute(sql);
    state_ = next;
    spdlog::trace("Transaction on {} finished: {}", db_.path(), sql);
}

}  // namespace docflow::storage::sqlite
