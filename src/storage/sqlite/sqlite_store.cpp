/*
 * sqlite_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: SQLite document store implementation

**************************************************/

#include "sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include <format>

#include "statement.hpp"
#include "transaction.hpp"

namespace docflow::storage::sqlite {

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS documents ("
    " keyspace TEXT NOT NULL,"
    " id TEXT NOT NULL,"
    " content TEXT NOT NULL,"
    " cas INTEGER NOT NULL,"
    " PRIMARY KEY (keyspace, id));";

json parseContent(const std::string& text, const std::string& id) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        THROW_STORAGE_ERROR(
            ErrorKind::Internal,
            std::format("Document '{}' holds malformed JSON: {}", id,
                        e.what()));
    }
}

[[noreturn]] void throwNotFound(const std::string& keyspace,
                                const std::string& id) {
    THROW_STORAGE_ERROR(
        ErrorKind::DocumentNotFound,
        std::format("Document '{}' not found in {}", id, keyspace));
}

/// Content and cas of a row, or nothing when it is missing.
std::optional<std::pair<std::string, std::int64_t>> selectRow(
    Database& db, const std::string& keyspace, const std::string& id) {
    auto stmt = db.prepare(
        "SELECT content, cas FROM documents WHERE keyspace = ? AND id = ?;");
    stmt->bind(1, keyspace).bind(2, id);
    if (!stmt->step()) {
        return std::nullopt;
    }
    return std::make_pair(stmt->getText(0), stmt->getInt64(1));
}

void applySpec(json& document, const MutateInSpec& spec,
               const std::string& id) {
    switch (spec.operation) {
        case MutateInSpec::Operation::Upsert:
            document[spec.path] = spec.value;
            return;
        case MutateInSpec::Operation::ArrayAppend: {
            json& target = document[spec.path];
            if (target.is_null()) {
                target = json::array();
            }
            if (!target.is_array()) {
                THROW_STORAGE_ERROR(
                    ErrorKind::Internal,
                    std::format("Path '{}' of document '{}' is not an array",
                                spec.path, id));
            }
            for (const auto& element : spec.value) {
                target.push_back(element);
            }
            return;
        }
    }
}

}  // namespace

//------------------------------------------------------------------------------
// SqliteEndpoint
//------------------------------------------------------------------------------

SqliteEndpoint SqliteEndpoint::parse(const std::string& endpoint) {
    if (!endpoint.starts_with(SQLITE_SCHEME)) {
        THROW_STORAGE_ERROR(
            ErrorKind::Connection,
            std::format("Unsupported connection string '{}', expected {}<path>",
                        endpoint, SQLITE_SCHEME));
    }

    SqliteEndpoint parsed;
    std::string rest = endpoint.substr(SQLITE_SCHEME.size());
    auto query = rest.find('?');
    parsed.path = rest.substr(0, query);
    if (parsed.path.empty()) {
        THROW_STORAGE_ERROR(ErrorKind::Connection,
                            "Connection string does not name a database path");
    }

    if (query != std::string::npos) {
        std::string params = rest.substr(query + 1);
        size_t pos = 0;
        while (pos <= params.size()) {
            auto end = params.find('&', pos);
            if (end == std::string::npos) {
                end = params.size();
            }
            std::string pair = params.substr(pos, end - pos);
            auto eq = pair.find('=');
            if (eq != std::string::npos) {
                std::string key = pair.substr(0, eq);
                std::string value = pair.substr(eq + 1);
                if (key == "user") {
                    parsed.user = value;
                } else if (key == "password") {
                    parsed.password = value;
                } else {
                    spdlog::warn("Ignoring unknown connection option '{}'",
                                 key);
                }
            }
            pos = end + 1;
        }
    }
    return parsed;
}

//------------------------------------------------------------------------------
// SqliteCluster
//------------------------------------------------------------------------------

SqliteCluster::SqliteCluster(const std::string& path,
                             std::chrono::milliseconds busyTimeout)
    : db_(std::make_unique<Database>(path, busyTimeout)) {
    db_->execute(kSchema);
}

SqliteCluster::~SqliteCluster() {
    std::lock_guard lock(mutex_);
    db_.reset();
}

std::shared_ptr<Collection> SqliteCluster::collection(
    const Keyspace& keyspace) {
    keyspace.validate();
    if (!isOpen()) {
        THROW_STORAGE_ERROR(ErrorKind::Connection,
                            "Cluster connection is closed");
    }
    return std::make_shared<SqliteCollection>(shared_from_this(),
                                              keyspace.withDefaults());
}

void SqliteCluster::close() {
    std::lock_guard lock(mutex_);
    if (db_) {
        spdlog::info("Closing SQLite cluster {}", db_->path());
        db_.reset();
    }
}

bool SqliteCluster::isOpen() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

//------------------------------------------------------------------------------
// SqliteCollection
//------------------------------------------------------------------------------

SqliteCollection::SqliteCollection(std::shared_ptr<SqliteCluster> cluster,
                                   Keyspace keyspace)
    : cluster_(std::move(cluster)),
      keyspace_(std::move(keyspace)),
      keyspaceName_(keyspace_.toString()) {}

GetResult SqliteCollection::get(const std::string& id) {
    validateDocumentId(id);
    return cluster_->withDatabase([&](Database& db) {
        auto row = selectRow(db, keyspaceName_, id);
        if (!row) {
            throwNotFound(keyspaceName_, id);
        }
        return GetResult{parseContent(row->first, id),
                         static_cast<std::uint64_t>(row->second)};
    });
}

MutationResult SqliteCollection::insert(const std::string& id,
                                        const json& content) {
    validateDocumentId(id);
    return cluster_->withDatabase([&](Database& db) {
        auto stmt = db.prepare(
            "INSERT INTO documents (keyspace, id, content, cas) "
            "VALUES (?, ?, ?, 1) ON CONFLICT (keyspace, id) DO NOTHING;");
        stmt->bind(1, keyspaceName_).bind(2, id).bind(3, content.dump());
        stmt->execute();
        if (stmt->changes() == 0) {
            THROW_STORAGE_ERROR(
                ErrorKind::DocumentExists,
                std::format("Document '{}' already exists in {}", id,
                            keyspaceName_));
        }
        return MutationResult{1};
    });
}

MutationResult SqliteCollection::upsert(const std::string& id,
                                        const json& content) {
    validateDocumentId(id);
    return cluster_->withDatabase([&](Database& db) {
        auto txn = db.beginTransaction();
        auto row = selectRow(db, keyspaceName_, id);
        std::int64_t cas = row ? row->second + 1 : 1;
        auto stmt = db.prepare(
            "INSERT INTO documents (keyspace, id, content, cas) "
            "VALUES (?, ?, ?, ?) ON CONFLICT (keyspace, id) "
            "DO UPDATE SET content = excluded.content, cas = excluded.cas;");
        stmt->bind(1, keyspaceName_).bind(2, id).bind(3, content.dump());
        stmt->bind(4, cas);
        stmt->execute();
        stmt.reset();
        txn->commit();
        return MutationResult{static_cast<std::uint64_t>(cas)};
    });
}

MutationResult SqliteCollection::remove(const std::string& id) {
    validateDocumentId(id);
    return cluster_->withDatabase([&](Database& db) {
        auto stmt = db.prepare(
            "DELETE FROM documents WHERE keyspace = ? AND id = ?;");
        stmt->bind(1, keyspaceName_).bind(2, id);
        stmt->execute();
        if (stmt->changes() == 0) {
            throwNotFound(keyspaceName_, id);
        }
        return MutationResult{0};
    });
}

MutationResult SqliteCollection::mutateIn(
    const std::string& id, const std::vector<MutateInSpec>& specs) {
    validateDocumentId(id);
    return cluster_->withDatabase([&](Database& db) {
        auto txn = db.beginTransaction();
        auto row = selectRow(db, keyspaceName_, id);
        if (!row) {
            throwNotFound(keyspaceName_, id);
        }

        json document = parseContent(row->first, id);
        if (!document.is_object()) {
            THROW_STORAGE_ERROR(
                ErrorKind::Internal,
                std::format("Document '{}' is not a JSON object", id));
        }
        for (const auto& spec : specs) {
            applySpec(document, spec, id);
        }

        const std::int64_t cas = row->second + 1;
        auto stmt = db.prepare(
            "UPDATE documents SET content = ?, cas = ? "
            "WHERE keyspace = ? AND id = ?;");
        stmt->bind(1, document.dump()).bind(2, cas);
        stmt->bind(3, keyspaceName_).bind(4, id);
        stmt->execute();
        stmt.reset();
        txn->commit();
        return MutationResult{static_cast<std::uint64_t>(cas)};
    });
}

//------------------------------------------------------------------------------
// SqliteConnector
//------------------------------------------------------------------------------

std::shared_ptr<Cluster> SqliteConnector::connect(
    const Credentials& credentials, std::chrono::milliseconds connectTimeout) {
    auto endpoint = SqliteEndpoint::parse(credentials.endpoint);

    if ((endpoint.user && *endpoint.user != credentials.username) ||
        (endpoint.password && *endpoint.password != credentials.password)) {
        THROW_STORAGE_ERROR(
            ErrorKind::AuthenticationFailure,
            std::format("Authentication failed for user '{}'",
                        credentials.username));
    }

    try {
        return std::make_shared<SqliteCluster>(endpoint.path, connectTimeout);
    } catch (const StorageError& e) {
        if (e.kind() == ErrorKind::TemporaryFailure) {
            THROW_STORAGE_ERROR(
                ErrorKind::Timeout,
                std::format("Timed out after {}ms opening {}: {}",
                            connectTimeout.count(), endpoint.path,
                            e.message()));
        }
        throw;
    }
}

}  // namespace docflow::storage::sqlite
