/*
 * sqlite_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Embedded document store implementing the storage
collaborator on top of SQLite

**************************************************/

#ifndef DOCFLOW_STORAGE_SQLITE_SQLITE_STORE_HPP
#define DOCFLOW_STORAGE_SQLITE_SQLITE_STORE_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "database.hpp"
#include "storage/storage.hpp"

namespace docflow::storage::sqlite {

/// Connection string scheme handled by SqliteConnector
inline constexpr std::string_view SQLITE_SCHEME = "sqlite://";

/**
 * @brief Parsed form of "sqlite://<path>[?user=<u>&password=<p>]".
 *
 * When user or password is present the connector requires the supplied
 * credentials to match, which gives the embedded store an authentication
 * step comparable to a server.
 */
struct SqliteEndpoint {
    std::string path;
    std::optional<std::string> user;
    std::optional<std::string> password;

    /**
     * @throws StorageError (Connection) if the scheme or path is invalid
     */
    [[nodiscard]] static SqliteEndpoint parse(const std::string& endpoint);
};

/**
 * @brief One open SQLite database acting as a cluster.
 *
 * All statements run under one mutex; documents of every keyspace share a
 * single table keyed by (keyspace, id).
 */
class SqliteCluster : public Cluster,
                      public std::enable_shared_from_this<SqliteCluster> {
public:
    SqliteCluster(const std::string& path,
                  std::chrono::milliseconds busyTimeout);
    ~SqliteCluster() override;

    std::shared_ptr<Collection> collection(const Keyspace& keyspace) override;
    void close() override;

    [[nodiscard]] bool isOpen() const;

    /**
     * @brief Run fn with exclusive access to the open database.
     * @throws StorageError (Connection) after close()
     */
    template <typename Fn>
    auto withDatabase(Fn&& fn) -> decltype(fn(std::declval<Database&>())) {
        std::lock_guard lock(mutex_);
        if (!db_) {
            THROW_STORAGE_ERROR(ErrorKind::Connection,
                                "Cluster connection is closed");
        }
        return fn(*db_);
    }

private:
    mutable std::mutex mutex_;
    std::unique_ptr<Database> db_;
};

/**
 * @brief Collection stored as rows of the shared documents table.
 */
class SqliteCollection : public Collection {
public:
    SqliteCollection(std::shared_ptr<SqliteCluster> cluster,
                     Keyspace keyspace);

    GetResult get(const std::string& id) override;
    MutationResult insert(const std::string& id, const json& content) override;
    MutationResult upsert(const std::string& id, const json& content) override;
    MutationResult remove(const std::string& id) override;
    MutationResult mutateIn(const std::string& id,
                            const std::vector<MutateInSpec>& specs) override;

    [[nodiscard]] const Keyspace& keyspace() const noexcept {
        return keyspace_;
    }

private:
    std::shared_ptr<SqliteCluster> cluster_;
    Keyspace keyspace_;
    std::string keyspaceName_;
};

/**
 * @brief Connect primitive for sqlite:// endpoints.
 *
 * The connect timeout bounds how long opening waits on a locked database
 * file.
 */
class SqliteConnector : public Connector {
public:
    std::shared_ptr<Cluster> connect(
        const Credentials& credentials,
        std::chrono::milliseconds connectTimeout) override;
};

}  // namespace docflow::storage::sqlite

#endif  // DOCFLOW_STORAGE_SQLITE_SQLITE_STORE_HPP
