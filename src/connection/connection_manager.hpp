/*
 * connection_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Credential-aware cache of the single active storage
connection with idle eviction

**************************************************/

#ifndef DOCFLOW_CONNECTION_CONNECTION_MANAGER_HPP
#define DOCFLOW_CONNECTION_CONNECTION_MANAGER_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "config/sections/connection_config.hpp"
#include "core/clock.hpp"
#include "retry/retry.hpp"
#include "storage/storage.hpp"

namespace docflow::connection {

/**
 * @brief Lifecycle state of the cached connection.
 */
enum class ConnectionStatus {
    Disconnected,  ///< No handle cached
    Connecting,    ///< acquire() is opening a handle
    Connected      ///< A handle is cached and the idle timer is armed
};

[[nodiscard]] std::string_view connectionStatusToString(
    ConnectionStatus status) noexcept;

/**
 * @brief Owns the single cached connection handle.
 *
 * The handle is opened lazily by acquire(), reused while the credentials
 * stay the same, replaced when any credential field changes and closed
 * after the configured idle duration without an acquire(). Construct one
 * manager per process (or per test) and pass it to every caller.
 *
 * Invariant: a handle is cached iff its fingerprint is cached iff the idle
 * deadline is armed.
 *
 * acquire(), close() and idle eviction are serialised by one mutex, so a
 * credential change never interleaves with another acquire or with the
 * eviction task. Handles already returned to callers stay usable by them
 * until the manager closes the underlying connection.
 *
 * Idle eviction runs either cooperatively (evictIfIdle(), also done at the
 * start of every acquire()) or from a background reaper thread when
 * ConnectionConfig::enableIdleReaper is set.
 */
class ConnectionManager {
public:
    /**
     * @param connector Connect primitive of the storage collaborator.
     * @param config Timeouts and reaper settings.
     * @param clock Time source for activity tracking and connect backoff.
     * @param credentialSupplier Source for acquire(credentialSet); optional.
     */
    explicit ConnectionManager(
        std::shared_ptr<storage::Connector> connector,
        config::ConnectionConfig config = {},
        std::shared_ptr<core::Clock> clock = core::systemClock(),
        std::shared_ptr<storage::CredentialSupplier> credentialSupplier =
            nullptr);

    /**
     * @brief Stops the reaper and closes any cached handle.
     */
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Return the cached handle, reconnecting if credentials changed.
     *
     * @throws ValidationError if a credential field is empty
     * @throws AuthenticationError if the store rejected the credentials
     * @throws ConnectionError for any other connect failure; the cached
     * state is fully reset before it is thrown
     */
    std::shared_ptr<storage::Cluster> acquire(
        const storage::Credentials& credentials);

    /**
     * @brief Resolve credentials through the supplier, then acquire().
     *
     * @throws ValidationError if no supplier is configured or the set is
     * unknown
     */
    std::shared_ptr<storage::Cluster> acquire(const std::string& credentialSet);

    /**
     * @brief Acquire a handle, resolve a collection on it and check that
     * the collection answers.
     *
     * An empty scope or collection name means "_default". The check reads
     * a document id that never exists, so bucket, scope and collection
     * problems surface here rather than on the first history write.
     *
     * @throws ValidationError if the bucket name is empty
     * @throws ConnectionError naming the missing bucket, scope or
     * collection, or "Could not access collection: ..." for other failures
     */
    std::shared_ptr<storage::Collection> openCollection(
        const storage::Credentials& credentials,
        const storage::Keyspace& keyspace);

    std::shared_ptr<storage::Collection> openCollection(
        const std::string& credentialSet, const storage::Keyspace& keyspace);

    /**
     * @brief Close the cached handle; a no-op when nothing is cached.
     *
     * Errors raised while closing are logged and ignored.
     */
    void close();

    /**
     * @brief Close the handle if the idle deadline has passed.
     *
     * @return True if a handle was evicted.
     */
    bool evictIfIdle();

    [[nodiscard]] bool hasActiveConnection() const;

    /**
     * @brief Time since the last successful acquire, zero if none ever
     * happened.
     */
    [[nodiscard]] core::Clock::duration idleTime() const;

    [[nodiscard]] ConnectionStatus state() const;

    /**
     * @brief When the idle timer fires, if armed.
     */
    [[nodiscard]] std::optional<core::Clock::time_point> idleDeadline() const;

    [[nodiscard]] const config::ConnectionConfig& config() const noexcept {
        return config_;
    }

private:
    std::shared_ptr<storage::Cluster> connectLocked(
        const storage::Credentials& credentials);
    void touchLocked();
    void closeLocked(std::string_view reason);
    bool evictIfIdleLocked();

    void startReaper();
    void stopReaper();
    void reapPeriodically();

    std::shared_ptr<storage::Connector> connector_;
    config::ConnectionConfig config_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<storage::CredentialSupplier> credentialSupplier_;
    retry::RetryExecutor connectRetry_;

    mutable std::mutex mutex_;
    std::shared_ptr<storage::Cluster> handle_;
    std::optional<storage::Credentials> fingerprint_;
    std::optional<core::Clock::time_point> lastActivity_;
    std::optional<core::Clock::time_point> idleDeadline_;
    ConnectionStatus status_{ConnectionStatus::Disconnected};

    // Background eviction task
    std::thread reaperThread_;
    std::mutex reaperMutex_;
    std::condition_variable reaperCond_;
    bool stopReaper_{false};
};

}  // namespace docflow::connection

#endif  // DOCFLOW_CONNECTION_CONNECTION_MANAGER_HPP
