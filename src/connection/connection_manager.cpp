/*
 * connection_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Cached connection handle implementation

**************************************************/

#include "connection_manager.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <format>

#include "error/error.hpp"

namespace docflow::connection {

namespace {

// Connect failures are reported as one of three causes
ErrorKind classifyConnectFailure(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::AuthenticationFailure:
        case ErrorKind::Timeout:
            return kind;
        default:
            return ErrorKind::Connection;
    }
}

[[noreturn]] void throwConnectFailure(ErrorKind cause,
                                      std::string_view message) {
    const auto kind = classifyConnectFailure(cause);
    auto text = std::format("Could not connect to database ({}): {}.",
                            errorKindToString(kind), message);
    std::string description{describeConnectionFailure(kind)};

    spdlog::error("ConnectionManager: {} {}", text, description);
    if (kind == ErrorKind::AuthenticationFailure) {
        THROW_AUTHENTICATION_ERROR(std::move(text), std::move(description));
    }
    THROW_CONNECTION_ERROR(kind, std::move(text), std::move(description));
}

constexpr std::string_view COLLECTION_PROBE_PREFIX = "__connection_test_";

[[noreturn]] void throwCollectionAccessFailure(
    const Error& cause, const storage::Keyspace& keyspace) {
    std::string text;
    std::string description;
    ErrorKind kind = cause.kind();

    switch (cause.kind()) {
        case ErrorKind::Timeout:
            text = std::format(
                "Could not access bucket \"{}\". The operation timed out.",
                keyspace.bucket);
            description = std::format(
                "The bucket \"{}\" may not exist, may be inactive, or the "
                "credentials may lack access to it.",
                keyspace.bucket);
            break;
        case ErrorKind::BucketNotFound:
            text = std::format("Bucket \"{}\" was not found.",
                               keyspace.bucket);
            description =
                "Create the bucket in the database or select an existing one.";
            break;
        case ErrorKind::ScopeNotFound:
            text = std::format("Scope \"{}\" was not found in bucket \"{}\".",
                               keyspace.scope, keyspace.bucket);
            description =
                "Use \"_default\" for the default scope or create the scope.";
            break;
        case ErrorKind::CollectionNotFound:
            text = std::format(
                "Collection \"{}\" was not found in scope \"{}\".",
                keyspace.collection, keyspace.scope);
            description =
                "Use \"_default\" for the default collection or create the "
                "collection.";
            break;
        default:
            kind = ErrorKind::Connection;
            text = std::format("Could not access collection: {}.",
                               cause.message());
            description =
                "Please ensure the selected bucket, scope, and collection "
                "exist and the credentials have permissions.";
            break;
    }

    spdlog::error("ConnectionManager: {} ({})", text, keyspace.toString());
    THROW_CONNECTION_ERROR(kind, std::move(text), std::move(description));
}

}  // namespace

std::string_view connectionStatusToString(ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
    }
    return "disconnected";
}

ConnectionManager::ConnectionManager(
    std::shared_ptr<storage::Connector> connector,
    config::ConnectionConfig config, std::shared_ptr<core::Clock> clock,
    std::shared_ptr<storage::CredentialSupplier> credentialSupplier)
    : connector_(std::move(connector)),
      config_(std::move(config)),
      clock_(clock ? std::move(clock) : core::systemClock()),
      credentialSupplier_(std::move(credentialSupplier)),
      connectRetry_(clock_) {
    if (!connector_) {
        THROW_VALIDATION_ERROR("ConnectionManager requires a connector");
    }
    if (config_.idleTimeoutMs == 0 ||
        config_.idleTimeoutMs > static_cast<size_t>(config::MAX_DURATION_MS)) {
        THROW_VALIDATION_ERROR(std::format(
            "Idle timeout must be between 1 and {}ms, got {}ms",
            config::MAX_DURATION_MS, config_.idleTimeoutMs));
    }
    if (config_.connectTimeoutMs == 0 ||
        config_.connectTimeoutMs >
            static_cast<size_t>(config::MAX_DURATION_MS)) {
        THROW_VALIDATION_ERROR(std::format(
            "Connect timeout must be between 1 and {}ms, got {}ms",
            config::MAX_DURATION_MS, config_.connectTimeoutMs));
    }
    if (config_.connectAttempts < 1) {
        THROW_VALIDATION_ERROR(std::format(
            "Connect attempts must be at least 1, got {}",
            config_.connectAttempts));
    }

    if (config_.enableIdleReaper) {
        startReaper();
    }
}

ConnectionManager::~ConnectionManager() {
    stopReaper();
    close();
}

std::shared_ptr<storage::Cluster> ConnectionManager::acquire(
    const storage::Credentials& credentials) {
    credentials.validate();

    std::lock_guard lock(mutex_);
    evictIfIdleLocked();

    if (handle_ && fingerprint_ == credentials) {
        touchLocked();
        return handle_;
    }

    if (handle_) {
        spdlog::info(
            "ConnectionManager: credentials changed, closing connection to {}",
            fingerprint_->endpoint);
        closeLocked("credentials changed");
    }

    status_ = ConnectionStatus::Connecting;
    std::shared_ptr<storage::Cluster> cluster;
    try {
        cluster = connectLocked(credentials);
    } catch (const Error& e) {
        status_ = ConnectionStatus::Disconnected;
        throwConnectFailure(e.kind(), e.message());
    } catch (const std::exception& e) {
        status_ = ConnectionStatus::Disconnected;
        throwConnectFailure(ErrorKind::Connection, e.what());
    }

    if (!cluster) {
        status_ = ConnectionStatus::Disconnected;
        throwConnectFailure(ErrorKind::Connection,
                            "connector returned no connection");
    }

    handle_ = std::move(cluster);
    fingerprint_ = credentials;
    status_ = ConnectionStatus::Connected;
    touchLocked();
    spdlog::info("ConnectionManager: connection to {} established.",
                 credentials.endpoint);
    return handle_;
}

std::shared_ptr<storage::Cluster> ConnectionManager::acquire(
    const std::string& credentialSet) {
    if (!credentialSupplier_) {
        THROW_VALIDATION_ERROR(std::format(
            "No credential supplier configured for credential set '{}'",
            credentialSet));
    }
    return acquire(credentialSupplier_->getCredentials(credentialSet));
}

std::shared_ptr<storage::Collection> ConnectionManager::openCollection(
    const storage::Credentials& credentials,
    const storage::Keyspace& keyspace) {
    keyspace.validate();
    const auto resolved = keyspace.withDefaults();
    auto cluster = acquire(credentials);

    std::shared_ptr<storage::Collection> collection;
    try {
        collection = cluster->collection(resolved);
    } catch (const Error& e) {
        throwCollectionAccessFailure(e, resolved);
    }
    if (!collection) {
        THROW_CONNECTION_ERROR(
            ErrorKind::Connection,
            std::format("Could not access collection: {} is unavailable.",
                        resolved.toString()),
            "Please ensure the selected bucket, scope, and collection exist "
            "and the credentials have permissions.");
    }

    const auto probeId = std::format(
        "{}{}", COLLECTION_PROBE_PREFIX,
        std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_->now().time_since_epoch())
            .count());
    try {
        (void)collection->get(probeId);
    } catch (const Error& e) {
        if (e.kind() != ErrorKind::DocumentNotFound) {
            throwCollectionAccessFailure(e, resolved);
        }
    }

    spdlog::debug("ConnectionManager: collection {} is accessible",
                  resolved.toString());
    return collection;
}

std::shared_ptr<storage::Collection> ConnectionManager::openCollection(
    const std::string& credentialSet, const storage::Keyspace& keyspace) {
    if (!credentialSupplier_) {
        THROW_VALIDATION_ERROR(std::format(
            "No credential supplier configured for credential set '{}'",
            credentialSet));
    }
    return openCollection(credentialSupplier_->getCredentials(credentialSet),
                          keyspace);
}

void ConnectionManager::close() {
    std::lock_guard lock(mutex_);
    closeLocked("closed by caller");
}

bool ConnectionManager::evictIfIdle() {
    std::lock_guard lock(mutex_);
    return evictIfIdleLocked();
}

bool ConnectionManager::hasActiveConnection() const {
    std::lock_guard lock(mutex_);
    return handle_ != nullptr;
}

core::Clock::duration ConnectionManager::idleTime() const {
    std::lock_guard lock(mutex_);
    if (!lastActivity_) {
        return core::Clock::duration::zero();
    }
    return clock_->now() - *lastActivity_;
}

ConnectionStatus ConnectionManager::state() const {
    std::lock_guard lock(mutex_);
    return status_;
}

std::optional<core::Clock::time_point> ConnectionManager::idleDeadline()
    const {
    std::lock_guard lock(mutex_);
    return idleDeadline_;
}

std::shared_ptr<storage::Cluster> ConnectionManager::connectLocked(
    const storage::Credentials& credentials) {
    retry::RetryPolicy policy;
    policy.maxAttempts = config_.connectAttempts;
    policy.initialDelay =
        std::chrono::milliseconds(config_.connectRetryDelayMs);
    // Rejected credentials never succeed on a second try
    policy.isRetryable = [](const Error& error) {
        return error.kind() != ErrorKind::AuthenticationFailure &&
               error.kind() != ErrorKind::Validation;
    };

    return connectRetry_.execute(
        [&] {
            spdlog::info("ConnectionManager: opening a connection to {} as {}",
                         credentials.endpoint, credentials.username);
            return connector_->connect(credentials, config_.connectTimeout());
        },
        policy);
}

void ConnectionManager::touchLocked() {
    const auto now = clock_->now();
    lastActivity_ = now;
    idleDeadline_ = now + config_.idleTimeout();
}

void ConnectionManager::closeLocked(std::string_view reason) {
    // Disarm the timer first so no eviction sees a half-closed handle
    idleDeadline_.reset();
    auto handle = std::move(handle_);
    handle_.reset();
    fingerprint_.reset();
    status_ = ConnectionStatus::Disconnected;

    if (!handle) {
        return;
    }

    spdlog::info("ConnectionManager: closing connection ({})", reason);
    try {
        handle->close();
    } catch (const std::exception& e) {
        spdlog::warn("ConnectionManager: error while closing connection: {}",
                     e.what());
    }
}

bool ConnectionManager::evictIfIdleLocked() {
    if (!handle_ || !idleDeadline_ || clock_->now() < *idleDeadline_) {
        return false;
    }
    closeLocked(std::format("idle for {}ms", config_.idleTimeoutMs));
    return true;
}

void ConnectionManager::startReaper() {
    stopReaper_ = false;
    reaperThread_ = std::thread(&ConnectionManager::reapPeriodically, this);
    spdlog::debug("ConnectionManager: idle reaper started, interval {}ms",
                  config_.idleCheckIntervalMs);
}

void ConnectionManager::stopReaper() {
    {
        std::lock_guard lock(reaperMutex_);
        stopReaper_ = true;
    }
    reaperCond_.notify_one();

    if (reaperThread_.joinable()) {
        reaperThread_.join();
    }
}

void ConnectionManager::reapPeriodically() {
    const auto interval = config_.idleCheckIntervalMs == 0
                              ? std::chrono::milliseconds(1000)
                              : config_.idleCheckInterval();
    while (true) {
        {
            std::unique_lock lock(reaperMutex_);
            if (reaperCond_.wait_for(lock, interval,
                                     [this] { return stopReaper_; })) {
                break;
            }
        }

        try {
            evictIfIdle();
        } catch (const std::exception& e) {
            spdlog::error("ConnectionManager: idle reaper failed: {}",
                          e.what());
        }
    }
}

}  // namespace docflow::connection
