#ifndef DOCFLOW_DOCFLOW_HPP
#define DOCFLOW_DOCFLOW_HPP

/**
 * @file docflow.hpp
 * @brief Unified facade header for the docflow library.
 *
 * This header provides access to all library components:
 * - Connection: ConnectionManager caching one storage connection
 * - Retry: RetryExecutor and Retrier with exponential backoff
 * - History: SessionHistoryStore for per-session chat messages
 * - Storage: collaborator interfaces and the SQLite backend
 * - Config and logging
 *
 * @par Usage Example:
 * @code
 * #include "docflow.hpp"
 *
 * using namespace docflow;
 *
 * auto config = config::loadConfig("docflow.json");
 * logging::LogConfig::initialize(config.logging);
 *
 * auto manager = createConnectionManager(config.connection);
 * storage::Credentials credentials{"sqlite://history.db", "app", "secret"};
 * auto collection =
 *     manager->openCollection(credentials, {"chat", "_default", "history"});
 *
 * history::SessionHistoryStore store(config.history);
 * auto retrier = retry::RetryExecutor().makeRetrier(config.retry.toOptions());
 * store.addMessage(*collection, "s1", history::humanMessage("hello"));
 * auto messages = retrier([&] { return store.getMessages(*collection, "s1"); });
 * @endcode
 */

#include <memory>
#include <utility>

#include "config/config_loader.hpp"
#include "connection/connection_manager.hpp"
#include "core/clock.hpp"
#include "error/error.hpp"
#include "history/message.hpp"
#include "history/session_history_store.hpp"
#include "history/session_id.hpp"
#include "logging/log_config.hpp"
#include "retry/retry.hpp"
#include "storage/credentials.hpp"
#include "storage/sqlite/sqlite_store.hpp"
#include "storage/storage.hpp"

namespace docflow {

/**
 * @brief Library version.
 */
inline constexpr const char* DOCFLOW_VERSION = "1.0.0";

[[nodiscard]] inline const char* getVersion() noexcept {
    return DOCFLOW_VERSION;
}

using connection::ConnectionManager;
using history::Message;
using history::SessionHistoryStore;
using retry::Retrier;
using retry::RetryExecutor;
using retry::RetryPolicy;

/**
 * @brief Create a ConnectionManager backed by the SQLite connector.
 */
[[nodiscard]] inline std::unique_ptr<ConnectionManager>
createConnectionManager(
    const config::ConnectionConfig& config = {},
    std::shared_ptr<storage::CredentialSupplier> credentials = nullptr) {
    return std::make_unique<ConnectionManager>(
        std::make_shared<storage::sqlite::SqliteConnector>(), config,
        core::systemClock(), std::move(credentials));
}

}  // namespace docflow

#endif  // DOCFLOW_DOCFLOW_HPP
