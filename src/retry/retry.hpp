/*
 * retry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file retry.hpp
 * @brief Retry policy and executor for fallible storage operations
 * @date 2026-10-19
 * @version 1.0.0
 */

#ifndef DOCFLOW_RETRY_RETRY_HPP
#define DOCFLOW_RETRY_RETRY_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "core/clock.hpp"
#include "error/error.hpp"

namespace docflow::retry {

/// Default number of attempts for transient failures
inline constexpr int DEFAULT_RETRY_ATTEMPTS = 3;

/// Default delay before the first retry
inline constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY{1000};

/// Default multiplier for exponential backoff
inline constexpr double RETRY_BACKOFF_MULTIPLIER = 2.0;

/// Decides whether a failed attempt should be retried
using RetryPredicate = std::function<bool(const Error&)>;

/**
 * @brief Default retry classification: timeouts and temporary failures.
 */
[[nodiscard]] bool defaultIsRetryable(const Error& error) noexcept;

/**
 * @brief Complete retry configuration.
 *
 * Backoff is deterministic: the delay before retry n (1-based attempt that
 * just failed) is initialDelay * backoffMultiplier^(n - 1). There is no
 * jitter and no cancellation; bound the total time with maxAttempts and
 * initialDelay.
 */
struct RetryPolicy {
    /// Total attempts including the first one, at least 1
    int maxAttempts{DEFAULT_RETRY_ATTEMPTS};

    /// Delay before the first retry
    std::chrono::milliseconds initialDelay{DEFAULT_RETRY_DELAY};

    /// Multiplier applied per further retry, at least 1
    double backoffMultiplier{RETRY_BACKOFF_MULTIPLIER};

    /// Classification of retryable errors; empty means defaultIsRetryable
    RetryPredicate isRetryable{defaultIsRetryable};

    /**
     * @brief Check the policy invariants.
     * @throws ValidationError if any field is out of range
     */
    void validate() const;
};

/**
 * @brief Partial policy whose set fields override another fragment.
 */
struct RetryOptions {
    std::optional<int> maxAttempts;
    std::optional<std::chrono::milliseconds> initialDelay;
    std::optional<double> backoffMultiplier;
    RetryPredicate isRetryable;

    /**
     * @brief Merge overrides over this fragment; set fields in overrides win.
     */
    [[nodiscard]] RetryOptions mergedWith(const RetryOptions& overrides) const;

    /**
     * @brief Fill unset fields with library defaults.
     */
    [[nodiscard]] RetryPolicy toPolicy() const;
};

/**
 * @brief Delay to wait after the given failed attempt.
 *
 * @param policy Retry policy.
 * @param attempt Attempt that just failed (1-based).
 */
[[nodiscard]] std::chrono::milliseconds calculateDelay(
    const RetryPolicy& policy, int attempt);

class Retrier;

/**
 * @brief Runs operations, retrying classified-transient failures.
 *
 * Only docflow::Error failures are classified; any other exception type
 * propagates from the first attempt that raises it.
 */
class RetryExecutor {
public:
    explicit RetryExecutor(
        std::shared_ptr<core::Clock> clock = core::systemClock());

    /**
     * @brief Execute operation under policy.
     *
     * @param operation Callable taking no arguments.
     * @param policy Retry policy.
     * @return The value returned by the first successful attempt.
     * @throws The error of the last attempt when giving up.
     */
    template <typename Operation>
    auto execute(Operation&& operation, const RetryPolicy& policy = {}) const
        -> std::invoke_result_t<Operation&>;

    /**
     * @brief Build a retrier bound to a default policy fragment.
     */
    [[nodiscard]] Retrier makeRetrier(RetryOptions defaults) const;

    [[nodiscard]] const std::shared_ptr<core::Clock>& clock() const noexcept {
        return clock_;
    }

private:
    bool shouldRetry(const RetryPolicy& policy, const Error& error,
                     int attempt) const;
    void backoff(const RetryPolicy& policy, int attempt) const;

    std::shared_ptr<core::Clock> clock_;
};

/**
 * @brief Executor specialised with default options.
 *
 * @code
 * auto retryGet = executor.makeRetrier({.maxAttempts = 5});
 * auto doc = retryGet([&] { return collection->get(key); },
 *                     {.initialDelay = std::chrono::milliseconds(50)});
 * @endcode
 */
class Retrier {
public:
    Retrier(RetryExecutor executor, RetryOptions defaults)
        : executor_(std::move(executor)), defaults_(std::move(defaults)) {}

    template <typename Operation>
    auto operator()(Operation&& operation,
                    const RetryOptions& overrides = {}) const
        -> std::invoke_result_t<Operation&> {
        return executor_.execute(std::forward<Operation>(operation),
                                 defaults_.mergedWith(overrides).toPolicy());
    }

    [[nodiscard]] const RetryOptions& defaults() const noexcept {
        return defaults_;
    }

private:
    RetryExecutor executor_;
    RetryOptions defaults_;
};

template <typename Operation>
auto RetryExecutor::execute(Operation&& operation,
                            const RetryPolicy& policy) const
    -> std::invoke_result_t<Operation&> {
    policy.validate();
    for (int attempt = 1;; ++attempt) {
        try {
            return std::invoke(operation);
        } catch (const Error& error) {
            if (!shouldRetry(policy, error, attempt)) {
                throw;
            }
        }
        backoff(policy, attempt);
    }
}

}  // namespace docflow::retry

#endif  // DOCFLOW_RETRY_RETRY_HPP
