/*
 * retry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file retry.cpp
 * @brief Retry policy and executor implementation
 * @date 2026-10-19
 */

#include "retry.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <format>

namespace docflow::retry {

bool defaultIsRetryable(const Error& error) noexcept {
    return isTransient(error.kind());
}

void RetryPolicy::validate() const {
    if (maxAttempts < 1) {
        THROW_VALIDATION_ERROR(std::format(
            "Retry policy requires maxAttempts >= 1, got {}", maxAttempts));
    }
    if (initialDelay.count() < 0) {
        THROW_VALIDATION_ERROR(
            std::format("Retry policy requires initialDelay >= 0, got {}ms",
                        initialDelay.count()));
    }
    if (!(backoffMultiplier >= 1.0)) {
        THROW_VALIDATION_ERROR(std::format(
            "Retry policy requires backoffMultiplier >= 1, got {}",
            backoffMultiplier));
    }
}

RetryOptions RetryOptions::mergedWith(const RetryOptions& overrides) const {
    RetryOptions merged = *this;
    if (overrides.maxAttempts) {
        merged.maxAttempts = overrides.maxAttempts;
    }
    if (overrides.initialDelay) {
        merged.initialDelay = overrides.initialDelay;
    }
    if (overrides.backoffMultiplier) {
        merged.backoffMultiplier = overrides.backoffMultiplier;
    }
    if (overrides.isRetryable) {
        merged.isRetryable = overrides.isRetryable;
    }
    return merged;
}

RetryPolicy RetryOptions::toPolicy() const {
    RetryPolicy policy;
    policy.maxAttempts = maxAttempts.value_or(DEFAULT_RETRY_ATTEMPTS);
    policy.initialDelay = initialDelay.value_or(DEFAULT_RETRY_DELAY);
    policy.backoffMultiplier =
        backoffMultiplier.value_or(RETRY_BACKOFF_MULTIPLIER);
    if (isRetryable) {
        policy.isRetryable = isRetryable;
    }
    return policy;
}

std::chrono::milliseconds calculateDelay(const RetryPolicy& policy,
                                         int attempt) {
    if (attempt < 1) {
        return std::chrono::milliseconds(0);
    }
    // Exponential backoff: initialDelay * (multiplier ^ (attempt - 1))
    const double delay = static_cast<double>(policy.initialDelay.count()) *
                         std::pow(policy.backoffMultiplier, attempt - 1);
    // Saturates at the largest representable delay
    constexpr auto maxDelay = std::chrono::milliseconds::max();
    if (!(delay < static_cast<double>(maxDelay.count()))) {
        return maxDelay;
    }
    return std::chrono::milliseconds(std::llround(delay));
}

RetryExecutor::RetryExecutor(std::shared_ptr<core::Clock> clock)
    : clock_(clock ? std::move(clock) : core::systemClock()) {}

Retrier RetryExecutor::makeRetrier(RetryOptions defaults) const {
    return Retrier(*this, std::move(defaults));
}

bool RetryExecutor::shouldRetry(const RetryPolicy& policy, const Error& error,
                                int attempt) const {
    const bool retryable = policy.isRetryable ? policy.isRetryable(error)
                                              : defaultIsRetryable(error);
    if (!retryable) {
        spdlog::debug(
            "RetryExecutor: {} error is not retryable, giving up after "
            "attempt {}",
            errorKindToString(error.kind()), attempt);
        return false;
    }

    if (attempt >= policy.maxAttempts) {
        spdlog::warn("RetryExecutor: exhausted {} attempts, last error: {}",
                     policy.maxAttempts, error.message());
        return false;
    }

    spdlog::info("RetryExecutor: attempt {}/{} failed ({}), retrying",
                 attempt, policy.maxAttempts, error.message());
    return true;
}

void RetryExecutor::backoff(const RetryPolicy& policy, int attempt) const {
    auto delay = calculateDelay(policy, attempt);
    if (delay.count() <= 0) {
        return;
    }
    spdlog::debug("RetryExecutor: sleeping for {}ms", delay.count());
    clock_->sleepFor(delay);
}

}  // namespace docflow::retry
