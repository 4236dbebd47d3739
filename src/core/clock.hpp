/*
 * clock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Injectable time source used for idle eviction and retry
backoff

**************************************************/

#ifndef DOCFLOW_CORE_CLOCK_HPP
#define DOCFLOW_CORE_CLOCK_HPP

#include <chrono>
#include <memory>

namespace docflow::core {

/**
 * @brief Monotonic time source with a blocking sleep primitive.
 *
 * Components take a shared Clock instead of calling std::chrono and
 * std::this_thread directly, so tests can substitute a manual clock and
 * observe sleeps without waiting.
 */
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    /**
     * @brief Current monotonic time.
     */
    [[nodiscard]] virtual time_point now() const = 0;

    /**
     * @brief Block the calling thread for the given duration.
     */
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief Clock backed by std::chrono::steady_clock.
 */
class SystemClock : public Clock {
public:
    [[nodiscard]] time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

/**
 * @brief Process-wide SystemClock shared by default-constructed components.
 */
[[nodiscard]] std::shared_ptr<Clock> systemClock();

}  // namespace docflow::core

#endif  // DOCFLOW_CORE_CLOCK_HPP
