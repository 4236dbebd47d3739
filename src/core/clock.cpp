/*
 * clock.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "clock.hpp"

#include <thread>

namespace docflow::core {

Clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return;
    }
    std::this_thread::sleep_for(duration);
}

std::shared_ptr<Clock> systemClock() {
    static auto instance = std::make_shared<SystemClock>();
    return instance;
}

}  // namespace docflow::core
