/*
 * session_id.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session_id.hpp"

#include "error/error.hpp"

namespace docflow::history {

std::string resolveSessionId(std::string_view raw) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto first = raw.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        THROW_VALIDATION_ERROR(
            "Session ID is missing. Please ensure a valid Session ID is "
            "provided.");
    }
    const auto last = raw.find_last_not_of(whitespace);
    return std::string(raw.substr(first, last - first + 1));
}

}  // namespace docflow::history
