/*
 * session_id.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DOCFLOW_HISTORY_SESSION_ID_HPP
#define DOCFLOW_HISTORY_SESSION_ID_HPP

#include <string>
#include <string_view>

namespace docflow::history {

/**
 * @brief Trim surrounding whitespace from a caller supplied session id.
 *
 * @throws ValidationError if nothing is left
 */
[[nodiscard]] std::string resolveSessionId(std::string_view raw);

}  // namespace docflow::history

#endif  // DOCFLOW_HISTORY_SESSION_ID_HPP
