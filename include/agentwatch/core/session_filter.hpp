/**
 * @file session_filter.hpp
 * @brief Predicate over session statuses, applied lazily to a stream.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/export.hpp"
#include "agentwatch/core/session_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace agentwatch {
namespace core {

/**
 * @struct SessionFilter
 * @brief Criteria a session must meet to be shown.
 *
 * A default-constructed filter accepts everything. Each state flag that is
 * set requires that state, so setting two flags accepts nothing.
 */
struct SessionFilter {
    bool busy = false;
    bool idle = false;
    bool retrying = false;
    std::string session_id_pattern;           ///< Substring of the session id
    std::optional<int64_t> min_retry_attempt; ///< Applies when an attempt is known

    bool isEmpty() const {
        return !busy && !idle && !retrying &&
               session_id_pattern.empty() && !min_retry_attempt;
    }
};

AGENTWATCH_CORE_API bool matches(const SessionStatus& status, const SessionFilter& filter);

/**
 * @brief Drop records that do not match @p filter, without buffering.
 *
 * Cancelling the returned stream cancels @p sessions.
 */
AGENTWATCH_CORE_API SessionStreamPtr filterSessions(SessionStreamPtr sessions,
                                                    SessionFilter filter);

}  // namespace core
}  // namespace agentwatch
