/**
 * @file session_status.hpp
 * @brief Live activity of one session inside an agent host.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/stream.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace agentwatch {
namespace core {

/**
 * @enum SessionState
 * @brief What a session is doing right now.
 */
enum class SessionState {
    IDLE,
    BUSY,
    RETRYING
};

/**
 * @brief Wire name of a state ("idle", "busy", "retry").
 */
inline const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::BUSY: return "busy";
        case SessionState::RETRYING: return "retry";
        default: return "unknown";
    }
}

/**
 * @brief Parse a wire state name; anything else is not a state.
 */
inline std::optional<SessionState> parseSessionState(const std::string& name) {
    if (name == "idle") return SessionState::IDLE;
    if (name == "busy") return SessionState::BUSY;
    if (name == "retry") return SessionState::RETRYING;
    return std::nullopt;
}

/**
 * @struct SessionStatus
 * @brief One session reported by one host's status endpoint.
 *
 * Recomputed on every poll and never cached. The retry fields are only ever
 * set when state is RETRYING, and each may still be absent then.
 */
struct SessionStatus {
    std::string session_id;
    uint16_t port = 0;                        ///< Host that reported it
    SessionState state = SessionState::IDLE;
    std::optional<int64_t> retry_attempt;
    std::optional<std::string> retry_message;
    std::optional<int64_t> retry_next_at;     ///< Epoch milliseconds

    bool operator==(const SessionStatus& other) const {
        return session_id == other.session_id &&
               port == other.port &&
               state == other.state &&
               retry_attempt == other.retry_attempt &&
               retry_message == other.retry_message &&
               retry_next_at == other.retry_next_at;
    }
};

using SessionStream = Stream<SessionStatus>;
using SessionStreamPtr = StreamPtr<SessionStatus>;

}  // namespace core
}  // namespace agentwatch
