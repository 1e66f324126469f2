/**
 * @file session_filter.cpp
 * @brief SessionFilter implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/core/session_filter.hpp"

#include <memory>

namespace agentwatch {
namespace core {

bool matches(const SessionStatus& status, const SessionFilter& filter) {
    if (filter.busy && status.state != SessionState::BUSY) {
        return false;
    }
    if (filter.idle && status.state != SessionState::IDLE) {
        return false;
    }
    if (filter.retrying && status.state != SessionState::RETRYING) {
        return false;
    }

    if (!filter.session_id_pattern.empty() &&
        status.session_id.find(filter.session_id_pattern) == std::string::npos) {
        return false;
    }

    if (filter.min_retry_attempt && status.retry_attempt &&
        *status.retry_attempt < *filter.min_retry_attempt) {
        return false;
    }

    return true;
}

SessionStreamPtr filterSessions(SessionStreamPtr sessions, SessionFilter filter) {
    std::shared_ptr<SessionStream> input(std::move(sessions));

    auto producer = [input, filter]() -> std::optional<SessionStatus> {
        while (auto status = input->next()) {
            if (matches(*status, filter)) {
                return status;
            }
        }
        return std::nullopt;
    };

    return std::make_unique<GeneratorStream<SessionStatus>>(
        std::move(producer), [input]() { input->cancel(); });
}

}  // namespace core
}  // namespace agentwatch
