/**
 * @file tcp_probe.hpp
 * @brief Non-blocking TCP connect probe.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/net/export.hpp"

#include <cstdint>
#include <string>

namespace agentwatch {
namespace net {

/**
 * @enum ProbeResult
 * @brief Outcome of a single connect attempt.
 */
enum class ProbeResult {
    OPEN,      ///< Connection accepted
    CLOSED,    ///< Refused or reset
    TIMEOUT,   ///< No answer within the timeout
    ERROR      ///< Local failure (bad address, no socket)
};

inline const char* probeResultToString(ProbeResult result) {
    switch (result) {
        case ProbeResult::OPEN: return "open";
        case ProbeResult::CLOSED: return "closed";
        case ProbeResult::TIMEOUT: return "timeout";
        case ProbeResult::ERROR: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Attempt a TCP connection to ip:port and close it immediately.
 * @param ip IPv4 address in dotted form.
 * @param timeoutMs Connect timeout in milliseconds.
 */
AGENTWATCH_NET_API ProbeResult probeTcpPort(const std::string& ip, uint16_t port,
                                            int timeoutMs);

}  // namespace net
}  // namespace agentwatch
