/**
 * @file instance.hpp
 * @brief A running agent host found by one of the discovery sources.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/export.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace agentwatch {
namespace core {

/**
 * @enum InstanceOrigin
 * @brief Which discovery mechanism produced a record.
 */
enum class InstanceOrigin {
    MDNS,        ///< Local-network service advertisement
    PROCESS,     ///< Operating-system process table
    PORT_PROBE   ///< TCP connect probe on a known port
};

inline const char* instanceOriginToString(InstanceOrigin origin) {
    switch (origin) {
        case InstanceOrigin::MDNS: return "mdns";
        case InstanceOrigin::PROCESS: return "proc";
        case InstanceOrigin::PORT_PROBE: return "port";
        default: return "unknown";
    }
}

/**
 * @class DiscoveredInstance
 * @brief Immutable record of one sighting of an agent host.
 *
 * Built through the per-origin factories; every field is fixed at
 * construction. Two records with the same pid describe the same host even
 * when their other fields differ.
 */
class AGENTWATCH_CORE_API DiscoveredInstance {
public:
    static DiscoveredInstance fromMdns(uint16_t port, const std::string& hostname);

    static DiscoveredInstance fromProcess(int pid,
                                          std::optional<uint16_t> port,
                                          std::optional<std::string> cwd);

    static DiscoveredInstance fromPortProbe(uint16_t port, const std::string& hostname);

    /// Listening port; 0 when a process was found without a --port argument.
    uint16_t port() const { return port_; }
    const std::optional<std::string>& hostname() const { return hostname_; }
    const std::optional<int>& pid() const { return pid_; }
    const std::optional<std::string>& cwd() const { return cwd_; }
    InstanceOrigin origin() const { return origin_; }

    bool hasPort() const { return port_ != 0; }

    /**
     * @brief Stable identity: "pid:<n>" when the pid is known, otherwise
     *        "<hostname or localhost>:<port>".
     */
    std::string identity() const;

    /**
     * @brief host:port, with "localhost" standing in for a missing hostname.
     */
    std::string endpoint() const;

    bool operator==(const DiscoveredInstance& other) const;
    bool operator!=(const DiscoveredInstance& other) const { return !(*this == other); }

private:
    DiscoveredInstance(InstanceOrigin origin, uint16_t port)
        : port_(port), origin_(origin) {}

    uint16_t port_;
    std::optional<std::string> hostname_;
    std::optional<int> pid_;
    std::optional<std::string> cwd_;
    InstanceOrigin origin_;
};

AGENTWATCH_CORE_API std::ostream& operator<<(std::ostream& os, const DiscoveredInstance& instance);

}  // namespace core
}  // namespace agentwatch
