/**
 * @file instance.cpp
 * @brief DiscoveredInstance implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/core/instance.hpp"

namespace agentwatch {
namespace core {

DiscoveredInstance DiscoveredInstance::fromMdns(uint16_t port, const std::string& hostname) {
    DiscoveredInstance instance(InstanceOrigin::MDNS, port);
    if (!hostname.empty()) {
        instance.hostname_ = hostname;
    }
    return instance;
}

DiscoveredInstance DiscoveredInstance::fromProcess(int pid,
                                                   std::optional<uint16_t> port,
                                                   std::optional<std::string> cwd) {
    DiscoveredInstance instance(InstanceOrigin::PROCESS, port.value_or(0));
    instance.pid_ = pid;
    instance.cwd_ = std::move(cwd);
    return instance;
}

DiscoveredInstance DiscoveredInstance::fromPortProbe(uint16_t port, const std::string& hostname) {
    DiscoveredInstance instance(InstanceOrigin::PORT_PROBE, port);
    if (!hostname.empty()) {
        instance.hostname_ = hostname;
    }
    return instance;
}

std::string DiscoveredInstance::identity() const {
    if (pid_) {
        return "pid:" + std::to_string(*pid_);
    }
    return endpoint();
}

std::string DiscoveredInstance::endpoint() const {
    return hostname_.value_or("localhost") + ":" + std::to_string(port_);
}

bool DiscoveredInstance::operator==(const DiscoveredInstance& other) const {
    return port_ == other.port_ &&
           hostname_ == other.hostname_ &&
           pid_ == other.pid_ &&
           cwd_ == other.cwd_ &&
           origin_ == other.origin_;
}

std::ostream& operator<<(std::ostream& os, const DiscoveredInstance& instance) {
    os << instanceOriginToString(instance.origin()) << "{" << instance.identity();
    if (instance.pid()) {
        os << " port=" << instance.port();
    }
    if (instance.cwd()) {
        os << " cwd=" << *instance.cwd();
    }
    return os << "}";
}

}  // namespace core
}  // namespace agentwatch
