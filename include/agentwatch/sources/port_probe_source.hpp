/**
 * @file port_probe_source.hpp
 * @brief Discovery by connecting to well-known local ports.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/discovery_source.hpp"
#include "agentwatch/core/export.hpp"
#include "agentwatch/sources/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace agentwatch {
namespace sources {

/**
 * @struct PortProbeConfig
 * @brief Ports to try, in order.
 */
struct PortProbeConfig {
    std::string host = "127.0.0.1";
    std::vector<uint16_t> ports;
    std::chrono::milliseconds connect_timeout{250};
};

/**
 * @class PortProbeSource
 * @brief DiscoverySource that reports every configured port accepting TCP.
 *
 * One port is probed per pull. Emits origin PORT_PROBE with the configured
 * host as hostname.
 */
class AGENTWATCH_CORE_API PortProbeSource : public core::DiscoverySource {
public:
    explicit PortProbeSource(PortProbeConfig config);

    core::InstanceStreamPtr discover(std::chrono::milliseconds timeout) override;

    void stop() override;

    const char* name() const override { return "port"; }

private:
    PortProbeConfig config_;
    CancellationSet running_;
};

}  // namespace sources
}  // namespace agentwatch
