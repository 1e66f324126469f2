/**
 * @file port_probe_source.cpp
 * @brief PortProbeSource implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/sources/port_probe_source.hpp"
#include "agentwatch/net/tcp_probe.hpp"
#include "agentwatch/utils/logger.hpp"

#include <algorithm>
#include <memory>

namespace agentwatch {
namespace sources {

PortProbeSource::PortProbeSource(PortProbeConfig config)
    : config_(std::move(config))
{}

core::InstanceStreamPtr PortProbeSource::discover(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    auto stopped = running_.add();
    auto deadline = Clock::now() + timeout;
    auto index = std::make_shared<size_t>(0);
    PortProbeConfig config = config_;

    auto producer = [config, stopped, deadline, index]() -> std::optional<core::DiscoveredInstance> {
        while (*index < config.ports.size()) {
            auto now = Clock::now();
            if (stopped->load() || now >= deadline) {
                return std::nullopt;
            }

            uint16_t port = config.ports[(*index)++];
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            int timeoutMs = static_cast<int>(std::max<int64_t>(
                1, std::min(remaining, config.connect_timeout).count()));

            net::ProbeResult result = net::probeTcpPort(config.host, port, timeoutMs);
            LOG_TRACE("PortProbe", "{}:{} is {}", config.host, port,
                      net::probeResultToString(result));
            if (result == net::ProbeResult::OPEN) {
                LOG_DEBUG("PortProbe", "Listener on {}:{}", config.host, port);
                return core::DiscoveredInstance::fromPortProbe(port, config.host);
            }
        }
        return std::nullopt;
    };

    return std::make_unique<core::GeneratorStream<core::DiscoveredInstance>>(
        std::move(producer), [stopped]() { stopped->store(true); });
}

void PortProbeSource::stop() {
    running_.cancelAll();
}

}  // namespace sources
}  // namespace agentwatch
