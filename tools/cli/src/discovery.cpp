/**
 * @file discovery.cpp
 * @brief Discovery source construction
 */

#include "discovery.hpp"

#include <agentwatch/sources/mdns_source.hpp>
#include <agentwatch/sources/port_probe_source.hpp>
#include <agentwatch/sources/process_source.hpp>
#include <agentwatch/utils/logger.hpp>

#include <memory>
#include <unordered_set>

namespace agentwatch::cli {

std::vector<core::DiscoverySourcePtr> make_sources(const DiscoveryOptions& options) {
    std::vector<core::DiscoverySourcePtr> sources;

    if (options.use_mdns) {
        sources.push_back(std::make_shared<sources::MdnsSource>());
    }
    if (options.use_proc) {
        sources.push_back(std::make_shared<sources::ProcessSource>());
    }
    if (!options.probe_ports.empty()) {
        sources::PortProbeConfig probe;
        probe.ports = options.probe_ports;
        sources.push_back(std::make_shared<sources::PortProbeSource>(std::move(probe)));
    }

    LOG_DEBUG("Cli", "Using {} discovery sources", sources.size());
    return sources;
}

core::InstanceStreamPtr unique_status_targets(core::InstanceStreamPtr instances) {
    std::shared_ptr<core::InstanceStream> input(std::move(instances));
    auto polled = std::make_shared<std::unordered_set<uint16_t>>();

    auto producer = [input, polled]() -> std::optional<core::DiscoveredInstance> {
        while (auto instance = input->next()) {
            if (instance->port() == 0 || polled->insert(instance->port()).second) {
                return instance;
            }
            LOG_DEBUG("Cli", "Port {} already polled, skipping {}",
                      instance->port(), instance->identity());
        }
        return std::nullopt;
    };

    return std::make_unique<core::GeneratorStream<core::DiscoveredInstance>>(
        std::move(producer), [input]() { input->cancel(); });
}

} // namespace agentwatch::cli
