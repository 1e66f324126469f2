/**
 * @file discovery.hpp
 * @brief Builds the discovery sources selected on the command line
 */

#pragma once

#include "cli_config.hpp"

#include <agentwatch/core/discovery_source.hpp>

#include <vector>

namespace agentwatch::cli {

/**
 * @brief One source per enabled mechanism, in the order mdns, proc, port
 */
std::vector<core::DiscoverySourcePtr> make_sources(const DiscoveryOptions& options);

/**
 * @brief Passes each status port through once
 *
 * Status is always fetched from localhost, so records sharing a port name
 * the same host however they were found. Port 0 records pass unchanged;
 * they have nothing to poll.
 */
core::InstanceStreamPtr unique_status_targets(core::InstanceStreamPtr instances);

} // namespace agentwatch::cli
