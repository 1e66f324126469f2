/**
 * @file commands.hpp
 * @brief Command handlers
 */

#pragma once

#include "../cli_config.hpp"
#include "../output_formatter.hpp"

#include <agentwatch/core/discovery_source.hpp>
#include <agentwatch/core/status_poller.hpp>

#include <vector>

namespace agentwatch::cli::commands {

int list_cmd(const CliConfig& config, OutputFormatter& out);
int instances_cmd(const CliConfig& config, OutputFormatter& out);
int status_cmd(const CliConfig& config, OutputFormatter& out);
int zeroconf_cmd(const CliConfig& config, OutputFormatter& out);

/**
 * @brief One status round: discover, poll each host once, print
 * @return Number of sessions printed
 *
 * A fresh cache per round keeps pid-less records from piling up across
 * watch rounds.
 */
size_t poll_round(const std::vector<core::DiscoverySourcePtr>& sources,
                  const core::StatusPoller& poller,
                  const CliConfig& config, OutputFormatter& out);

/**
 * @brief Route SIGINT/SIGTERM to interrupted() instead of terminating
 */
void install_interrupt_handler();

bool interrupted();

} // namespace agentwatch::cli::commands
