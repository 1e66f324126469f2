/**
 * @file instances_cmd.cpp
 * @brief instances command - stream agent hosts as they are found
 */

#include "commands.hpp"
#include "../discovery.hpp"

#include <agentwatch/core/instance_cache.hpp>

namespace agentwatch::cli::commands {

int instances_cmd(const CliConfig& config, OutputFormatter& out) {
    core::InstanceCache cache(make_sources(config.discovery));
    auto instances = cache.discover(config.discovery.timeout);

    size_t count = 0;
    while (auto instance = instances->next()) {
        if (count++ == 0) {
            out.print_instance_header();
        }
        out.print_instance(*instance);
        out.flush();

        if (interrupted()) {
            instances->cancel();
            break;
        }
    }
    cache.stop();

    if (count == 0) {
        out.print_line("No agent hosts found.");
    }
    return 0;
}

} // namespace agentwatch::cli::commands
