/**
 * @file zeroconf_cmd.cpp
 * @brief zeroconf command - enable mDNS advertisement in the host config
 */

#include "commands.hpp"

#include <agentwatch/session/zeroconf.hpp>

namespace agentwatch::cli::commands {

int zeroconf_cmd(const CliConfig& /*config*/, OutputFormatter& out) {
    session::ZeroconfConfigurator configurator(session::ZeroconfPaths::defaults());
    std::string path = configurator.enable();
    out.print_line("Enabled mdns in " + path);
    return 0;
}

} // namespace agentwatch::cli::commands
