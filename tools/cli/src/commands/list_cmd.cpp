/**
 * @file list_cmd.cpp
 * @brief list command - persisted sessions, newest first
 */

#include "commands.hpp"

#include <agentwatch/session/session_store.hpp>

#include <iostream>

namespace agentwatch::cli::commands {

int list_cmd(const CliConfig& config, OutputFormatter& out) {
    session::SessionStore store(session::StoreConfig::fromEnvironment());
    auto sessions = store.list(config.dir_pattern);

    if (out.is_json_mode()) {
        for (const auto& record : sessions) {
            out.print_json(record);
        }
    } else {
        session::formatSessionTable(std::cout, sessions);
    }
    out.flush();
    return 0;
}

} // namespace agentwatch::cli::commands
