/**
 * @file main.cpp
 * @brief agentwatch CLI entry point
 */

#include "cli_config.hpp"
#include "commands/commands.hpp"
#include "output_formatter.hpp"

#include <agentwatch/utils/logger.hpp>

#include <google/protobuf/stubs/common.h>

#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace agentwatch;

namespace {

int dispatch(const cli::CliConfig& config, cli::OutputFormatter& out) {
    switch (config.command) {
        case cli::Command::LIST: return cli::commands::list_cmd(config, out);
        case cli::Command::INSTANCES: return cli::commands::instances_cmd(config, out);
        case cli::Command::STATUS: return cli::commands::status_cmd(config, out);
        case cli::Command::ZEROCONF: return cli::commands::zeroconf_cmd(config, out);
        default:
            throw std::invalid_argument("No command given");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    cli::CliConfig config;
    try {
        config = cli::parse_args(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information.\n";
        return 1;
    }

    if (config.show_help) {
        cli::print_usage(argv[0]);
        return 0;
    }
    if (config.show_version) {
        cli::print_version();
        return 0;
    }

    auto& logger = utils::Logger::instance();
    logger.setLevel(utils::parseLogLevel(config.log_level, utils::LogLevel::WARN));
    logger.setColorEnabled(isatty(STDERR_FILENO) != 0);

    cli::commands::install_interrupt_handler();

    int result = 0;
    try {
        cli::OutputFormatter out(config.json_mode);
        LOG_DEBUG("Cli", "Running {}", cli::command_name(config.command));
        result = dispatch(config, out);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        result = 1;
    }

    google::protobuf::ShutdownProtobufLibrary();
    return result;
}
