/**
 * @file cli_config.hpp
 * @brief Command line configuration for the agentwatch tool
 */

#pragma once

#include <agentwatch/core/session_filter.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentwatch::cli {

/**
 * @brief Top-level command
 */
enum class Command {
    NONE,
    LIST,
    INSTANCES,
    STATUS,
    ZEROCONF
};

const char* command_name(Command command);

/**
 * @brief Which discovery sources to run and for how long
 */
struct DiscoveryOptions {
    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000);
    bool use_mdns = true;
    bool use_proc = true;
    std::vector<uint16_t> probe_ports;
};

/**
 * @brief Parsed command line
 */
struct CliConfig {
    Command command = Command::NONE;

    // Global options
    bool json_mode = false;
    std::string log_level = "WARN";
    bool show_help = false;
    bool show_version = false;

    // list
    std::string dir_pattern;

    // instances, status
    DiscoveryOptions discovery;

    // status
    core::SessionFilter filter;
    std::optional<std::chrono::milliseconds> watch_interval;
};

/**
 * @brief Parse argv (argv[0] is the program name)
 *
 * Global options may appear before or after the command. A missing command
 * is only an error when neither --help nor --version was given.
 *
 * @throws std::invalid_argument on unknown commands or options, missing
 *         option values and malformed numbers.
 */
CliConfig parse_args(int argc, char* argv[]);

/**
 * @brief Parse a comma-separated port list ("4096,4097")
 * @throws std::invalid_argument on an empty list or a bad port
 */
std::vector<uint16_t> parse_port_list(const std::string& text);

void print_usage(const char* program);

void print_version();

} // namespace agentwatch::cli
