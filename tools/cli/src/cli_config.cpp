/**
 * @file cli_config.cpp
 * @brief Command line parsing
 */

#include "cli_config.hpp"
#include "utils/string_utils.hpp"

#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace agentwatch::cli {

namespace {

constexpr const char* VERSION = "0.3.0";

int64_t parse_integer(const std::string& option, const std::string& value,
                      int64_t min, int64_t max) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
    if (consumed != value.size() || parsed < min || parsed > max) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
    return parsed;
}

Command parse_command(const std::string& name) {
    std::string lower = utils::to_lower(name);
    if (lower == "list") return Command::LIST;
    if (lower == "instances") return Command::INSTANCES;
    if (lower == "status") return Command::STATUS;
    if (lower == "zeroconf") return Command::ZEROCONF;
    throw std::invalid_argument("Unknown command: " + name);
}

bool takes_discovery_options(Command command) {
    return command == Command::INSTANCES || command == Command::STATUS;
}

} // anonymous namespace

const char* command_name(Command command) {
    switch (command) {
        case Command::LIST: return "list";
        case Command::INSTANCES: return "instances";
        case Command::STATUS: return "status";
        case Command::ZEROCONF: return "zeroconf";
        default: return "";
    }
}

std::vector<uint16_t> parse_port_list(const std::string& text) {
    std::vector<uint16_t> ports;
    for (const auto& token : utils::split(text, ',')) {
        ports.push_back(static_cast<uint16_t>(parse_integer("--probe-ports", token, 1, 65535)));
    }
    if (ports.empty()) {
        throw std::invalid_argument("--probe-ports needs at least one port");
    }
    return ports;
}

CliConfig parse_args(int argc, char* argv[]) {
    CliConfig config;

    for (int i = 1; i < argc; ++i) {
        const auto option = utils::split_option(argv[i]);
        const std::string& arg = option.first;
        const std::string& inline_value = option.second;
        const bool has_inline = arg.size() != std::strlen(argv[i]);

        auto value = [&]() -> std::string {
            if (has_inline) {
                return inline_value;
            }
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        // Global options
        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--version") {
            config.show_version = true;
        } else if (arg == "--json") {
            config.json_mode = true;
        } else if (arg == "--log-level") {
            config.log_level = value();
        } else if (arg.empty() || arg[0] != '-') {
            if (config.command != Command::NONE) {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
            config.command = parse_command(arg);

        // list
        } else if (config.command == Command::LIST && (arg == "-d" || arg == "--dir")) {
            config.dir_pattern = value();

        // instances, status
        } else if (takes_discovery_options(config.command) && arg == "--timeout") {
            config.discovery.timeout = std::chrono::milliseconds(
                parse_integer(arg, value(), 1, std::numeric_limits<int32_t>::max()));
        } else if (takes_discovery_options(config.command) && arg == "--no-mdns") {
            config.discovery.use_mdns = false;
        } else if (takes_discovery_options(config.command) && arg == "--no-proc") {
            config.discovery.use_proc = false;
        } else if (takes_discovery_options(config.command) && arg == "--probe-ports") {
            config.discovery.probe_ports = parse_port_list(value());

        // status
        } else if (config.command == Command::STATUS && arg == "--busy") {
            config.filter.busy = true;
        } else if (config.command == Command::STATUS && arg == "--idle") {
            config.filter.idle = true;
        } else if (config.command == Command::STATUS && arg == "--retrying") {
            config.filter.retrying = true;
        } else if (config.command == Command::STATUS && arg == "--session") {
            config.filter.session_id_pattern = value();
        } else if (config.command == Command::STATUS && arg == "--min-retry") {
            config.filter.min_retry_attempt =
                parse_integer(arg, value(), 0, std::numeric_limits<int64_t>::max());
        } else if (config.command == Command::STATUS && arg == "--watch") {
            config.watch_interval = std::chrono::milliseconds(
                parse_integer(arg, value(), 1, std::numeric_limits<int32_t>::max()));
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (config.command == Command::NONE && !config.show_help && !config.show_version) {
        throw std::invalid_argument("No command given");
    }
    if (config.command == Command::STATUS || config.command == Command::INSTANCES) {
        const auto& d = config.discovery;
        if (!d.use_mdns && !d.use_proc && d.probe_ports.empty()) {
            throw std::invalid_argument("All discovery sources are disabled");
        }
    }

    return config;
}

void print_usage(const char* program) {
    std::cout << "agentwatch - discover local agent hosts and their sessions\n\n";
    std::cout << "Usage: " << program << " [options] <command> [command options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list                   List persisted sessions, newest first\n";
    std::cout << "    -d, --dir <pattern>  Only sessions whose directory matches (* and ?)\n";
    std::cout << "  instances              Discover running agent hosts\n";
    std::cout << "  status                 Show live session status of every host\n";
    std::cout << "    --busy, --idle, --retrying\n";
    std::cout << "                         Only sessions in that state\n";
    std::cout << "    --session <text>     Only session ids containing text\n";
    std::cout << "    --min-retry <n>      Hide retries with a lower attempt count\n";
    std::cout << "    --watch <ms>         Refresh every ms until interrupted\n";
    std::cout << "  zeroconf               Enable mDNS advertisement in the host config\n\n";
    std::cout << "Discovery options (instances, status):\n";
    std::cout << "  --timeout <ms>         Discovery timeout (default: 5000)\n";
    std::cout << "  --no-mdns              Skip mDNS browsing\n";
    std::cout << "  --no-proc              Skip the process table scan\n";
    std::cout << "  --probe-ports <list>   Also probe these local ports (e.g. 4096,4097)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --json                 One JSON object per line\n";
    std::cout << "  --log-level <level>    TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: WARN)\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  --version              Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program << " list -d '/home/me/*'\n";
    std::cout << "  " << program << " status --busy --watch 2000\n";
    std::cout << "  " << program << " --json instances --no-mdns\n";
}

void print_version() {
    std::cout << "agentwatch version " << VERSION << "\n";
}

} // namespace agentwatch::cli
