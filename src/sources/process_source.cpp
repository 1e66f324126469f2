/**
 * @file process_source.cpp
 * @brief ProcessSource implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/sources/process_source.hpp"
#include "agentwatch/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace agentwatch {
namespace sources {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isPidName(const std::string& name) {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

// State of one walk over the proc root, shared with the stream's producer.
struct ProcessWalk {
    ProcessSourceConfig config;
    StopFlag stopped;
    std::chrono::steady_clock::time_point deadline;
    fs::directory_iterator it;
    bool opened = false;

    std::optional<core::DiscoveredInstance> next() {
        if (!opened) {
            opened = true;
            std::error_code ec;
            it = fs::directory_iterator(config.proc_root, ec);
            if (ec) {
                LOG_WARN("Proc", "Cannot read {}: {}", config.proc_root, ec.message());
                return std::nullopt;
            }
        }

        std::error_code ec;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                LOG_WARN("Proc", "Listing {} failed: {}", config.proc_root, ec.message());
                return std::nullopt;
            }
            if (stopped->load() || std::chrono::steady_clock::now() >= deadline) {
                LOG_DEBUG("Proc", "Scan ended early");
                return std::nullopt;
            }

            const fs::path entry = it->path();
            std::string pidText = entry.filename().string();
            if (!isPidName(pidText)) {
                continue;
            }

            // Processes may exit between listing and reading; skip them.
            auto raw = readFile(entry / "cmdline");
            if (!raw) {
                continue;
            }
            auto args = splitCmdline(*raw);
            if (!isAgentCommandLine(args, config)) {
                continue;
            }

            std::optional<std::string> cwd;
            std::error_code linkError;
            fs::path target = fs::read_symlink(entry / "cwd", linkError);
            if (!linkError) {
                cwd = target.string();
            }

            int pid = std::atoi(pidText.c_str());
            auto port = extractPortArgument(args);
            LOG_DEBUG("Proc", "Agent process {} (port {})", pid, port ? *port : 0);

            it.increment(ec);
            return core::DiscoveredInstance::fromProcess(pid, port, cwd);
        }
        return std::nullopt;
    }
};

}  // namespace

std::vector<std::string> splitCmdline(const std::string& raw) {
    std::vector<std::string> args;
    std::string current;
    for (char c : raw) {
        if (c == '\0') {
            if (!current.empty()) {
                args.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        args.push_back(std::move(current));
    }
    return args;
}

bool isAgentCommandLine(const std::vector<std::string>& args,
                        const ProcessSourceConfig& config) {
    if (args.empty()) {
        return false;
    }

    std::string command = toLower(args[0]);
    bool launcher = std::any_of(config.launchers.begin(), config.launchers.end(),
                                [&command](const std::string& name) {
                                    return command.find(toLower(name)) != std::string::npos;
                                });
    if (!launcher) {
        return false;
    }

    std::string rest;
    for (size_t i = 1; i < args.size(); ++i) {
        if (i > 1) {
            rest += ' ';
        }
        rest += args[i];
    }
    return toLower(rest).find(toLower(config.marker)) != std::string::npos;
}

std::optional<uint16_t> extractPortArgument(const std::vector<std::string>& args) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] != "--port") {
            continue;
        }
        const char* text = args[i + 1].c_str();
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(text, &end, 10);
        if (end == text || errno == ERANGE) {
            continue;
        }
        if (value < 0 || value > 65535) {
            continue;
        }
        return static_cast<uint16_t>(value);
    }
    return std::nullopt;
}

ProcessSource::ProcessSource(ProcessSourceConfig config)
    : config_(std::move(config))
{}

core::InstanceStreamPtr ProcessSource::discover(std::chrono::milliseconds timeout) {
    auto walk = std::make_shared<ProcessWalk>();
    walk->config = config_;
    walk->stopped = running_.add();
    walk->deadline = std::chrono::steady_clock::now() + timeout;

    auto stopped = walk->stopped;
    return std::make_unique<core::GeneratorStream<core::DiscoveredInstance>>(
        [walk]() { return walk->next(); },
        [stopped]() { stopped->store(true); });
}

void ProcessSource::stop() {
    running_.cancelAll();
}

}  // namespace sources
}  // namespace agentwatch
