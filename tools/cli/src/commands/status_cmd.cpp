/**
 * @file status_cmd.cpp
 * @brief status command - live session status of every agent host
 */

#include "commands.hpp"
#include "../discovery.hpp"

#include <agentwatch/core/instance_cache.hpp>
#include <agentwatch/core/session_filter.hpp>
#include <agentwatch/core/status_poller.hpp>
#include <agentwatch/http/curl_status_client.hpp>
#include <agentwatch/utils/logger.hpp>

#include <chrono>
#include <csignal>
#include <thread>

namespace agentwatch::cli::commands {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_signal(int) {
    g_interrupted = 1;
}

void sleep_interruptibly(std::chrono::milliseconds interval) {
    auto until = std::chrono::steady_clock::now() + interval;
    while (!interrupted() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

} // anonymous namespace

void install_interrupt_handler() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

bool interrupted() {
    return g_interrupted != 0;
}

size_t poll_round(const std::vector<core::DiscoverySourcePtr>& sources,
                  const core::StatusPoller& poller,
                  const CliConfig& config, OutputFormatter& out) {
    core::InstanceCache cache(sources);
    auto targets = unique_status_targets(cache.discover(config.discovery.timeout));
    auto sessions = core::filterSessions(poller.poll(std::move(targets)), config.filter);

    size_t count = 0;
    while (auto status = sessions->next()) {
        if (count++ == 0) {
            out.print_session_header();
        }
        out.print_session(*status);
        out.flush();

        if (interrupted()) {
            sessions->cancel();
            break;
        }
    }
    LOG_DEBUG("Cli", "{} known hosts this round", cache.instances().size());
    return count;
}

int status_cmd(const CliConfig& config, OutputFormatter& out) {
    auto sources = make_sources(config.discovery);
    core::StatusPoller poller(std::make_shared<http::CurlStatusClient>());

    size_t round = 0;
    do {
        if (round++ > 0) {
            out.print_line("");
        }

        size_t shown = poll_round(sources, poller, config, out);
        if (shown == 0) {
            out.print_line("No matching sessions.");
        }
        LOG_DEBUG("Cli", "Round {}: {} sessions", round, shown);

        if (config.watch_interval && !interrupted()) {
            sleep_interruptibly(*config.watch_interval);
        }
    } while (config.watch_interval && !interrupted());

    return 0;
}

} // namespace agentwatch::cli::commands
