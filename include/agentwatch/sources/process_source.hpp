/**
 * @file process_source.hpp
 * @brief Discovery of agent hosts from the local process table.
 *
 * Walks /proc one entry per pull. A process is an agent host when its
 * executable name mentions one of the known launchers and its remaining
 * arguments mention the agent marker.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/discovery_source.hpp"
#include "agentwatch/core/export.hpp"
#include "agentwatch/sources/cancellation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentwatch {
namespace sources {

/**
 * @struct ProcessSourceConfig
 * @brief Where and what to look for.
 */
struct ProcessSourceConfig {
    std::string proc_root = "/proc";
    std::vector<std::string> launchers = {"opencode", "bun", "node"};
    std::string marker = "opencode";
};

/**
 * @brief Split a NUL-separated /proc/<pid>/cmdline blob, dropping empty args.
 */
AGENTWATCH_CORE_API std::vector<std::string> splitCmdline(const std::string& raw);

/**
 * @brief True when argv[0] contains a launcher and argv[1..] contain the
 *        marker. Both checks ignore case.
 */
AGENTWATCH_CORE_API bool isAgentCommandLine(const std::vector<std::string>& args,
                                            const ProcessSourceConfig& config);

/**
 * @brief Value of the first "--port <n>" pair, if it parses.
 *
 * Leading digits are enough ("4096abc" gives 4096). Values outside the
 * port range are ignored.
 */
AGENTWATCH_CORE_API std::optional<uint16_t> extractPortArgument(const std::vector<std::string>& args);

/**
 * @class ProcessSource
 * @brief DiscoverySource over the process table.
 *
 * Emits instances with origin PROCESS carrying the pid, the --port value
 * when present and the working directory when readable. An unreadable proc
 * root gives an empty stream.
 */
class AGENTWATCH_CORE_API ProcessSource : public core::DiscoverySource {
public:
    explicit ProcessSource(ProcessSourceConfig config = ProcessSourceConfig());

    core::InstanceStreamPtr discover(std::chrono::milliseconds timeout) override;

    void stop() override;

    const char* name() const override { return "proc"; }

private:
    ProcessSourceConfig config_;
    CancellationSet running_;
};

}  // namespace sources
}  // namespace agentwatch
