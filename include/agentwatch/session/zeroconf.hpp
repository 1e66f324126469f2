/**
 * @file zeroconf.hpp
 * @brief Turns on mDNS advertisement in the agent host's configuration.
 *
 * The agent host reads its configuration from one of two JSON files. The
 * configurator picks the file the host is most likely using, sets
 * server.mdns to true and writes it back, keeping every other setting.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/export.hpp"

#include <string>

namespace agentwatch {
namespace session {

/**
 * @struct ZeroconfPaths
 * @brief Candidate configuration files, in order of preference.
 */
struct AGENTWATCH_CORE_API ZeroconfPaths {
    std::string primary;    ///< ~/.config/opencode/opencode.json
    std::string secondary;  ///< ~/.opencode/opencode.json

    /**
     * @throws std::runtime_error if HOME is not set.
     */
    static ZeroconfPaths defaults();
};

/**
 * @class ZeroconfConfigurator
 * @brief Chooses and rewrites the configuration file.
 *
 * Target choice: the first file that already has a server.mdns key; else
 * the only file that exists; else the primary file.
 */
class AGENTWATCH_CORE_API ZeroconfConfigurator {
public:
    static constexpr const char* SCHEMA_URL = "https://opencode.ai/config.json";

    explicit ZeroconfConfigurator(ZeroconfPaths paths);

    /**
     * @brief File enable() would write.
     */
    std::string chooseTarget() const;

    /**
     * @brief Set server.mdns = true (and $schema if absent) in the target.
     * @return Path of the file written.
     * @throws std::runtime_error if the target holds malformed JSON or
     *         cannot be written.
     */
    std::string enable() const;

private:
    ZeroconfPaths paths_;
};

}  // namespace session
}  // namespace agentwatch
