/**
 * @file session_store.hpp
 * @brief Read-only access to the agent host's persisted session records.
 *
 * Records live under <storage>/session/<project>/<session>.json, one JSON
 * document per session, written by the agent host itself.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/export.hpp"
#include "agentwatch/proto/session.pb.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace agentwatch {
namespace session {

/**
 * @struct StoreConfig
 * @brief Location of the storage tree.
 */
struct AGENTWATCH_CORE_API StoreConfig {
    std::string storage_root;

    /**
     * @brief $OPENCODE_TEST_HOME/storage when set, otherwise
     *        $HOME/.local/share/opencode/storage.
     * @throws std::runtime_error if neither variable is set.
     */
    static StoreConfig fromEnvironment();

    std::string sessionDirectory() const;
};

/**
 * @brief Directory filter used by `list --dir`.
 *
 * Without a '*' the pattern must equal the directory. With one, '*' matches
 * any run of characters and '?' exactly one, anchored at both ends.
 */
AGENTWATCH_CORE_API bool matchesPattern(const std::string& directory, const std::string& pattern);

/**
 * @class SessionStore
 * @brief Lists persisted sessions, most recently updated first.
 */
class AGENTWATCH_CORE_API SessionStore {
public:
    explicit SessionStore(StoreConfig config);

    /**
     * @brief Every readable session whose directory matches @p pattern.
     *
     * An empty pattern matches everything. A missing session directory
     * gives an empty list; unreadable or malformed records are skipped
     * with a warning.
     */
    std::vector<proto::PersistedSession> list(const std::string& pattern = "") const;

    const StoreConfig& config() const { return config_; }

private:
    StoreConfig config_;
};

/**
 * @brief ISO-8601 UTC with milliseconds, e.g. "2024-05-01T12:00:00.000Z".
 */
AGENTWATCH_CORE_API std::string formatEpochMillis(int64_t epochMs);

/**
 * @brief Tab-separated table: id, title, updated, directory.
 *
 * Prints nothing for an empty list. Empty titles read "Untitled" and
 * newlines inside titles are written as a literal "\n".
 */
AGENTWATCH_CORE_API void formatSessionTable(std::ostream& out,
                                            const std::vector<proto::PersistedSession>& sessions);

}  // namespace session
}  // namespace agentwatch
