/**
 * @file status_poller.hpp
 * @brief Fan-out of status queries over a stream of discovered instances.
 *
 * The StatusPoller walks its input once, in order, asking each instance's
 * status endpoint for its session map and flattening the answers into a
 * single stream of SessionStatus records. Every failure (unreachable host,
 * non-success reply, malformed body) is absorbed: that instance simply
 * contributes no sessions.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/discovery_source.hpp"
#include "agentwatch/core/export.hpp"
#include "agentwatch/core/session_status.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentwatch {
namespace core {

/**
 * @class StatusClient
 * @brief Fetches the raw status document of one instance.
 */
class AGENTWATCH_CORE_API StatusClient {
public:
    virtual ~StatusClient() = default;

    /**
     * @brief One best-effort query, no retries.
     * @return Response body on a 2xx reply; nullopt on any failure.
     */
    virtual std::optional<std::string> fetchStatus(const DiscoveredInstance& instance) = 0;
};

/**
 * @brief Decode a status document.
 *
 * The body must be a JSON object mapping session ids to objects carrying a
 * "type" of "idle", "busy" or "retry". Retry entries may also carry
 * "attempt", "message" and "next" (epoch ms), each optional. Entries that
 * are not objects or lack a recognized type are skipped. A body that is not
 * a JSON object yields no records. Records come out ordered by session id.
 *
 * @param port Port of the reporting instance, copied into every record.
 */
AGENTWATCH_CORE_API std::vector<SessionStatus> parseStatusPayload(const std::string& body,
                                                                  uint16_t port);

/**
 * @class StatusPoller
 * @brief Turns a stream of instances into a stream of session statuses.
 *
 * Usage:
 * @code
 * StatusPoller poller(std::make_shared<http::CurlStatusClient>());
 * auto sessions = poller.poll(cache.discover(std::chrono::seconds(5)));
 * while (auto session = sessions->next()) {
 *     std::cout << session->session_id << "\n";
 * }
 * @endcode
 */
class AGENTWATCH_CORE_API StatusPoller {
public:
    explicit StatusPoller(std::shared_ptr<StatusClient> client);

    /**
     * @brief Lazily poll each instance as it is pulled from @p instances.
     *
     * Nothing is fetched until the returned stream is pulled. Cancelling the
     * returned stream cancels @p instances.
     */
    SessionStreamPtr poll(InstanceStreamPtr instances) const;

private:
    std::shared_ptr<StatusClient> client_;
};

}  // namespace core
}  // namespace agentwatch
