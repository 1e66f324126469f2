/**
 * @file curl_status_client.hpp
 * @brief StatusClient over HTTP using libcurl.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/export.hpp"
#include "agentwatch/core/status_poller.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace agentwatch {
namespace http {

/**
 * @struct HttpClientConfig
 * @brief Where and how long to ask.
 *
 * Agent hosts bind to the loopback interface, so the advertised hostname is
 * not used to build the URL.
 */
struct HttpClientConfig {
    std::string host = "localhost";
    std::string status_path = "/api/session/status";
    std::chrono::milliseconds timeout{2000};
};

/**
 * @brief URL of an instance's status endpoint.
 */
AGENTWATCH_CORE_API std::string buildStatusUrl(const HttpClientConfig& config, uint16_t port);

/**
 * @class CurlStatusClient
 * @brief One GET per call; any transport error or non-2xx reply is nullopt.
 *
 * Thread-safe: every call uses its own easy handle.
 */
class AGENTWATCH_CORE_API CurlStatusClient : public core::StatusClient {
public:
    explicit CurlStatusClient(HttpClientConfig config = HttpClientConfig());

    std::optional<std::string> fetchStatus(const core::DiscoveredInstance& instance) override;

    /**
     * @brief GET an arbitrary URL with this client's timeout.
     */
    std::optional<std::string> get(const std::string& url);

private:
    HttpClientConfig config_;
};

}  // namespace http
}  // namespace agentwatch
