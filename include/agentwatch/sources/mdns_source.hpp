/**
 * @file mdns_source.hpp
 * @brief Discovery of agent hosts advertised over multicast DNS.
 *
 * A discover() call opens a browse session: a listener thread joins the
 * mDNS group, asks for the configured DNS-SD service type and streams every
 * advertised instance whose name contains the configured marker. The
 * session ends when its window elapses, when the consumer cancels the
 * stream, or when stop() is called.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/channel.hpp"
#include "agentwatch/core/discovery_source.hpp"
#include "agentwatch/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agentwatch {
namespace sources {

/**
 * @struct MdnsConfig
 * @brief Browse parameters.
 */
struct MdnsConfig {
    std::string service_type = "_http._tcp.local";
    std::string name_marker = "opencode";           ///< Required in the instance name
    std::string multicast_group = "224.0.0.251";
    uint16_t port = 5353;
    std::chrono::milliseconds browse_window{5000};  ///< Capped by the discover() timeout
    std::chrono::milliseconds requery_interval{1000};
    int receive_poll_ms = 100;
};

/**
 * @class MdnsSource
 * @brief DiscoverySource backed by an mDNS browse.
 *
 * Emits instances with origin MDNS, the advertised port and the SRV target
 * as hostname. The same (host, port) is reported once per browse session.
 * Socket failures end the session early with a warning; they never throw.
 */
class AGENTWATCH_CORE_API MdnsSource : public core::DiscoverySource {
public:
    explicit MdnsSource(MdnsConfig config = MdnsConfig());

    /**
     * @brief Stops every browse session and joins the listener threads.
     */
    ~MdnsSource() override;

    MdnsSource(const MdnsSource&) = delete;
    MdnsSource& operator=(const MdnsSource&) = delete;

    core::InstanceStreamPtr discover(std::chrono::milliseconds timeout) override;

    void stop() override;

    const char* name() const override { return "mdns"; }

    const MdnsConfig& config() const { return config_; }

private:
    using InstanceChannel = core::Channel<core::DiscoveredInstance>;

    struct BrowseSession {
        std::shared_ptr<InstanceChannel> channel;
        std::thread listener;
    };

    void browse(std::shared_ptr<InstanceChannel> channel,
                std::chrono::steady_clock::time_point deadline) const;

    void reapFinished();

    MdnsConfig config_;

    std::mutex mutex_;
    std::vector<BrowseSession> sessions_;
};

}  // namespace sources
}  // namespace agentwatch
