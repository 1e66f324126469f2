/**
 * @file mdns_source.cpp
 * @brief MdnsSource implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/sources/mdns_source.hpp"
#include "agentwatch/sources/dns_message.hpp"
#include "agentwatch/net/udp_socket.hpp"
#include "agentwatch/utils/logger.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <set>
#include <utility>

namespace agentwatch {
namespace sources {

namespace {

constexpr size_t RECEIVE_BUFFER_SIZE = 9000;

}  // namespace

MdnsSource::MdnsSource(MdnsConfig config)
    : config_(std::move(config))
{}

MdnsSource::~MdnsSource() {
    stop();

    std::vector<BrowseSession> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& session : sessions) {
        if (session.listener.joinable()) {
            session.listener.join();
        }
    }
}

core::InstanceStreamPtr MdnsSource::discover(std::chrono::milliseconds timeout) {
    reapFinished();

    auto window = std::min(timeout, config_.browse_window);
    auto deadline = std::chrono::steady_clock::now() + window;
    auto channel = std::make_shared<InstanceChannel>();

    LOG_DEBUG("Mdns", "Browsing {} for {} ms", config_.service_type, window.count());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        BrowseSession session;
        session.channel = channel;
        session.listener = std::thread(&MdnsSource::browse, this, channel, deadline);
        sessions_.push_back(std::move(session));
    }

    return std::make_unique<core::ChannelStream<core::DiscoveredInstance>>(channel, deadline);
}

void MdnsSource::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& session : sessions_) {
        session.channel->close();
    }
}

void MdnsSource::reapFinished() {
    std::vector<BrowseSession> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto split = std::partition(sessions_.begin(), sessions_.end(),
                                    [](const BrowseSession& s) { return !s.channel->isClosed(); });
        std::move(split, sessions_.end(), std::back_inserter(finished));
        sessions_.erase(split, sessions_.end());
    }
    // A closed channel makes its listener exit within one receive poll.
    for (auto& session : finished) {
        if (session.listener.joinable()) {
            session.listener.join();
        }
    }
}

void MdnsSource::browse(std::shared_ptr<InstanceChannel> channel,
                        std::chrono::steady_clock::time_point deadline) const {
    using Clock = std::chrono::steady_clock;

    net::UdpSocket socket;
    socket.setReuseAddress(true);

    bool unicast = false;
    if (!socket.bind(config_.port)) {
        // Another responder owns the port exclusively; ask for unicast replies.
        LOG_DEBUG("Mdns", "Port {} unavailable, using unicast responses", config_.port);
        socket = net::UdpSocket();
        if (!socket.bind(0)) {
            LOG_WARN("Mdns", "Cannot bind browse socket: {}",
                     std::strerror(socket.getLastError()));
            channel->close();
            return;
        }
        unicast = true;
    } else if (!socket.joinMulticastGroup(config_.multicast_group)) {
        channel->close();
        return;
    }
    socket.setMulticastTTL(255);

    auto query = buildPtrQuery(config_.service_type, unicast);
    if (query.empty()) {
        LOG_WARN("Mdns", "Invalid service type {}", config_.service_type);
        channel->close();
        return;
    }

    net::SocketAddress group(config_.multicast_group, config_.port);
    auto sendQuery = [&]() {
        if (socket.sendTo(group, query.data(), query.size()) < 0) {
            LOG_DEBUG("Mdns", "Query send failed: {}", std::strerror(socket.getLastError()));
        }
    };

    sendQuery();
    auto lastQuery = Clock::now();

    ServiceResolver resolver(config_.service_type);
    std::set<std::pair<std::string, uint16_t>> reported;
    std::vector<uint8_t> buffer(RECEIVE_BUFFER_SIZE);

    while (!channel->isClosed()) {
        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        if (now - lastQuery >= config_.requery_interval) {
            sendQuery();
            lastQuery = now;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int waitMs = static_cast<int>(std::min<int64_t>(remaining.count() + 1,
                                                        config_.receive_poll_ms));

        net::SocketAddress sender;
        int received = socket.receiveFrom(buffer.data(), buffer.size(), waitMs, sender);
        if (received < 0) {
            LOG_WARN("Mdns", "Receive failed: {}", std::strerror(socket.getLastError()));
            break;
        }
        if (received == 0) {
            continue;
        }

        auto records = parseDnsResponse(buffer.data(), static_cast<size_t>(received));
        for (const auto& service : resolver.add(records)) {
            if (service.instance.find(config_.name_marker) == std::string::npos) {
                LOG_TRACE("Mdns", "Ignoring service {}", service.instance);
                continue;
            }
            if (service.port == 0 ||
                !reported.insert({service.host, service.port}).second) {
                continue;
            }

            LOG_DEBUG("Mdns", "Found {} at {}:{} (from {})",
                      service.instance, service.host, service.port, sender.toString());
            if (!channel->send(core::DiscoveredInstance::fromMdns(service.port, service.host))) {
                break;
            }
        }
    }

    channel->close();
    LOG_TRACE("Mdns", "Browse finished, {} instances", reported.size());
}

}  // namespace sources
}  // namespace agentwatch
