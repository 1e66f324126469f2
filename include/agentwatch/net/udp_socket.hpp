/**
 * @file udp_socket.hpp
 * @brief UDP socket with multicast support, used by the mDNS browser.
 *
 * RAII wrapper around an IPv4 datagram socket. Supports multicast group
 * membership and a select()-based receive with a timeout.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/net/export.hpp"
#include "agentwatch/net/platform.hpp"

#include <cstdint>
#include <string>

namespace agentwatch {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct AGENTWATCH_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(5353);
 * sock.joinMulticastGroup("224.0.0.251");
 *
 * std::vector<uint8_t> buffer(9000);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 100, sender);
 * @endcode
 */
class AGENTWATCH_NET_API UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Enable SO_REUSEADDR (and SO_REUSEPORT where available).
     * Call before bind(); required to share 5353 with a system responder.
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Set the multicast TTL (1 = local subnet only).
     */
    bool setMulticastTTL(int ttl);

    /**
     * @brief Join a multicast group on the given interface (empty = any).
     */
    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    /**
     * @brief Send a datagram.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive a datagram with timeout.
     * @param timeoutMs Timeout in milliseconds (0 = poll, -1 = infinite).
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    /**
     * @brief errno of the last failed call.
     */
    int getLastError() const { return lastError_; }

private:
    template<typename T>
    bool setOption(int level, int name, const T& value, const char* what);

    // Records errno and returns the failure value callers propagate.
    int fail();

    SocketHandle socket_;
    int lastError_;
};

}  // namespace net
}  // namespace agentwatch
