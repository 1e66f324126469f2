/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/net/udp_socket.hpp"
#include "agentwatch/utils/logger.hpp"

#include <cstring>

namespace agentwatch {
namespace net {

namespace {

// Empty and "0.0.0.0" both mean INADDR_ANY.
bool toInAddr(const std::string& text, struct in_addr& out) {
    if (text.empty() || text == "0.0.0.0") {
        out.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, text.c_str(), &out) == 1;
}

bool toSockaddr(const std::string& ip, uint16_t port, struct sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return toInAddr(ip, out.sin_addr);
}

SocketAddress fromSockaddr(const struct sockaddr_in& addr) {
    char text[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text));
    return SocketAddress(text, ntohs(addr.sin_port));
}

}  // namespace

UdpSocket::UdpSocket()
    : socket_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
    , lastError_(0)
{
    if (!isValid()) {
        fail();
        LOG_ERROR("UdpSocket", "socket() failed: {}", std::strerror(lastError_));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

template<typename T>
bool UdpSocket::setOption(int level, int name, const T& value, const char* what) {
    if (!isValid()) {
        return false;
    }
    if (::setsockopt(socket_, level, name, &value, sizeof(value)) != 0) {
        fail();
        LOG_DEBUG("UdpSocket", "{} failed: {}", what, std::strerror(lastError_));
        return false;
    }
    return true;
}

int UdpSocket::fail() {
    lastError_ = getLastSocketError();
    return -1;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in local;
    if (!toSockaddr(address, port, local)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }
    if (::bind(socket_, reinterpret_cast<const struct sockaddr*>(&local), sizeof(local)) != 0) {
        fail();
        LOG_DEBUG("UdpSocket", "bind {}:{} failed: {}", address, port, std::strerror(lastError_));
        return false;
    }

    LOG_TRACE("UdpSocket", "Bound {}:{}", address, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    struct sockaddr_in local{};
    socklen_t length = sizeof(local);
    if (!isValid() ||
        ::getsockname(socket_, reinterpret_cast<struct sockaddr*>(&local), &length) != 0) {
        return 0;
    }
    return ntohs(local.sin_port);
}

bool UdpSocket::setReuseAddress(bool enable) {
    int flag = enable ? 1 : 0;
    if (!setOption(SOL_SOCKET, SO_REUSEADDR, flag, "SO_REUSEADDR")) {
        return false;
    }
#ifdef SO_REUSEPORT
    // Best effort: some responders hold 5353 with SO_REUSEPORT only.
    setOption(SOL_SOCKET, SO_REUSEPORT, flag, "SO_REUSEPORT");
#endif
    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    unsigned char hops = static_cast<unsigned char>(ttl);
    return setOption(IPPROTO_IP, IP_MULTICAST_TTL, hops, "IP_MULTICAST_TTL");
}

bool UdpSocket::joinMulticastGroup(const std::string& groupAddress,
                                   const std::string& interfaceAddress) {
    struct ip_mreq membership{};
    if (inet_pton(AF_INET, groupAddress.c_str(), &membership.imr_multiaddr) != 1 ||
        !toInAddr(interfaceAddress, membership.imr_interface)) {
        LOG_ERROR("UdpSocket", "Invalid multicast membership {} on '{}'",
                  groupAddress, interfaceAddress);
        return false;
    }
    if (!setOption(IPPROTO_IP, IP_ADD_MEMBERSHIP, membership, "IP_ADD_MEMBERSHIP")) {
        LOG_WARN("UdpSocket", "Cannot join {}: {}", groupAddress, std::strerror(lastError_));
        return false;
    }

    LOG_DEBUG("UdpSocket", "Joined multicast group {}", groupAddress);
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    struct sockaddr_in remote;
    if (!isValid() || dest.ip.empty() || !toSockaddr(dest.ip, dest.port, remote)) {
        return -1;
    }

    ssize_t sent = ::sendto(socket_, data, length, 0,
                            reinterpret_cast<const struct sockaddr*>(&remote), sizeof(remote));
    return sent < 0 ? fail() : static_cast<int>(sent);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0) {
        int ready = waitForSocket(socket_, false, timeoutMs);
        if (ready <= 0) {
            return ready < 0 ? fail() : 0;
        }
    }

    struct sockaddr_in remote{};
    socklen_t length = sizeof(remote);
    ssize_t received = ::recvfrom(socket_, buffer, bufferSize, 0,
                                  reinterpret_cast<struct sockaddr*>(&remote), &length);
    if (received < 0) {
        return fail();
    }

    sender = fromSockaddr(remote);
    return static_cast<int>(received);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

}  // namespace net
}  // namespace agentwatch
