/**
 * @file tcp_probe.cpp
 * @brief probeTcpPort implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/net/tcp_probe.hpp"
#include "agentwatch/net/platform.hpp"
#include "agentwatch/utils/logger.hpp"

#include <cstring>

namespace agentwatch {
namespace net {

namespace {

// Closes the descriptor on every return path.
class ScopedSocket {
public:
    explicit ScopedSocket(SocketHandle s) : socket_(s) {}
    ~ScopedSocket() {
        if (socket_ != INVALID_SOCKET_HANDLE) {
            closeSocket(socket_);
        }
    }
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    SocketHandle get() const { return socket_; }

private:
    SocketHandle socket_;
};

}  // namespace

ProbeResult probeTcpPort(const std::string& ip, uint16_t port, int timeoutMs) {
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("TcpProbe", "Invalid probe address: {}", ip);
        return ProbeResult::ERROR;
    }

    ScopedSocket sock(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (sock.get() == INVALID_SOCKET_HANDLE) {
        LOG_ERROR("TcpProbe", "Failed to create socket: {}", std::strerror(errno));
        return ProbeResult::ERROR;
    }
    if (!setNonBlocking(sock.get(), true)) {
        return ProbeResult::ERROR;
    }

    int rc = ::connect(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        return ProbeResult::OPEN;
    }
    if (errno != EINPROGRESS) {
        return errno == ECONNREFUSED ? ProbeResult::CLOSED : ProbeResult::ERROR;
    }

    int ready = waitForSocket(sock.get(), true, timeoutMs);
    if (ready == 0) {
        return ProbeResult::TIMEOUT;
    }
    if (ready < 0) {
        return ProbeResult::ERROR;
    }

    int soError = 0;
    socklen_t len = sizeof(soError);
    if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
        return ProbeResult::ERROR;
    }
    if (soError != 0) {
        LOG_TRACE("TcpProbe", "{}:{} -> {}", ip, port, std::strerror(soError));
        return ProbeResult::CLOSED;
    }
    return ProbeResult::OPEN;
}

}  // namespace net
}  // namespace agentwatch
