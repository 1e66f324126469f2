/**
 * @file platform.hpp
 * @brief POSIX socket includes and small handle helpers.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace agentwatch {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

/**
 * @brief Switch a descriptor to non-blocking mode.
 * @return True on success.
 */
inline bool setNonBlocking(SocketHandle s, bool enable) {
    int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(s, F_SETFL, flags) == 0;
}

/**
 * @brief Wait until a descriptor is readable or writable.
 * @param timeoutMs Timeout in milliseconds (-1 = infinite).
 * @return 1 when ready, 0 on timeout, -1 on error.
 */
inline int waitForSocket(SocketHandle s, bool forWrite, int timeoutMs) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(s, &set);

    struct timeval tv;
    struct timeval* tvp = nullptr;
    if (timeoutMs >= 0) {
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        tvp = &tv;
    }

    int result = forWrite
        ? ::select(s + 1, nullptr, &set, nullptr, tvp)
        : ::select(s + 1, &set, nullptr, nullptr, tvp);
    if (result < 0) {
        return -1;
    }
    return result == 0 ? 0 : 1;
}

}  // namespace net
}  // namespace agentwatch
