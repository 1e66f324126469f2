/**
 * @file test_helpers.hpp
 * @brief Loopback servers and temp directories shared by the unit tests
 */

#pragma once

#include <agentwatch/net/platform.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <thread>

namespace agentwatch {
namespace testing {

/**
 * @brief TCP listener on 127.0.0.1 with a kernel-chosen port
 */
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 16) != 0) {
            close();
            return;
        }

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackListener() { close(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    bool isValid() const { return fd_ >= 0; }
    uint16_t port() const { return port_; }
    int fd() const { return fd_; }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

/**
 * @brief Serves one canned HTTP response to every connection until stopped
 */
class CannedHttpServer {
public:
    CannedHttpServer(int statusCode, std::string body)
        : response_("HTTP/1.1 " + std::to_string(statusCode) + " Canned\r\n"
                    "Content-Type: application/json\r\n"
                    "Content-Length: " + std::to_string(body.size()) + "\r\n"
                    "Connection: close\r\n\r\n" + body)
    {
        thread_ = std::thread([this]() { serve(); });
    }

    ~CannedHttpServer() {
        stopped_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return listener_.port(); }
    int requests() const { return requests_.load(); }

private:
    void serve() {
        while (!stopped_.load()) {
            int fd = listener_.fd();
            if (fd < 0 || net::waitForSocket(fd, false, 50) <= 0) {
                continue;
            }
            int client = ::accept(fd, nullptr, nullptr);
            if (client < 0) {
                continue;
            }

            // Read until the end of the request headers.
            std::string request;
            char buffer[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                if (net::waitForSocket(client, false, 1000) <= 0) {
                    break;
                }
                ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) {
                    break;
                }
                request.append(buffer, static_cast<size_t>(n));
            }
            ++requests_;
            ::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
            ::close(client);
        }
    }

    LoopbackListener listener_;
    std::string response_;
    std::atomic<bool> stopped_{false};
    std::atomic<int> requests_{0};
    std::thread thread_;
};

/**
 * @brief Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        do {
            path_ = base / ("agentwatch-test-" + std::to_string(rd()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void write(const std::filesystem::path& relative, const std::string& content) const {
        auto full = path_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out << content;
    }

private:
    std::filesystem::path path_;
};

}  // namespace testing
}  // namespace agentwatch
