/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for the UDP socket used by the mDNS browser
 */

#include <gtest/gtest.h>
#include <agentwatch/net/udp_socket.hpp>

#include <chrono>
#include <cstring>
#include <string>

using namespace agentwatch::net;

class UdpSocketTest : public ::testing::Test {};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, MoveTransfersOwnership) {
    UdpSocket first;
    ASSERT_TRUE(first.bind(0, "127.0.0.1"));
    uint16_t port = first.getLocalPort();

    UdpSocket second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_TRUE(second.isValid());
    EXPECT_EQ(second.getLocalPort(), port);
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket receiver;
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));
    uint16_t port = receiver.getLocalPort();

    UdpSocket sender;
    const char* message = "Hello, UDP!";
    int sent = sender.sendTo(SocketAddress("127.0.0.1", port), message, std::strlen(message));
    EXPECT_EQ(sent, static_cast<int>(std::strlen(message)));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer) - 1, 1000, from);
    ASSERT_GT(received, 0);
    buffer[received] = '\0';
    EXPECT_STREQ(buffer, message);
    EXPECT_EQ(from.ip, "127.0.0.1");
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[256];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    int received = socket.receiveFrom(buffer, sizeof(buffer), 100, from);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(received, 0);
    EXPECT_GE(elapsed.count(), 90);
}

TEST_F(UdpSocketTest, OperationsOnClosedSocketFail) {
    UdpSocket socket;
    socket.close();

    char buffer[16];
    SocketAddress from;
    EXPECT_FALSE(socket.bind(0));
    EXPECT_EQ(socket.sendTo(SocketAddress("127.0.0.1", 9), "x", 1), -1);
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 10, from), -1);
}

TEST_F(UdpSocketTest, InvalidMulticastGroupRejected) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0));
    EXPECT_FALSE(socket.joinMulticastGroup("not-an-address"));
}

// Multicast may be unavailable in sandboxes; only check it does not crash.
TEST_F(UdpSocketTest, JoinMdnsGroup) {
    UdpSocket socket;
    ASSERT_TRUE(socket.setReuseAddress(true));
    ASSERT_TRUE(socket.bind(0));
    bool joined = socket.joinMulticastGroup("224.0.0.251");
    (void)joined;
    EXPECT_TRUE(socket.setMulticastTTL(255));
}
