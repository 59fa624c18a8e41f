#include <gtest/gtest.h>
#include <platform/socket_util.hpp>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

class SocketUtilTest : public ::testing::Test {
protected:
    void SetUp() override {
        int port = 0;
        auto l = platform::listen_local(0, port);
        ASSERT_TRUE(l.is_ok()) << l.error.describe();
        listener = l.value;
        auto c = platform::connect_tcp("127.0.0.1", port, 2000);
        ASSERT_TRUE(c.is_ok()) << c.error.describe();
        sock = c.value;
    }

    void TearDown() override {
        platform::close_socket(sock);
        platform::close_socket(listener);
    }

    int listener = -1;
    int sock = -1;
};

TEST_F(SocketUtilTest, KeepaliveBoundsUnacknowledgedData) {
#ifndef TCP_USER_TIMEOUT
    GTEST_SKIP() << "TCP_USER_TIMEOUT not available";
#else
    // interval 15 s, three missed keepalives
    platform::enable_tcp_keepalive(sock, 15 * 3 * 1000);

    int keepalive = 0;
    socklen_t len = sizeof(keepalive);
    ASSERT_EQ(getsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &keepalive, &len), 0);
    EXPECT_NE(keepalive, 0);

    unsigned int timeout = 0;
    len = sizeof(timeout);
    ASSERT_EQ(getsockopt(sock, IPPROTO_TCP, TCP_USER_TIMEOUT, &timeout, &len), 0);
    EXPECT_EQ(timeout, 45000u);
#endif
}

TEST_F(SocketUtilTest, KeepaliveWithoutTimeoutLeavesDefault) {
#ifndef TCP_USER_TIMEOUT
    GTEST_SKIP() << "TCP_USER_TIMEOUT not available";
#else
    platform::enable_tcp_keepalive(sock);
    unsigned int timeout = 1;
    socklen_t len = sizeof(timeout);
    ASSERT_EQ(getsockopt(sock, IPPROTO_TCP, TCP_USER_TIMEOUT, &timeout, &len), 0);
    EXPECT_EQ(timeout, 0u);
#endif
}
