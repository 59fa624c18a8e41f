#include <gtest/gtest.h>
#include <ssh/connection.hpp>
#include "fake_transport.hpp"

class ConnectionTest : public ::testing::Test {
protected:
    std::shared_ptr<Connection> make() {
        auto settings = fast_settings();
        settings.keepalive.alive_count_max = 3;
        auto conn = Connection::create(fake_config(), std::unique_ptr<Transport>(new FakeTransport(host)),
                                       settings);
        conn->set_state_listener([this](ConnectionState s, const std::string&) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(s);
        });
        return conn;
    }

    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    std::mutex mutex;
    std::vector<ConnectionState> states;
};

TEST_F(ConnectionTest, StartsActive) {
    auto conn = make();
    EXPECT_EQ(conn->state(), ConnectionState::Active);
    EXPECT_TRUE(conn->is_open());
}

TEST_F(ConnectionTest, AnsweredKeepaliveKeepsActive) {
    auto conn = make();
    EXPECT_TRUE(conn->tick_keepalive());
    EXPECT_EQ(conn->state(), ConnectionState::Active);
    EXPECT_EQ(conn->missed_keepalives(), 0);
}

TEST_F(ConnectionTest, MissedKeepalivesDegradeThenClose) {
    auto conn = make();
    host->set_answer_keepalives(false);

    EXPECT_TRUE(conn->tick_keepalive());
    EXPECT_EQ(conn->state(), ConnectionState::Degraded);
    EXPECT_TRUE(conn->tick_keepalive());
    EXPECT_EQ(conn->state(), ConnectionState::Degraded);
    EXPECT_FALSE(conn->tick_keepalive());
    EXPECT_EQ(conn->state(), ConnectionState::Closed);
    EXPECT_NE(conn->close_reason().find("unanswered"), std::string::npos);
}

TEST_F(ConnectionTest, AnsweredKeepaliveRecoversFromDegraded) {
    auto conn = make();
    host->set_answer_keepalives(false);
    conn->tick_keepalive();
    ASSERT_EQ(conn->state(), ConnectionState::Degraded);

    host->set_answer_keepalives(true);
    EXPECT_TRUE(conn->tick_keepalive());
    EXPECT_EQ(conn->state(), ConnectionState::Active);
    EXPECT_EQ(conn->missed_keepalives(), 0);
}

TEST_F(ConnectionTest, ChannelFaultClosesConnectionAndInvalidatesSiblings) {
    auto conn = make();
    auto shell = conn->channels().open(ChannelType::Shell);
    auto sftp = conn->channels().open(ChannelType::Sftp);
    ASSERT_TRUE(shell.is_ok() && sftp.is_ok());

    host->kill();
    char buf[16];
    auto r = shell.value->read(buf, sizeof(buf));
    EXPECT_EQ(r.status, IoStatus::Error);

    EXPECT_EQ(conn->state(), ConnectionState::Closed);
    EXPECT_TRUE(sftp.value->invalidated());
    EXPECT_TRUE(shell.value->invalidated());
}

TEST_F(ConnectionTest, CheckFaultNoticesDeadTransport) {
    auto conn = make();
    EXPECT_FALSE(conn->check_fault());
    host->kill();
    EXPECT_TRUE(conn->check_fault());
    EXPECT_FALSE(conn->is_open());
}

TEST_F(ConnectionTest, ListenerSeesClosedOnce) {
    auto conn = make();
    conn->fail("first");
    conn->fail("second");
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0], ConnectionState::Closed);
    EXPECT_EQ(conn->close_reason(), "first");
}

TEST_F(ConnectionTest, GracefulCloseReleasesChannels) {
    auto conn = make();
    auto shell = conn->channels().open(ChannelType::Shell);
    ASSERT_TRUE(shell.is_ok());
    conn->close();
    EXPECT_EQ(shell.value->state(), ChannelState::Closed);
    EXPECT_EQ(conn->channels().open_count(), 0);
    EXPECT_FALSE(conn->is_open());
}
