#include <gtest/gtest.h>
#include <ssh/port_forwarder.hpp>
#include <platform/socket_util.hpp>
#include "fake_transport.hpp"
#include <unistd.h>

class PortForwarderTest : public ::testing::Test {
protected:
    using OpenResult = Result<std::shared_ptr<Channel>>;

    void TearDown() override {
        forwarder.reset();
        if (client >= 0) platform::close_socket(client);
    }

    // Echo channel from the fake host, already open
    std::shared_ptr<Channel> echo_channel() {
        ChannelParams params;
        params.target_host = "db.internal";
        params.target_port = 5432;
        auto io = transport.open_channel(ChannelType::PortForward, params);
        EXPECT_TRUE(io.is_ok());
        auto ch = std::make_shared<Channel>(next_id++, ChannelType::PortForward, std::move(io.value));
        ch->mark_open();
        return ch;
    }

    ForwardInfo start(PortForwarder::ChannelOpener opener) {
        forwarder = std::make_unique<PortForwarder>(
            std::move(opener),
            [this](std::shared_ptr<Channel> ch) {
                std::lock_guard<std::mutex> lock(mutex);
                released.push_back(std::move(ch));
            });
        ForwardSpec spec;
        spec.target_host = "db.internal";
        spec.target_port = 5432;
        auto r = forwarder->start(spec);
        EXPECT_TRUE(r.is_ok()) << r.error.describe();
        return r.value;
    }

    void connect_client(int port) {
        auto c = platform::connect_tcp("127.0.0.1", port, 2000);
        ASSERT_TRUE(c.is_ok()) << c.error.describe();
        client = c.value;
    }

    std::string read_client(std::size_t want) {
        std::string got;
        char buf[256];
        wait_until([&] {
            if (platform::poll_socket(client, POLLIN, 20) & POLLIN) {
                ssize_t n = ::read(client, buf, sizeof(buf));
                if (n > 0) got.append(buf, static_cast<std::size_t>(n));
            }
            return got.size() >= want;
        });
        return got;
    }

    std::size_t released_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return released.size();
    }

    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeTransport transport{host};
    std::mutex mutex;
    std::vector<std::shared_ptr<Channel>> released;
    int next_id = 1;
    int client = -1;
    std::unique_ptr<PortForwarder> forwarder;
};

TEST_F(PortForwarderTest, PumpsBytesThroughChannel) {
    auto channel = echo_channel();
    auto info = start([&](const ChannelParams& params) {
        EXPECT_EQ(params.target_host, "db.internal");
        EXPECT_EQ(params.target_port, 5432);
        std::promise<OpenResult> p;
        p.set_value(OpenResult::Ok(channel));
        return p.get_future();
    });
    ASSERT_GT(info.local_port, 0);

    connect_client(info.local_port);
    ASSERT_EQ(::write(client, "ping", 4), 4);
    EXPECT_EQ(read_client(4), "ping");
    EXPECT_TRUE(wait_until([&] { return forwarder->list()[0].active_connections == 1; }));

    ASSERT_TRUE(forwarder->stop(info.id).is_ok());
    ASSERT_EQ(released_count(), 1u);
    EXPECT_EQ(released[0], channel);
    EXPECT_TRUE(forwarder->list().empty());
}

TEST_F(PortForwarderTest, StopWhileOpenPendingReleasesLateChannel) {
    std::promise<OpenResult> pending;
    std::atomic<bool> requested{false};
    auto info = start([&](const ChannelParams&) {
        requested = true;
        return pending.get_future();
    });

    connect_client(info.local_port);
    ASSERT_TRUE(wait_until([&] { return requested.load(); }));

    ASSERT_TRUE(forwarder->stop(info.id).is_ok());
    EXPECT_EQ(released_count(), 0u);

    // The open finishes after the tunnel is gone
    auto channel = echo_channel();
    pending.set_value(OpenResult::Ok(channel));
    forwarder->reap_orphans();
    ASSERT_EQ(released_count(), 1u);
    EXPECT_EQ(released[0], channel);

    forwarder->reap_orphans();
    EXPECT_EQ(released_count(), 1u);
}

TEST_F(PortForwarderTest, FailedLateOpenReleasesNothing) {
    std::promise<OpenResult> pending;
    std::atomic<bool> requested{false};
    auto info = start([&](const ChannelParams&) {
        requested = true;
        return pending.get_future();
    });

    connect_client(info.local_port);
    ASSERT_TRUE(wait_until([&] { return requested.load(); }));
    ASSERT_TRUE(forwarder->stop(info.id).is_ok());

    pending.set_value(OpenResult::Err(ErrorKind::ChannelLimitExceeded, "open", "", "ceiling reached"));
    forwarder->reap_orphans();
    EXPECT_EQ(released_count(), 0u);
}

TEST_F(PortForwarderTest, RejectsMissingTarget) {
    forwarder = std::make_unique<PortForwarder>(
        [](const ChannelParams&) { return std::promise<OpenResult>().get_future(); },
        [](std::shared_ptr<Channel>) {});
    ForwardSpec spec;
    auto r = forwarder->start(spec);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(forwarder->stop("fwd-missing").kind(), ErrorKind::InvalidArgument);
}
