#include <gtest/gtest.h>
#include <future>
#include <session/command_executor.hpp>
#include <ssh/channel_mux.hpp>
#include "fake_transport.hpp"

class CommandExecutorTest : public ::testing::Test {
protected:
    CommandExecutorTest() : executor(registry, settings(), 0) {}

    static ExecSettings settings() {
        ExecSettings s;
        s.poll_interval_ms = 2;
        return s;
    }

    std::shared_ptr<Channel> exec_channel(const std::string& command) {
        ChannelParams params;
        params.command = command;
        auto r = mux.open(ChannelType::Exec, params);
        EXPECT_TRUE(r.is_ok()) << r.error.describe();
        return r.value;
    }

    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeTransport transport{host};
    ChannelMux mux{transport, 10, 0};
    CancelRegistry registry{"command", ErrorKind::DuplicateCommandId, ErrorKind::CommandNotFound};
    CommandExecutor executor;
};

TEST_F(CommandExecutorTest, CollectsStdoutAndExitStatus) {
    auto reg = executor.admit("c1", "sess");
    ASSERT_TRUE(reg.is_ok());
    auto ch = exec_channel("echo hello");

    std::string streamed;
    auto r = executor.execute(*ch, "echo hello", reg.value,
                              [&](const std::string& chunk) { streamed += chunk; });
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.stdout_data, "hello\n");
    EXPECT_EQ(r.value.exit_status, 0);
    EXPECT_TRUE(r.value.succeeded());
    EXPECT_EQ(streamed, "hello\n");
    EXPECT_EQ(ch->state(), ChannelState::Closed);
}

TEST_F(CommandExecutorTest, NonZeroExitIsNotAnError) {
    auto reg = executor.admit("c1", "sess");
    ASSERT_TRUE(reg.is_ok());
    auto ch = exec_channel("err boom");
    auto r = executor.execute(*ch, "err boom", reg.value);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_status, 1);
    EXPECT_EQ(r.value.stderr_data, "boom\n");
    EXPECT_EQ(r.value.get_output(), "boom\n");
}

TEST_F(CommandExecutorTest, DuplicateIdWhileInFlight) {
    auto first = executor.admit("c1", "sess");
    ASSERT_TRUE(first.is_ok());
    auto second = executor.admit("c1", "sess");
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind(), ErrorKind::DuplicateCommandId);
}

TEST_F(CommandExecutorTest, CancelStopsLongCommand) {
    auto reg = executor.admit("long", "sess");
    ASSERT_TRUE(reg.is_ok());
    auto ch = exec_channel("sleep 30");

    auto running = std::async(std::launch::async, [&] {
        return executor.execute(*ch, "sleep 30", reg.value);
    });
    ASSERT_EQ(running.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    ASSERT_TRUE(executor.cancel("long").is_ok());
    ASSERT_EQ(running.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto r = running.get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::Cancelled);
    EXPECT_EQ(r.error.id, "long");
    EXPECT_EQ(ch->state(), ChannelState::Closed);
}

TEST_F(CommandExecutorTest, CancelUnknownId) {
    auto r = executor.cancel("nobody");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::CommandNotFound);
}

TEST_F(CommandExecutorTest, ConnectionLossReportsSessionLost) {
    auto reg = executor.admit("c1", "sess");
    ASSERT_TRUE(reg.is_ok());
    auto ch = exec_channel("sleep 30");

    auto running = std::async(std::launch::async, [&] {
        return executor.execute(*ch, "sleep 30", reg.value);
    });
    host->kill();
    ASSERT_EQ(running.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto r = running.get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::SessionLost);
}

TEST_F(CommandExecutorTest, TimeoutClosesChannel) {
    ExecSettings s = settings();
    s.timeout_secs = 1;
    CommandExecutor bounded(registry, s, 0);
    auto reg = bounded.admit("slow", "sess");
    ASSERT_TRUE(reg.is_ok());
    auto ch = exec_channel("sleep 30");

    auto r = bounded.execute(*ch, "sleep 30", reg.value);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::Timeout);
    EXPECT_EQ(ch->state(), ChannelState::Closed);
}
