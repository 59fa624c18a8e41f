#include <gtest/gtest.h>
#include <session/session_actor.hpp>
#include "fake_transport.hpp"

class SessionActorTest : public ::testing::Test {
protected:
    void SetUp() override { settings = fast_settings(); }

    void TearDown() override {
        if (actor) actor->stop();
    }

    SessionActor& start() {
        actor = std::make_unique<SessionActor>("sess-1", fake_config(), settings, factory, commands, events);
        actor->start();
        return *actor;
    }

    SessionActor& start_connected() {
        auto& a = start();
        auto r = a.connect().get();
        EXPECT_TRUE(r.is_ok()) << r.error.describe();
        return a;
    }

    static SftpOp op(SftpOpKind kind, const std::string& path) {
        SftpOp o;
        o.kind = kind;
        o.path = path;
        return o;
    }

    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeTransportFactory factory{host};
    CancelRegistry commands{"command", ErrorKind::DuplicateCommandId, ErrorKind::CommandNotFound};
    RecordingEvents events;
    ClientSettings settings;
    std::unique_ptr<SessionActor> actor;
};

TEST_F(SessionActorTest, ConnectReportsStatusTransitions) {
    auto& a = start_connected();
    EXPECT_EQ(a.status(), SessionStatus::Connected);
    auto seen = events.session_statuses("sess-1");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], SessionStatus::Connecting);
    EXPECT_EQ(seen[1], SessionStatus::Connected);
}

TEST_F(SessionActorTest, ConnectIsIdempotentWhileConnected) {
    auto& a = start_connected();
    ASSERT_TRUE(a.connect().get().is_ok());
    EXPECT_EQ(host->connects(), 1);
}

TEST_F(SessionActorTest, RefusedConnectIsConnectFailed) {
    host->set_refuse_connections(true);
    auto& a = start();
    auto r = a.connect().get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::ConnectFailed);
    EXPECT_EQ(a.status(), SessionStatus::Disconnected);
}

TEST_F(SessionActorTest, RequestsBeforeConnectFail) {
    auto& a = start();
    auto r = a.exec("echo hi", "c1").get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::SessionLost);
    EXPECT_EQ(a.sftp(op(SftpOpKind::List, "/")).get().kind(), ErrorKind::SessionLost);
}

TEST_F(SessionActorTest, ExecStreamsOutput) {
    auto& a = start_connected();
    auto r = a.exec("echo hello world", "c1").get();
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.stdout_data, "hello world\n");
    EXPECT_EQ(r.value.exit_status, 0);
    EXPECT_EQ(events.output_of("c1"), "hello world\n");
    EXPECT_FALSE(commands.contains("c1"));
}

TEST_F(SessionActorTest, RequestsAreHandledInOrder) {
    auto& a = start_connected();
    auto made = a.sftp(op(SftpOpKind::Mkdir, "/work"));
    auto seen = a.sftp(op(SftpOpKind::Stat, "/work"));
    SftpOp write = op(SftpOpKind::WriteFile, "/work/notes.txt");
    write.content = "first";
    auto written = a.sftp(write);
    auto read = a.sftp(op(SftpOpKind::ReadFile, "/work/notes.txt"));

    ASSERT_TRUE(made.get().is_ok());
    auto st = seen.get();
    ASSERT_TRUE(st.is_ok()) << st.error.describe();
    EXPECT_TRUE(st.value.entry.is_dir);
    ASSERT_TRUE(written.get().is_ok());
    auto content = read.get();
    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(content.value.content, "first");
}

TEST_F(SessionActorTest, ReadFileReturnsPrefixOrWholeFile) {
    auto& a = start_connected();
    host->put_file("/f.txt", "alphabet");
    SftpOp head = op(SftpOpKind::ReadFile, "/f.txt");
    head.max_bytes = 3;
    auto r = a.sftp(head).get();
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.content, "alp");

    std::string big(5 * 1024 * 1024 + 17, 'x');
    host->put_file("/big.bin", big);
    auto whole = a.sftp(op(SftpOpKind::ReadFile, "/big.bin")).get();
    ASSERT_TRUE(whole.is_ok()) << whole.error.describe();
    EXPECT_EQ(whole.value.content.size(), big.size());
}

TEST_F(SessionActorTest, LongCommandDoesNotBlockFileOperations) {
    auto& a = start_connected();
    host->put_file("/etc/motd", "welcome");
    auto running = a.exec("sleep 30", "long");

    auto listed = a.sftp(op(SftpOpKind::List, "/etc"));
    ASSERT_EQ(listed.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto r = listed.get();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.entries.size(), 1u);
    EXPECT_EQ(r.value.entries[0].name, "motd");
    EXPECT_EQ(running.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    ASSERT_TRUE(a.cancel_exec("long").get().is_ok());
    auto done = running.get();
    ASSERT_TRUE(done.is_err());
    EXPECT_EQ(done.kind(), ErrorKind::Cancelled);
}

TEST_F(SessionActorTest, DuplicateCommandIdIsRejected) {
    auto& a = start_connected();
    auto first = a.exec("sleep 30", "dup");
    auto second = a.exec("echo again", "dup").get();
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind(), ErrorKind::DuplicateCommandId);

    ASSERT_TRUE(a.cancel_exec("dup").get().is_ok());
    EXPECT_EQ(first.get().kind(), ErrorKind::Cancelled);

    // The id is free again once the first command answered
    auto third = a.exec("echo again", "dup").get();
    ASSERT_TRUE(third.is_ok());
}

TEST_F(SessionActorTest, CancelOfForeignCommandIsNotFound) {
    auto& a = start_connected();
    auto foreign = commands.acquire("theirs", "sess-2");
    ASSERT_TRUE(foreign.is_ok());
    auto r = a.cancel_exec("theirs").get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::CommandNotFound);
    EXPECT_FALSE(foreign.value.cancelled());
}

TEST_F(SessionActorTest, CancelLeavesSiblingCommandRunning) {
    auto& a = start_connected();
    auto first = a.exec("sleep 30", "a");
    auto second = a.exec("sleep 30", "b");
    ASSERT_TRUE(wait_until([&] { return commands.contains("a") && commands.contains("b"); }));

    ASSERT_TRUE(a.cancel_exec("a").get().is_ok());
    EXPECT_EQ(first.get().kind(), ErrorKind::Cancelled);
    EXPECT_EQ(second.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);
    EXPECT_TRUE(commands.contains("b"));

    ASSERT_TRUE(a.cancel_exec("b").get().is_ok());
    EXPECT_EQ(second.get().kind(), ErrorKind::Cancelled);
}

TEST_F(SessionActorTest, ChannelCeilingRefusesExtraExec) {
    settings.channels.max_per_connection = 2;
    auto& a = start_connected();
    auto s1 = a.open_channel(ChannelType::Sftp).get();
    auto s2 = a.open_channel(ChannelType::Sftp).get();
    ASSERT_TRUE(s1.is_ok() && s2.is_ok());

    auto refused = a.exec("echo hi", "c1").get();
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.kind(), ErrorKind::ChannelLimitExceeded);
    EXPECT_EQ(refused.error.id, "c1");
    EXPECT_FALSE(commands.contains("c1"));

    a.release_channel(s1.value);
    auto ok = a.exec("echo hi", "c1").get();
    ASSERT_TRUE(ok.is_ok()) << ok.error.describe();
}

TEST_F(SessionActorTest, ShellEchoesAndCloses) {
    auto& a = start_connected();
    ASSERT_TRUE(a.open_shell(120, 40).get().is_ok());
    ASSERT_TRUE(a.resize_shell(100, 30).get().is_ok());
    ASSERT_TRUE(a.write_shell("uptime\n").get().is_ok());
    EXPECT_TRUE(wait_until([&] { return events.shell_text("sess-1") == "uptime\n"; }));

    ASSERT_TRUE(a.close_shell().get().is_ok());
    EXPECT_EQ(events.shells_closed("sess-1"), 1);
    EXPECT_EQ(a.write_shell("x").get().kind(), ErrorKind::InvalidArgument);
}

TEST_F(SessionActorTest, ConnectionLossFailsRunningCommand) {
    auto& a = start_connected();
    auto running = a.exec("sleep 30", "c1");
    ASSERT_TRUE(wait_until([&] { return commands.contains("c1"); }));

    host->kill();
    ASSERT_EQ(running.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(running.get().kind(), ErrorKind::SessionLost);
    EXPECT_TRUE(wait_until([&] { return a.status() == SessionStatus::Disconnected; }));
}

TEST_F(SessionActorTest, DisconnectCancelsRunningCommands) {
    auto& a = start_connected();
    auto running = a.exec("sleep 30", "c1");
    ASSERT_TRUE(wait_until([&] { return commands.contains("c1"); }));

    ASSERT_TRUE(a.disconnect().get().is_ok());
    EXPECT_EQ(running.get().kind(), ErrorKind::Cancelled);
    EXPECT_EQ(a.status(), SessionStatus::Disconnected);
    EXPECT_FALSE(commands.contains("c1"));
}

TEST_F(SessionActorTest, AutomaticReconnectBacksOffThenGivesUp) {
    settings.reconnect.automatic = true;
    auto& a = start_connected();
    host->set_refuse_connections(true);
    host->kill();

    ASSERT_TRUE(wait_until([&] { return events.exhausted("sess-1"); }));
    EXPECT_EQ(events.failed_attempts("sess-1"), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(a.status(), SessionStatus::Disconnected);

    // A later explicit connect starts a fresh round
    host->set_refuse_connections(false);
    auto r = a.connect().get();
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(a.status(), SessionStatus::Connected);
    EXPECT_EQ(host->connects(), 2);
}

TEST_F(SessionActorTest, AutomaticReconnectRestoresSession) {
    settings.reconnect.automatic = true;
    auto& a = start_connected();
    host->kill();

    ASSERT_TRUE(wait_until([&] { return host->connects() == 2 && a.status() == SessionStatus::Connected; }));
    auto r = a.exec("echo back", "c1").get();
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.stdout_data, "back\n");
}

TEST_F(SessionActorTest, ManualReconnectReportsExhaustion) {
    auto& a = start_connected();
    host->kill();
    ASSERT_TRUE(wait_until([&] { return a.status() == SessionStatus::Disconnected; }));

    host->set_refuse_connections(true);
    auto r = a.connect().get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::ReconnectExhausted);
    EXPECT_TRUE(events.exhausted("sess-1"));
    EXPECT_EQ(events.failed_attempts("sess-1").size(), 3u);
}

TEST_F(SessionActorTest, UnansweredKeepaliveClosesSession) {
    auto& a = start_connected();
    host->set_answer_keepalives(false);
    EXPECT_TRUE(wait_until([&] { return a.status() == SessionStatus::Disconnected; }, 6000));
}

TEST_F(SessionActorTest, RequestsAfterStopAreRejected) {
    auto& a = start_connected();
    a.stop();
    auto r = a.connect().get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::SessionNotFound);
}
