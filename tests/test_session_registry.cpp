#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <session/hostlink_service.hpp>
#include <session/session_registry.hpp>
#include <transfer/integrity.hpp>
#include "fake_transport.hpp"

class SessionRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeTransportFactory factory{host};
    RecordingEvents events;
    SessionRegistry registry{fast_settings(), factory, events};
};

TEST_F(SessionRegistryTest, ConnectAssignsSessionId) {
    auto r = registry.connect(fake_config("web"));
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value.rfind("sess-", 0), 0u);
    EXPECT_TRUE(registry.has_session(r.value));

    auto sessions = registry.list();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].id, r.value);
    EXPECT_EQ(sessions[0].name, "web");
    EXPECT_EQ(sessions[0].identity, "tester@web.example.test:22");
    EXPECT_EQ(sessions[0].status, SessionStatus::Connected);

    auto actor = registry.get(r.value);
    ASSERT_TRUE(actor.is_ok());
    EXPECT_EQ(actor.value->id(), r.value);
}

TEST_F(SessionRegistryTest, SessionsListInConnectOrder) {
    auto a = registry.connect(fake_config("a"));
    auto b = registry.connect(fake_config("b"));
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value, b.value);

    auto sessions = registry.list();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].id, a.value);
    EXPECT_EQ(sessions[1].id, b.value);
}

TEST_F(SessionRegistryTest, MissingHostIsRejected) {
    auto config = fake_config();
    config.host.clear();
    auto r = registry.connect(config);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(host->connects(), 0);
}

TEST_F(SessionRegistryTest, FailedConnectKeepsNoSession) {
    host->set_refuse_connections(true);
    auto r = registry.connect(fake_config());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::ConnectFailed);
    EXPECT_TRUE(registry.list().empty());
}

TEST_F(SessionRegistryTest, DisconnectForgetsSession) {
    auto id = registry.connect(fake_config());
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(registry.disconnect(id.value).is_ok());
    EXPECT_FALSE(registry.has_session(id.value));
    EXPECT_EQ(registry.get(id.value).kind(), ErrorKind::SessionNotFound);

    auto again = registry.disconnect(id.value);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind(), ErrorKind::SessionNotFound);
}

TEST_F(SessionRegistryTest, ReconnectKeepsSessionId) {
    auto id = registry.connect(fake_config());
    ASSERT_TRUE(id.is_ok());

    host->kill();
    ASSERT_TRUE(wait_until([&] {
        auto actor = registry.get(id.value);
        return actor.is_ok() && actor.value->status() == SessionStatus::Disconnected;
    }));

    auto r = registry.connect(fake_config(), id.value);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value, id.value);
    EXPECT_EQ(host->connects(), 2);
    EXPECT_EQ(registry.list().size(), 1u);
}

TEST_F(SessionRegistryTest, ReconnectUnknownSessionFails) {
    auto r = registry.connect(fake_config(), "sess-missing");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::SessionNotFound);
}

TEST_F(SessionRegistryTest, RemoteDigestComesFromHost) {
    host->put_file("/srv/data.bin", "payload bytes");
    auto id = registry.connect(fake_config());
    ASSERT_TRUE(id.is_ok());

    auto digest = registry.remote_sha256(id.value, "/srv/data.bin");
    ASSERT_TRUE(digest.is_ok()) << digest.error.describe();
    EXPECT_EQ(digest.value, sha256_hex("payload bytes"));

    auto log = host->exec_log();
    EXPECT_NE(std::find(log.begin(), log.end(), "sha256sum '/srv/data.bin'"), log.end());
}

TEST_F(SessionRegistryTest, RemoteDigestOfMissingFileFails) {
    auto id = registry.connect(fake_config());
    ASSERT_TRUE(id.is_ok());
    auto digest = registry.remote_sha256(id.value, "/srv/none");
    ASSERT_TRUE(digest.is_err());
    EXPECT_EQ(digest.kind(), ErrorKind::ChannelProtocolError);
}

TEST_F(SessionRegistryTest, TransferChannelsRespectCeiling) {
    auto id = registry.connect(fake_config());
    ASSERT_TRUE(id.is_ok());

    std::vector<std::shared_ptr<Channel>> held;
    for (int i = 0; i < fast_settings().channels.max_per_connection; i++) {
        auto ch = registry.open_sftp(id.value);
        ASSERT_TRUE(ch.is_ok()) << ch.error.describe();
        held.push_back(ch.value);
    }
    auto refused = registry.open_sftp(id.value);
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.kind(), ErrorKind::ChannelLimitExceeded);

    registry.release_channel(id.value, held.back());
    held.pop_back();
    auto ch = registry.open_sftp(id.value);
    ASSERT_TRUE(ch.is_ok()) << ch.error.describe();
    registry.release_channel(id.value, ch.value);
    for (auto& c : held) registry.release_channel(id.value, c);
}

// ── Service facade ─────────────────────────────────────────────

class HostlinkServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = Config::parse(R"(
connections:
  - name: web
    host: web.example.test
    user: tester
    password: secret
)");
        ASSERT_TRUE(config.is_ok()) << config.error.describe();
        service = std::make_unique<HostlinkService>(config.value, factory, storage, events);
    }

    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    FakeTransportFactory factory{host};
    MemoryStorage storage;
    RecordingEvents events;
    std::unique_ptr<HostlinkService> service;
};

TEST_F(HostlinkServiceTest, ConnectsByProfileName) {
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok()) << id.error.describe();
    auto sessions = service->list_sessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].identity, "tester@web.example.test:22");
}

TEST_F(HostlinkServiceTest, UnknownProfileIsConfigError) {
    auto id = service->connect_profile("nope");
    ASSERT_TRUE(id.is_err());
    EXPECT_EQ(id.kind(), ErrorKind::ConfigError);
}

TEST_F(HostlinkServiceTest, RemoteFileOperations) {
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());
    const auto& sid = id.value;

    ASSERT_TRUE(service->mkdir(sid, "/work").is_ok());
    ASSERT_TRUE(service->write_file(sid, "/work/a.txt", "alpha").is_ok());
    ASSERT_TRUE(service->create_file(sid, "/work/empty").is_ok());

    auto content = service->read_file(sid, "/work/a.txt");
    ASSERT_TRUE(content.is_ok()) << content.error.describe();
    EXPECT_EQ(content.value, "alpha");
    auto head = service->read_file(sid, "/work/a.txt", 3);
    ASSERT_TRUE(head.is_ok()) << head.error.describe();
    EXPECT_EQ(head.value, "alp");

    auto entries = service->list_dir(sid, "/work");
    ASSERT_TRUE(entries.is_ok()) << entries.error.describe();
    std::vector<std::string> names;
    for (const auto& e : entries.value) names.push_back(e.name);
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"a.txt", "empty"}));

    ASSERT_TRUE(service->rename(sid, "/work/a.txt", "/work/b.txt").is_ok());
    EXPECT_TRUE(host->has_file("/work/b.txt"));
    EXPECT_FALSE(host->has_file("/work/a.txt"));

    ASSERT_TRUE(service->remove(sid, "/work", true).is_ok());
    EXPECT_FALSE(host->has_dir("/work"));
}

TEST_F(HostlinkServiceTest, ExecGeneratesCommandId) {
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());
    auto out = service->exec(id.value, "echo hello");
    ASSERT_TRUE(out.is_ok()) << out.error.describe();
    EXPECT_EQ(out.value.stdout_data, "hello\n");
    EXPECT_EQ(out.value.exit_status, 0);
}

TEST_F(HostlinkServiceTest, UnknownSessionIsReported) {
    auto out = service->exec("sess-missing", "echo hi");
    ASSERT_TRUE(out.is_err());
    EXPECT_EQ(out.kind(), ErrorKind::SessionNotFound);

    auto entries = service->list_dir("sess-missing", "/");
    ASSERT_TRUE(entries.is_err());
    EXPECT_EQ(entries.kind(), ErrorKind::SessionNotFound);
}

// ── Host queries ───────────────────────────────────────────────

static const char* kStatusOutput =
    "UPTIME_START\nup 3 days, 2 hours\nUPTIME_END\n"
    "MOUNTS_START\n/dev/sda1|50G|20G|30G|40%|/\ntmpfs|2.0G|0|2.0G|0%|/run\nMOUNTS_END\n"
    "IP_START\n10.0.0.5 172.17.0.1\nIP_END\n"
    "CPU_START\n12.5\nCPU_END\n"
    "MEMORY_START\n42.0%|15.5GB|6.5GB|9.0GB\nMEMORY_END\n"
    "PROCESSES_START\n101|python3|55.0%|3.1%|512.0MB\nPROCESSES_END\n"
    "MEMORY_PROCESSES_START\n202|java|1.0%|20.5%|3200.0MB\nMEMORY_PROCESSES_END\n";

TEST_F(HostlinkServiceTest, SystemStatusParsesHostReport) {
    host->set_exec_reply("export LC_ALL=C", kStatusOutput);
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());

    auto status = service->system_status(id.value);
    ASSERT_TRUE(status.is_ok()) << status.error.describe();
    EXPECT_EQ(status.value.uptime, "up 3 days, 2 hours");
    EXPECT_EQ(status.value.ip, "10.0.0.5");
    EXPECT_DOUBLE_EQ(status.value.cpu_usage, 12.5);
    ASSERT_TRUE(status.value.memory.has_value());
    EXPECT_EQ(status.value.memory->usage, "42.0%");
    ASSERT_TRUE(status.value.root_disk.has_value());
    EXPECT_EQ(status.value.root_disk->percent, "40%");
    ASSERT_EQ(status.value.top_cpu.size(), 1u);
    EXPECT_EQ(status.value.top_cpu[0].command, "python3");
    ASSERT_EQ(status.value.top_memory.size(), 1u);
    EXPECT_EQ(status.value.top_memory[0].pid, "202");
}

TEST_F(HostlinkServiceTest, SystemStatusRejectsUnmarkedOutput) {
    host->set_exec_reply("export LC_ALL=C", "sh: not a shell\n", 127);
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());
    auto status = service->system_status(id.value);
    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.kind(), ErrorKind::ChannelProtocolError);
}

TEST_F(HostlinkServiceTest, SearchFindsMatchingLines) {
    host->put_file("/srv/app/main.cfg", "port = 80\nname = web\n");
    host->put_file("/srv/app/conf/extra.cfg", "# port override\nport = 8080\n");
    host->put_file("/srv/other.txt", "port = 1\n");
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());

    auto found = service->search(id.value, "/srv/app", "port");
    ASSERT_TRUE(found.is_ok()) << found.error.describe();
    ASSERT_EQ(found.value.size(), 3u);
    EXPECT_EQ(found.value[0].path, "conf/extra.cfg");
    EXPECT_EQ(found.value[0].line, 1);
    EXPECT_EQ(found.value[1].line, 2);
    EXPECT_EQ(found.value[1].text, "port = 8080");
    EXPECT_EQ(found.value[2].path, "main.cfg");

    auto limited = service->search(id.value, "/srv/app", "port", 1);
    ASSERT_TRUE(limited.is_ok()) << limited.error.describe();
    EXPECT_EQ(limited.value.size(), 1u);

    auto none = service->search(id.value, "/srv/app", "absent");
    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(none.value.empty());
}

TEST_F(HostlinkServiceTest, SearchReportsBadArguments) {
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());

    EXPECT_EQ(service->search(id.value, "", "x").kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(service->search(id.value, "/srv", "").kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(service->search(id.value, "/srv", "x", 0).kind(), ErrorKind::InvalidArgument);

    auto missing = service->search(id.value, "/no/such/dir", "x");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.kind(), ErrorKind::ChannelProtocolError);
}

TEST_F(HostlinkServiceTest, SlowQueryTimesOut) {
    auto config = Config::parse(R"(
exec:
  query_timeout_secs: 1
connections:
  - name: web
    host: web.example.test
    user: tester
    password: secret
)");
    ASSERT_TRUE(config.is_ok()) << config.error.describe();
    service = std::make_unique<HostlinkService>(config.value, factory, storage, events);
    host->set_exec_reply("export LC_ALL=C", kStatusOutput, 0, 30);

    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());
    auto start = std::chrono::steady_clock::now();
    auto status = service->system_status(id.value);
    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.kind(), ErrorKind::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));

    // The session is still usable afterwards
    auto dir = service->working_directory(id.value);
    ASSERT_TRUE(dir.is_ok()) << dir.error.describe();
}

TEST_F(HostlinkServiceTest, WorkingDirectoryIsTrimmed) {
    auto id = service->connect_profile("web");
    ASSERT_TRUE(id.is_ok());
    auto dir = service->working_directory(id.value);
    ASSERT_TRUE(dir.is_ok()) << dir.error.describe();
    EXPECT_EQ(dir.value, "/home/tester");
}
