#include <gtest/gtest.h>
#include <core/config.hpp>

TEST(Config, EmptyDocumentYieldsDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    const auto& s = r.value.settings();
    EXPECT_EQ(s.channels.max_per_connection, DEFAULT_MAX_CHANNELS);
    EXPECT_EQ(s.keepalive.interval_secs, KEEPALIVE_INTERVAL_SECS);
    EXPECT_EQ(s.keepalive.alive_count_max, SERVER_ALIVE_COUNT_MAX);
    EXPECT_FALSE(s.reconnect.automatic);
    EXPECT_EQ(s.transfers.concurrency, TRANSFER_CONCURRENCY);
    EXPECT_EQ(s.transfers.integrity, IntegrityMode::Sha256);
    EXPECT_EQ(s.exec.query_timeout_secs, QUERY_TIMEOUT_SECS);
    EXPECT_TRUE(r.value.connections().empty());
}

TEST(Config, ParsesSettingsSections) {
    auto r = Config::parse(R"(
channels:
  max_per_connection: 4
reconnect:
  automatic: true
  initial_delay_ms: 500
  max_delay_ms: 8000
  max_attempts: 7
transfers:
  concurrency: 2
  integrity: size
)");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    const auto& s = r.value.settings();
    EXPECT_EQ(s.channels.max_per_connection, 4);
    EXPECT_TRUE(s.reconnect.automatic);
    EXPECT_EQ(s.reconnect.initial_delay_ms, 500);
    EXPECT_EQ(s.reconnect.max_delay_ms, 8000);
    EXPECT_EQ(s.reconnect.max_attempts, 7);
    EXPECT_EQ(s.transfers.concurrency, 2);
    EXPECT_EQ(s.transfers.integrity, IntegrityMode::Size);
}

TEST(Config, KeepaliveIntervalIsClamped) {
    auto low = Config::parse("keepalive:\n  interval_secs: 2\n");
    ASSERT_TRUE(low.is_ok());
    EXPECT_EQ(low.value.settings().keepalive.interval_secs, KEEPALIVE_MIN_SECS);

    auto high = Config::parse("keepalive:\n  interval_secs: 300\n");
    ASSERT_TRUE(high.is_ok());
    EXPECT_EQ(high.value.settings().keepalive.interval_secs, KEEPALIVE_MAX_SECS);
}

TEST(Config, RejectsNonPositiveLimits) {
    auto r = Config::parse("channels:\n  max_per_connection: 0\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::ConfigError);
    EXPECT_EQ(r.error.id, "channels.max_per_connection");

    auto q = Config::parse("exec:\n  query_timeout_secs: 0\n");
    ASSERT_TRUE(q.is_err());
    EXPECT_EQ(q.error.id, "exec.query_timeout_secs");
}

TEST(Config, ParsesConnectionWithJumpHost) {
    auto r = Config::parse(R"(
connections:
  - name: db
    host: db.internal
    port: 2222
    user: ops
    auth: password
    password: hunter2
    jump:
      host: bastion.example.com
      user: ops
      auth: agent
)");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    auto db = r.value.find_connection("db");
    ASSERT_TRUE(db.has_value());
    EXPECT_EQ(db->identity(), "ops@db.internal:2222");
    EXPECT_EQ(db->auth, AuthMode::Password);
    ASSERT_TRUE(db->password.has_value());
    EXPECT_EQ(*db->password, "hunter2");
    ASSERT_NE(db->jump_host(), nullptr);
    EXPECT_EQ(db->jump_host()->host, "bastion.example.com");
    EXPECT_EQ(db->jump_host()->auth, AuthMode::Agent);
    EXPECT_FALSE(r.value.find_connection("missing").has_value());
}

TEST(Config, InfersAuthModeFromCredentials) {
    auto r = Config::parse(R"(
connections:
  - host: a.example
    key_path: /keys/id_ed25519
  - host: b.example
    password: pw
  - host: c.example
)");
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    const auto& c = r.value.connections();
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c[0].auth, AuthMode::Key);
    EXPECT_EQ(c[1].auth, AuthMode::Password);
    EXPECT_EQ(c[2].auth, AuthMode::Agent);
    EXPECT_EQ(c[0].name, "a.example");
}

TEST(Config, KeyAuthRequiresKeyPath) {
    auto r = Config::parse("connections:\n  - host: x\n    auth: key\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::ConfigError);
}

TEST(Config, UnknownAuthModeIsRejected) {
    auto r = Config::parse("connections:\n  - name: x\n    host: x\n    auth: kerberos\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.id, "x");
}

TEST(Config, MalformedYamlIsConfigError) {
    auto r = Config::parse("channels: [unclosed\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind(), ErrorKind::ConfigError);
}
