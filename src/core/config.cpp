#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".hostlink";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::ConfigError, "create_default_config",
                                 config_path.string(), ec.message());
    }

    const char* default_config = R"(# hostlink client configuration

channels:
  max_per_connection: 10     # "too many concurrent operations" beyond this
  eof_wait_ms: 2000

keepalive:
  interval_secs: 15          # clamped to 15-30
  alive_count_max: 3         # unanswered keepalives before the connection closes

reconnect:
  automatic: false           # true: retry with backoff without asking
  initial_delay_ms: 1000
  max_delay_ms: 30000
  max_attempts: 5

exec:
  poll_interval_ms: 10
  timeout_secs: 0            # 0 = no limit
  query_timeout_secs: 15     # system status and content search

transfers:
  concurrency: 3
  progress_interval_ms: 100
  progress_bytes: 1048576
  integrity: sha256          # sha256 | size

connections: []
# connections:
#   - name: web
#     host: web.internal
#     port: 22
#     user: deploy
#     auth: key              # password | key | agent
#     key_path: ~/.ssh/id_ed25519
#     jump:
#       host: bastion.example.com
#       user: deploy
#       auth: agent
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::ConfigError, "create_default_config",
                                 config_path.string(), "cannot open for writing");
    }
    out << default_config;
    return Result<void>::Ok();
}

static std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/')
        return (platform::home_dir() / path.substr(2)).string();
    return path;
}

static Result<AuthMode> parse_auth_mode(const std::string& value) {
    if (value == "password") return Result<AuthMode>::Ok(AuthMode::Password);
    if (value == "key")      return Result<AuthMode>::Ok(AuthMode::Key);
    if (value == "agent")    return Result<AuthMode>::Ok(AuthMode::Agent);
    return Result<AuthMode>::Err(ErrorKind::ConfigError, "parse", "auth",
                                 fmt::format("unknown auth mode '{}'", value));
}

static Result<ConnectionConfig> parse_connection(const YAML::Node& node, int depth) {
    if (depth > 8) {
        return Result<ConnectionConfig>::Err(ErrorKind::ConfigError, "parse", "jump",
                                             "jump chain too deep");
    }
    if (!node.IsMap()) {
        return Result<ConnectionConfig>::Err(ErrorKind::ConfigError, "parse", "connections",
                                             "connection entry must be a map");
    }

    ConnectionConfig conn;
    conn.host = node["host"].as<std::string>("");
    conn.name = node["name"].as<std::string>(conn.host);
    conn.port = node["port"].as<int>(22);
    conn.username = node["user"].as<std::string>("");
    conn.connect_timeout_secs = node["timeout"].as<int>(CONNECT_TIMEOUT_SECS);

    if (conn.host.empty()) {
        return Result<ConnectionConfig>::Err(ErrorKind::ConfigError, "parse", conn.name,
                                             "host is required");
    }
    if (conn.port <= 0 || conn.port > 65535) {
        return Result<ConnectionConfig>::Err(ErrorKind::ConfigError, "parse", conn.name,
                                             fmt::format("invalid port {}", conn.port));
    }

    std::string auth = node["auth"].as<std::string>("");
    if (node["password"]) conn.password = node["password"].as<std::string>();
    if (node["key_path"]) conn.key_path = expand_home(node["key_path"].as<std::string>());
    if (node["passphrase"]) conn.key_passphrase = node["passphrase"].as<std::string>();

    if (auth.empty()) {
        // Infer from what was supplied
        conn.auth = conn.key_path ? AuthMode::Key
                  : conn.password ? AuthMode::Password
                  : AuthMode::Agent;
    } else {
        auto mode = parse_auth_mode(auth);
        if (mode.is_err()) {
            mode.error.id = conn.name;
            return Result<ConnectionConfig>::Err(mode.error);
        }
        conn.auth = mode.value;
    }

    if (conn.auth == AuthMode::Key && !conn.key_path) {
        return Result<ConnectionConfig>::Err(ErrorKind::ConfigError, "parse", conn.name,
                                             "auth 'key' requires key_path");
    }

    if (node["jump"]) {
        auto jump = parse_connection(node["jump"], depth + 1);
        if (jump.is_err()) return jump;
        conn.jump.push_back(jump.value);
    }

    return Result<ConnectionConfig>::Ok(conn);
}

static void parse_settings(const YAML::Node& root, ClientSettings& s) {
    if (auto n = root["channels"]) {
        s.channels.max_per_connection = n["max_per_connection"].as<int>(s.channels.max_per_connection);
        s.channels.eof_wait_ms = n["eof_wait_ms"].as<int>(s.channels.eof_wait_ms);
    }
    if (auto n = root["keepalive"]) {
        s.keepalive.interval_secs = n["interval_secs"].as<int>(s.keepalive.interval_secs);
        s.keepalive.alive_count_max = n["alive_count_max"].as<int>(s.keepalive.alive_count_max);
    }
    if (auto n = root["reconnect"]) {
        s.reconnect.automatic = n["automatic"].as<bool>(s.reconnect.automatic);
        s.reconnect.initial_delay_ms = n["initial_delay_ms"].as<int>(s.reconnect.initial_delay_ms);
        s.reconnect.max_delay_ms = n["max_delay_ms"].as<int>(s.reconnect.max_delay_ms);
        s.reconnect.max_attempts = n["max_attempts"].as<int>(s.reconnect.max_attempts);
    }
    if (auto n = root["exec"]) {
        s.exec.poll_interval_ms = n["poll_interval_ms"].as<int>(s.exec.poll_interval_ms);
        s.exec.timeout_secs = n["timeout_secs"].as<int>(s.exec.timeout_secs);
        s.exec.query_timeout_secs = n["query_timeout_secs"].as<int>(s.exec.query_timeout_secs);
    }
    if (auto n = root["transfers"]) {
        s.transfers.concurrency = n["concurrency"].as<int>(s.transfers.concurrency);
        s.transfers.progress_interval_ms =
            n["progress_interval_ms"].as<int>(s.transfers.progress_interval_ms);
        s.transfers.progress_bytes = n["progress_bytes"].as<int64_t>(s.transfers.progress_bytes);
        std::string integrity = n["integrity"].as<std::string>("sha256");
        s.transfers.integrity = (integrity == "size") ? IntegrityMode::Size : IntegrityMode::Sha256;
    }
}

static Result<void> validate(ClientSettings& s) {
    auto bad = [](const std::string& field, int value) {
        return Result<void>::Err(ErrorKind::ConfigError, "validate", field,
                                 fmt::format("must be positive (got {})", value));
    };
    if (s.channels.max_per_connection <= 0) return bad("channels.max_per_connection", s.channels.max_per_connection);
    if (s.keepalive.alive_count_max <= 0) return bad("keepalive.alive_count_max", s.keepalive.alive_count_max);
    if (s.reconnect.max_attempts <= 0) return bad("reconnect.max_attempts", s.reconnect.max_attempts);
    if (s.reconnect.initial_delay_ms <= 0) return bad("reconnect.initial_delay_ms", s.reconnect.initial_delay_ms);
    if (s.transfers.concurrency <= 0) return bad("transfers.concurrency", s.transfers.concurrency);
    if (s.exec.poll_interval_ms <= 0) return bad("exec.poll_interval_ms", s.exec.poll_interval_ms);
    if (s.exec.query_timeout_secs <= 0) return bad("exec.query_timeout_secs", s.exec.query_timeout_secs);

    s.keepalive.interval_secs = std::clamp(s.keepalive.interval_secs,
                                           KEEPALIVE_MIN_SECS, KEEPALIVE_MAX_SECS);
    s.reconnect.max_delay_ms = std::max(s.reconnect.max_delay_ms, s.reconnect.initial_delay_ms);
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::ConfigError, "parse", "",
                                       "top level must be a map");
        }

        parse_settings(root, config.settings_);

        if (auto conns = root["connections"]) {
            for (const auto& node : conns) {
                auto conn = parse_connection(node, 0);
                if (conn.is_err()) return Result<Config>::Err(conn.error);
                config.connections_.push_back(conn.value);
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError, "parse", "", e.what());
    }

    auto valid = validate(config.settings_);
    if (valid.is_err()) return Result<Config>::Err(valid.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_from(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::ConfigError, "load", path.string(),
                                   "cannot open config file");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    auto result = parse(ss.str());
    if (result.is_err() && result.error.id.empty()) result.error.id = path.string();
    return result;
}

Result<Config> Config::load() {
    if (!config_exists()) return Result<Config>::Ok(Config{});
    return load_from(get_config_path());
}

std::optional<ConnectionConfig> Config::find_connection(const std::string& name) const {
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [&](const ConnectionConfig& c) { return c.name == name; });
    if (it == connections_.end()) return std::nullopt;
    return *it;
}
