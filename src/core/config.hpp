#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct ChannelSettings {
    int max_per_connection = DEFAULT_MAX_CHANNELS;
    int eof_wait_ms = CHANNEL_EOF_WAIT_MS;
};

struct KeepaliveSettings {
    int interval_secs = KEEPALIVE_INTERVAL_SECS;
    int alive_count_max = SERVER_ALIVE_COUNT_MAX;
};

struct ReconnectSettings {
    bool automatic = false;          // false: wait for the caller to reconnect
    int initial_delay_ms = RECONNECT_INITIAL_DELAY_MS;
    int max_delay_ms = RECONNECT_MAX_DELAY_MS;
    int max_attempts = RECONNECT_MAX_ATTEMPTS;
};

struct ExecSettings {
    int poll_interval_ms = EXEC_POLL_INTERVAL_MS;
    int timeout_secs = 0;            // 0 = no limit
    int query_timeout_secs = QUERY_TIMEOUT_SECS;
};

enum class IntegrityMode { Size, Sha256 };

struct TransferSettings {
    int concurrency = TRANSFER_CONCURRENCY;
    int progress_interval_ms = PROGRESS_INTERVAL_MS;
    int64_t progress_bytes = PROGRESS_BYTES;
    IntegrityMode integrity = IntegrityMode::Sha256;
};

struct ClientSettings {
    ChannelSettings channels;
    KeepaliveSettings keepalive;
    ReconnectSettings reconnect;
    ExecSettings exec;
    TransferSettings transfers;
};

class Config {
public:
    // Load ~/.hostlink/config.yaml. A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit path
    static Result<Config> load_from(const fs::path& path);

    // Parse YAML text (used by load_from and tests)
    static Result<Config> parse(const std::string& yaml_text);

    const ClientSettings& settings() const { return settings_; }
    ClientSettings& settings() { return settings_; }
    const std::vector<ConnectionConfig>& connections() const { return connections_; }

    // Look up a connection profile by name
    std::optional<ConnectionConfig> find_connection(const std::string& name) const;

public:
    Config() = default;

private:
    ClientSettings settings_;
    std::vector<ConnectionConfig> connections_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

bool config_exists();

// Create default config (never overwrites an existing one)
Result<void> create_default_config();
