#pragma once

#include <cstdint>

// ── Channels ────────────────────────────────────────────────
constexpr int DEFAULT_MAX_CHANNELS       = 10;    // Per-connection channel ceiling
constexpr int CHANNEL_EOF_WAIT_MS        = 2000;  // Bounded wait for peer EOF on close
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;    // Max time for a channel-open request

// ── Keepalive ───────────────────────────────────────────────
constexpr int KEEPALIVE_INTERVAL_SECS    = 15;    // Keepalive interval (clamped to 15-30)
constexpr int KEEPALIVE_MIN_SECS         = 15;
constexpr int KEEPALIVE_MAX_SECS         = 30;
constexpr int SERVER_ALIVE_COUNT_MAX     = 3;     // Unanswered keepalives before Closed

// ── Reconnect ───────────────────────────────────────────────
constexpr int RECONNECT_INITIAL_DELAY_MS = 1000;
constexpr int RECONNECT_MAX_DELAY_MS     = 30000;
constexpr int RECONNECT_MAX_ATTEMPTS     = 5;

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 10;    // TCP connect + handshake budget
constexpr int EXEC_POLL_INTERVAL_MS      = 10;    // Cooperative cancellation granularity
constexpr int ACTOR_IDLE_WAIT_MS         = 10;    // Actor loop wait while a shell is open
constexpr int REMOTE_HASH_TIMEOUT_SECS   = 120;   // sha256sum on the remote
constexpr int QUERY_TIMEOUT_SECS         = 15;    // system status and content search
constexpr int SEARCH_MAX_RESULTS         = 200;

// ── Transfers ───────────────────────────────────────────────
constexpr int TRANSFER_CONCURRENCY       = 3;
constexpr int PROGRESS_INTERVAL_MS       = 100;
constexpr int64_t PROGRESS_BYTES         = 1024 * 1024;
constexpr int TRANSFER_RETRY_DELAY_MS    = 200;   // Re-check for a channel slot

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SFTP_CHUNK_SIZE            = 64 * 1024;
constexpr int FORWARD_BUF_SIZE           = 16384;
