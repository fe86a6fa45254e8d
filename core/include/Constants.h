#pragma once

/**
 * @file Constants.h
 * @brief Protocol constants and configuration defaults for the Key Provider
 *
 * Defaults here are used when the configuration file omits a key.
 */

#include <cstddef>
#include <cstdint>

namespace skp::config {

// =============================================================================
// Listener
// =============================================================================

constexpr const char* DEFAULT_LISTEN_ADDRESS = "127.0.0.1";
constexpr int DEFAULT_LISTEN_PORT = 8080;

/// Worker threads serving HTTP requests
constexpr std::size_t DEFAULT_WORKER_THREADS = 8;

/// Listen backlog
constexpr int HTTP_BACKLOG = 64;

/// Upper bound for a request (headers and body)
constexpr std::size_t MAX_REQUEST_BYTES = 64 * 1024;

/// Receive timeout for a single client connection (seconds)
constexpr int CLIENT_RECV_TIMEOUT_SEC = 5;

// =============================================================================
// Key lifecycle
// =============================================================================

constexpr int DEFAULT_KEY_SIZE_BITS = 256;
constexpr int MIN_KEY_SIZE_BITS = 128;
constexpr int MAX_KEY_SIZE_BITS = 512;

constexpr int DEFAULT_ENTROPY_BITS = 256;
constexpr int MIN_ENTROPY_BITS = 8;
constexpr int MAX_ENTROPY_BITS = 2048;

/// Key ID length in bytes (rendered as 32 hex chars)
constexpr std::size_t KEY_ID_BYTES = 16;

constexpr int DEFAULT_KEY_EXPIRY_SEC = 3600;
constexpr std::size_t DEFAULT_MAX_STORED_KEYS = 1000;

/// Expiry sweep interval (seconds)
constexpr int DEFAULT_SWEEP_INTERVAL_SEC = 60;

// =============================================================================
// Peer synchronization
// =============================================================================

constexpr int DEFAULT_SYNC_INTERVAL_SEC = 30;
constexpr int DEFAULT_HEARTBEAT_INTERVAL_SEC = 10;
constexpr int DEFAULT_MISSED_THRESHOLD = 3;
constexpr int DEFAULT_MAX_RETRY_ATTEMPTS = 3;
constexpr int DEFAULT_RETRY_BACKOFF_MS = 500;
constexpr int DEFAULT_SYNC_TIMEOUT_SEC = 10;
constexpr int DEFAULT_REPLAY_WINDOW_SEC = 300;

/// Minimum length of a per-peer shared secret (bytes)
constexpr std::size_t MIN_SHARED_SECRET_BYTES = 32;

/// HKDF parameters for the key_sync payload key
constexpr const char* SYNC_KDF_SALT = "SKIP-KP-SYNC-v1";
constexpr const char* SYNC_KDF_INFO = "key-sync-payload";

constexpr const char* SYNC_SENDER_HEADER = "X-SKIP-Sender";
constexpr const char* SYNC_USER_AGENT_PREFIX = "SKIP-Sync/";

// =============================================================================
// Logging
// =============================================================================

constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

/// Characters of a key ID shown in log lines
constexpr std::size_t LOGGED_KEY_ID_CHARS = 8;

} // namespace skp::config
