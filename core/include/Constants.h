#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for LureNet
 *
 * Thresholds, buffer sizes and wire literals shared by the decoys,
 * the analyzer and the event store.
 */

#include <cstddef>
#include <cstdint>

namespace lnt::config {

// =============================================================================
// Listener Configuration
// =============================================================================

/// Default bind address for all decoys
constexpr const char* DEFAULT_BIND_HOST = "0.0.0.0";

/// Default decoy ports
constexpr int DEFAULT_SSH_PORT = 2222;
constexpr int DEFAULT_HTTP_PORT = 8080;
constexpr int DEFAULT_FTP_PORT = 2121;

/// Listen backlog per decoy
constexpr int LISTEN_BACKLOG = 10;

/// Accept loop poll interval (milliseconds)
constexpr int ACCEPT_POLL_INTERVAL_MS = 500;

/// Idle read timeout for every decoy session (seconds)
constexpr int SESSION_READ_TIMEOUT_SEC = 30;

// =============================================================================
// Buffer Sizes
// =============================================================================

/// Single read size for SSH and FTP sessions
constexpr std::size_t SESSION_READ_SIZE = 1024;

/// Maximum HTTP request frame captured
constexpr std::size_t HTTP_FRAME_SIZE = 4096;

/// FTP command turns before the session is closed
constexpr int FTP_MAX_TURNS = 4;

// =============================================================================
// Analysis
// =============================================================================

/// Per-source history thresholds
constexpr std::uint64_t MEDIUM_THRESHOLD = 3;
constexpr std::uint64_t HIGH_THRESHOLD = 10;
constexpr std::uint64_t CRITICAL_THRESHOLD = 25;

/// Number of source IPs reported in statistics
constexpr std::size_t TOP_SOURCE_LIMIT = 10;

/// Payload characters embedded in an alert detail
constexpr std::size_t ALERT_DETAIL_PAYLOAD_CHARS = 200;

// =============================================================================
// Storage
// =============================================================================

/// SQLite busy timeout (milliseconds)
constexpr int DB_BUSY_TIMEOUT_MS = 5000;

/// Schema version written to PRAGMA user_version
constexpr int DB_SCHEMA_VERSION = 1;

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

} // namespace lnt::config
