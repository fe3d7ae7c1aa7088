#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for WatchBridge
 *
 * Defaults for every tunable live here so that Config keys, CLI flags and
 * tests agree on the same values.
 */

#include <cstddef>
#include <cstdint>

namespace wb::config {

// =============================================================================
// Event Coalescing
// =============================================================================

/// Quiescence window before a root's changes are announced (milliseconds)
constexpr int DEFAULT_DEBOUNCE_MS = 50;

/// Upper bound on how long a busy root may delay its announcement (milliseconds)
constexpr int DEFAULT_MAX_DELAY_MS = 500;

/// WAIT timeout, 0 = wait until changes arrive or the wait is cancelled
constexpr int DEFAULT_WAIT_TIMEOUT_MS = 0;

// =============================================================================
// Event Source
// =============================================================================

/// Poll tick of the inotify monitor loop (milliseconds)
constexpr int EVENT_POLL_INTERVAL_MS = 100;

/// Attempts made on a failing inotify read before the source gives up
constexpr int DEFAULT_READ_RETRY_ATTEMPTS = 3;

/// Upper bound accepted for read_retry_attempts
constexpr int MAX_READ_RETRY_ATTEMPTS = 16;

/// First backoff delay between read retries, doubled each attempt (milliseconds)
constexpr int DEFAULT_READ_RETRY_BACKOFF_MS = 50;

/// The backoff stops doubling after this many retries
constexpr int MAX_READ_RETRY_DOUBLINGS = 10;

// =============================================================================
// Protocol I/O
// =============================================================================

/// Poll tick of the command reader, bounds shutdown latency (milliseconds)
constexpr int INPUT_POLL_INTERVAL_MS = 100;

/// Read chunk for the command stream
constexpr std::size_t INPUT_BUFFER_SIZE = 8192;

/// Longest command line accepted before the stream is treated as corrupt
constexpr std::size_t MAX_COMMAND_LINE = 1024 * 1024;

// =============================================================================
// Logging
// =============================================================================

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

} // namespace wb::config
