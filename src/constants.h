#pragma once

#include <cstddef>  // for size_t

namespace contestrun {

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB
constexpr size_t MAX_OUTPUT_BYTES = 10000;                        // Per captured stream
constexpr size_t MAX_SOURCE_BYTES = 64 * 1024;                    // 64KB source ceiling
constexpr size_t TMPFS_SIZE_MB = 64;                              // Writable /tmp
constexpr size_t MAX_FILE_SIZE_BYTES = 16 * 1024 * 1024;          // RLIMIT_FSIZE inside sandbox

// Time limits
constexpr long DEFAULT_TIME_LIMIT_MS = 10000;                     // 10 seconds
constexpr long DEFAULT_GRACE_PERIOD_MS = 2000;                    // Backstop buffer
constexpr long DOCKER_STOP_TIMEOUT_MS = 5000;                     // Kill/remove calls
constexpr long DOCKER_REQUEST_TIMEOUT_MS = 30000;                 // Create/inspect/archive calls
constexpr long LOG_DRAIN_TIMEOUT_MS = 500;                        // After container exit
constexpr long MEMORY_SAMPLE_INTERVAL_MS = 100;

// Process limits
constexpr int MAX_PROCESSES_PER_JOB = 32;                         // Fork-bomb ceiling
constexpr int MAX_OPEN_FILES = 256;
constexpr long NANO_CPUS_PER_JOB = 1000000000L;                   // One CPU

// Compile phase of every language command exits with this status on failure
constexpr int COMPILE_FAILED_EXIT_CODE = 86;

// Worker loops
constexpr long DEFAULT_POLL_INTERVAL_MS = 1000;
constexpr long DEFAULT_HEARTBEAT_INTERVAL_MS = 30000;
constexpr long DEFAULT_SHUTDOWN_TIMEOUT_MS = 15000;
constexpr int DEFAULT_CONCURRENCY = 4;
constexpr int MAX_POLL_BACKOFF_TICKS = 32;
constexpr int REPORT_ATTEMPTS = 3;
constexpr long REPORT_BACKOFF_MS = 500;
constexpr long API_REQUEST_TIMEOUT_MS = 10000;

// Scoring
constexpr int FULL_SCORE = 100;

} // namespace contestrun
