#pragma once

#include "constants.h"
#include <cstdint>
#include <string>

namespace contestrun {

class WorkerIdentity;

// Worker configuration: defaults, then environment, then command line
struct WorkerConfig {
    std::string runner_id;                                   // Empty: derived from the key
    std::string private_key_path = "/secrets/runner-key";
    std::string public_key_path = "/secrets/runner-key.pub";
    std::string api_url = "http://localhost:3000";
    std::string docker_socket = "/var/run/docker.sock";
    int concurrency = DEFAULT_CONCURRENCY;
    int64_t max_execution_time_ms = DEFAULT_TIME_LIMIT_MS;   // Default and ceiling
    uint64_t max_memory_bytes = DEFAULT_MEMORY_LIMIT_BYTES;  // Default and ceiling
    bool network_disabled = true;
    int64_t poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
    int64_t heartbeat_interval_ms = DEFAULT_HEARTBEAT_INTERVAL_MS;
    int64_t grace_period_ms = DEFAULT_GRACE_PERIOD_MS;
    int64_t shutdown_timeout_ms = DEFAULT_SHUTDOWN_TIMEOUT_MS;

    bool generate_key = false;                               // --generate-key
    bool show_help = false;                                  // --help

    // Read RUNNER_ID, PRIVATE_KEY_PATH, ... from the process environment
    static WorkerConfig from_env();

    // Environment first, flags override. Throws ConfigError.
    static WorkerConfig load(int argc, char* argv[]);

    // Apply command-line flags on top of this configuration
    void apply_args(int argc, char* argv[]);

    // Throws ConfigError on non-positive limits or empty endpoints
    void validate() const;

    // Configured identifier, or "runner-" + fingerprint prefix
    std::string resolve_worker_id(const WorkerIdentity& identity) const;

    static std::string usage(const std::string& program);
};

} // namespace contestrun
