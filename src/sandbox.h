#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <memory>
#include "constants.h"
#include "language.h"

namespace contestrun {

class ContainerRuntime;
class ActiveSandboxes;
struct SubmissionJob;
struct ContainerSpec;

// Resource envelope for one execution, already resolved against the
// worker's configured defaults and ceilings
struct SandboxLimits {
    int64_t time_limit_ms = DEFAULT_TIME_LIMIT_MS;
    uint64_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    int64_t grace_period_ms = DEFAULT_GRACE_PERIOD_MS;
    int pids_limit = MAX_PROCESSES_PER_JOB;
    bool network_enabled = false;                    // Airgapped by default
};

// What came out of the sandbox, before any verdict is assigned
struct RawExecutionOutcome {
    int exit_code = 0;
    std::string stdout_output;                       // Truncated, valid UTF-8
    std::string stderr_output;                       // Truncated, valid UTF-8
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::milliseconds wall_time{0};
    uint64_t peak_memory_bytes = 0;
    bool killed_by_deadline = false;                 // Time limit or grace backstop
    bool oom_killed = false;
};

// Owns one provisioned container. Registered in the active set while it
// exists; destroy() (or the destructor) kills and force-removes it.
class SandboxHandle {
public:
    SandboxHandle(ContainerRuntime& runtime, ActiveSandboxes& active,
                  std::string container_id, std::string submission_id);
    ~SandboxHandle();

    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    const std::string& id() const { return container_id_; }

    // Kill and remove. Returns false if the runtime refused; the container
    // then stays in the active set for the shutdown sweep.
    bool destroy();

private:
    ContainerRuntime& runtime_;
    ActiveSandboxes& active_;
    std::string container_id_;
    std::string submission_id_;
    bool destroyed_ = false;
};

// Drives the container runtime through provision, inject, run, capture and
// teardown for one job at a time per call; calls may run concurrently.
class SandboxDriver {
public:
    SandboxDriver(ContainerRuntime& runtime, ActiveSandboxes& active, std::string worker_id);
    ~SandboxDriver();

    // Throws SandboxError or ContainerRuntimeError when the environment
    // cannot be provisioned or observed. The container never outlives the
    // call, whichever way it returns.
    RawExecutionOutcome execute(const SubmissionJob& job,
                                const LanguageProfile& profile,
                                const SandboxLimits& limits);

    // Container configuration for a job (exposed for tests)
    ContainerSpec build_spec(const SubmissionJob& job,
                             const LanguageProfile& profile,
                             const SandboxLimits& limits);

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace contestrun
