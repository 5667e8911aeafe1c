#pragma once

#include "output_capture.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace contestrun {

// Everything the runtime needs to provision one isolated environment
struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::vector<std::string> env;                    // KEY=VALUE
    std::string working_dir = "/workspace";
    std::map<std::string, std::string> labels;

    uint64_t memory_bytes = 0;                       // Hard ceiling, swap disabled
    int64_t nano_cpus = 0;
    int64_t pids_limit = 0;
    bool network_disabled = true;
    bool readonly_rootfs = true;
    std::map<std::string, std::string> tmpfs;        // mount point -> options
    std::string workspace_volume = "/workspace";     // Anonymous writable volume
    std::vector<std::string> security_opts;          // no-new-privileges, seccomp=...
    int64_t max_open_files = 0;
    int64_t max_file_size_bytes = 0;
    std::string log_max_size = "1m";
};

struct ContainerState {
    bool running = false;
    int exit_code = 0;
    bool oom_killed = false;
};

// Seam between the sandbox driver and the container engine. All methods
// throw ContainerRuntimeError on failure. Implementations must be safe to
// call from many job threads at once.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Returns the container id
    virtual std::string create(const ContainerSpec& spec) = 0;

    // Extract a tar archive into path inside the container
    virtual void put_archive(const std::string& id, const std::string& path,
                             const std::string& tar) = 0;

    virtual void start(const std::string& id) = 0;

    // Follow stdout/stderr until the container exits or cancel is set
    virtual void stream_logs(const std::string& id, OutputCapture& capture,
                             const std::atomic<bool>& cancel) = 0;

    // Exit status, or nullopt if the container is still running at timeout
    virtual std::optional<int> wait(const std::string& id, std::chrono::milliseconds timeout) = 0;

    virtual ContainerState inspect(const std::string& id) = 0;

    // Current memory usage sample (bytes); the engine's recorded maximum if
    // it exposes one
    virtual uint64_t memory_usage(const std::string& id) = 0;

    // SIGKILL; a container that already stopped is not an error
    virtual void kill(const std::string& id) = 0;

    // Force-remove together with anonymous volumes; a missing container is
    // not an error
    virtual void remove(const std::string& id) = 0;

    // Ids of all containers (any state) carrying label "key=value"
    virtual std::vector<std::string> list_by_label(const std::string& label) = 0;

    virtual bool ping() = 0;
};

} // namespace contestrun
