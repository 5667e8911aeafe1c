#pragma once

#include "active_sandboxes.h"
#include "api_client.h"
#include "config.h"
#include "container_runtime.h"
#include "execution_coordinator.h"
#include "job_source.h"
#include "sandbox.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace contestrun {

class WorkerIdentity;

// Everything a worker needs, built once in main and injected
struct WorkerContext {
    WorkerConfig config;
    std::string worker_id;
    const WorkerIdentity& identity;
    ContainerRuntime& runtime;
    JobQueue& queue;
    WorkerRegistry& registry;
    ActiveSandboxes& active;
};

// Process-wide lifecycle: register, heartbeat, poll, drain
class Worker {
public:
    explicit Worker(WorkerContext context);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Register (retried from the heartbeat loop on failure), then start the
    // heartbeat and poll loops
    void start();

    // Stop pulling, kill and remove every sandbox this worker owns, wait for
    // job threads. Idempotent; returns false if jobs were still running when
    // the shutdown timeout expired.
    bool shutdown();

    // One heartbeat tick: register if not yet registered, else heartbeat
    void heartbeat_tick();

    // Kill and remove tracked and labelled containers; returns how many
    // were removed
    size_t remove_all_sandboxes();

    bool registered() const { return registered_; }
    bool draining() const { return draining_; }
    size_t active_jobs() const { return jobs_.in_flight(); }

    ExecutionCoordinator& coordinator() { return coordinator_; }
    JobSourceAdapter& job_source() { return jobs_; }

private:
    bool try_register();
    void send_heartbeat();
    void heartbeat_loop();

    WorkerContext ctx_;
    SandboxDriver driver_;
    ExecutionCoordinator coordinator_;
    JobSourceAdapter jobs_;

    std::atomic<bool> registered_{false};
    std::atomic<bool> draining_{false};
    std::atomic<bool> started_{false};

    std::thread heartbeat_thread_;
    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    bool heartbeat_stop_ = false;

    std::mutex shutdown_mutex_;
    bool shut_down_ = false;
    bool drained_ = true;
};

} // namespace contestrun
