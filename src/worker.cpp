#include "worker.h"
#include "worker_identity.h"
#include <algorithm>
#include <iostream>

namespace contestrun {

namespace {

JobSourceAdapter::Options job_source_options(const WorkerConfig& config) {
    JobSourceAdapter::Options options;
    options.concurrency = config.concurrency;
    options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    return options;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

Worker::Worker(WorkerContext context)
    : ctx_(std::move(context)),
      driver_(ctx_.runtime, ctx_.active, ctx_.worker_id),
      coordinator_(driver_, ctx_.identity, ctx_.worker_id, ctx_.config),
      jobs_(ctx_.queue,
            [this](const SubmissionJob& job) { return coordinator_.run(job); },
            ctx_.active,
            job_source_options(ctx_.config)) {}

Worker::~Worker() {
    shutdown();
}

void Worker::start() {
    if (started_.exchange(true)) {
        return;
    }
    std::cout << "[Worker] Starting " << ctx_.worker_id << " with concurrency "
              << ctx_.config.concurrency << std::endl;

    if (!ctx_.runtime.ping()) {
        std::cerr << "[Worker] Container runtime at " << ctx_.config.docker_socket
                  << " is not answering; jobs will fail until it does" << std::endl;
    }

    try_register();
    heartbeat_thread_ = std::thread(&Worker::heartbeat_loop, this);
    jobs_.start();
}

bool Worker::try_register() {
    Registration registration;
    registration.worker_id = ctx_.worker_id;
    registration.public_key_pem = ctx_.identity.public_key_pem();
    for (Language language : supported_languages()) {
        registration.capabilities.push_back(language_name(language));
    }
    registration.max_concurrency = ctx_.config.concurrency;

    try {
        ctx_.registry.register_worker(registration);
    } catch (const std::exception& e) {
        std::cerr << "[Worker] Registration failed, retrying next heartbeat: " << e.what() << std::endl;
        return false;
    }
    registered_ = true;
    std::cout << "[Worker] Registered " << ctx_.worker_id << " (key "
              << ctx_.identity.fingerprint().substr(0, 16) << ")" << std::endl;
    return true;
}

void Worker::send_heartbeat() {
    Heartbeat heartbeat;
    heartbeat.worker_id = ctx_.worker_id;
    heartbeat.timestamp_ms = now_ms();
    heartbeat.draining = draining_;
    heartbeat.active_jobs = jobs_.in_flight();

    try {
        ctx_.registry.heartbeat(heartbeat);
    } catch (const std::exception& e) {
        std::cerr << "[Worker] Heartbeat failed: " << e.what() << std::endl;
    }
}

void Worker::heartbeat_tick() {
    if (!registered_) {
        try_register();
        return;
    }
    send_heartbeat();
}

void Worker::heartbeat_loop() {
    std::unique_lock<std::mutex> lock(heartbeat_mutex_);
    auto interval = std::chrono::milliseconds(ctx_.config.heartbeat_interval_ms);
    while (!heartbeat_cv_.wait_for(lock, interval, [this]() { return heartbeat_stop_; })) {
        lock.unlock();
        heartbeat_tick();
        lock.lock();
    }
}

size_t Worker::remove_all_sandboxes() {
    std::vector<std::string> ids = ctx_.active.snapshot();
    try {
        for (const auto& id : ctx_.runtime.list_by_label("contestrun.worker=" + ctx_.worker_id)) {
            if (!ctx_.active.contains(id)) {
                ids.push_back(id);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[Worker] Label sweep failed: " << e.what() << std::endl;
    }

    size_t removed = 0;
    for (const auto& id : ids) {
        std::string submission = ctx_.active.submission_of(id);
        if (!submission.empty()) {
            // Owning job must not mistake this kill for a user-code failure
            ctx_.active.mark_reclaimed(id);
            std::cout << "[Worker] Reclaiming sandbox " << id.substr(0, 12)
                      << " of in-flight submission " << submission << std::endl;
        }
        try {
            ctx_.runtime.kill(id);
            ctx_.runtime.remove(id);
            ctx_.active.remove(id);
            ++removed;
        } catch (const std::exception& e) {
            std::cerr << "[Worker] Cleanup of container " << id.substr(0, 12)
                      << " failed: " << e.what() << std::endl;
        }
    }
    return removed;
}

bool Worker::shutdown() {
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    if (shut_down_) {
        return drained_;
    }
    shut_down_ = true;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(ctx_.config.shutdown_timeout_ms);
    std::cout << "[Worker] Shutting down " << ctx_.worker_id << std::endl;

    draining_ = true;
    jobs_.stop();
    if (registered_ && started_) {
        send_heartbeat();
    }

    size_t removed = remove_all_sandboxes();
    std::cout << "[Worker] Removed " << removed << " sandbox(es)" << std::endl;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    drained_ = jobs_.wait_idle(std::max(remaining, std::chrono::milliseconds(0)));
    if (!drained_) {
        std::cerr << "[Worker] " << jobs_.in_flight() << " job(s) still running at shutdown timeout"
                  << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat_stop_ = true;
    }
    heartbeat_cv_.notify_all();
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }

    // Sandboxes provisioned by jobs that were mid-create during the first pass
    if (ctx_.active.size() > 0) {
        remove_all_sandboxes();
    }

    std::cout << "[Worker] Shutdown " << (drained_ ? "complete" : "timed out") << std::endl;
    return drained_;
}

} // namespace contestrun
