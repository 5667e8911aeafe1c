#pragma once

#include "api_client.h"
#include "constants.h"
#include "submission.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace contestrun {

class ActiveSandboxes;

// Runs one job to a signed result (the coordinator's run)
using JobRunner = std::function<SignedResult(const SubmissionJob&)>;

// Single point of contact with the queue: polls on a fixed tick, pulls only
// while a concurrency slot is free, runs every job on its own thread and
// reports the signed result.
class JobSourceAdapter {
public:
    struct Options {
        int concurrency = DEFAULT_CONCURRENCY;
        std::chrono::milliseconds poll_interval{DEFAULT_POLL_INTERVAL_MS};
        int report_attempts = REPORT_ATTEMPTS;
        std::chrono::milliseconds report_backoff{REPORT_BACKOFF_MS};
    };

    JobSourceAdapter(JobQueue& queue, JobRunner runner, const ActiveSandboxes& active, Options options);

    // Stops polling and joins every job thread
    ~JobSourceAdapter();

    JobSourceAdapter(const JobSourceAdapter&) = delete;
    JobSourceAdapter& operator=(const JobSourceAdapter&) = delete;

    // Start the poll thread
    void start();

    // Stop pulling new jobs; in-flight jobs keep running. Idempotent.
    void stop();

    // Block until no job is in flight; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    // One poll tick. Returns true if a job was dequeued and dispatched.
    bool poll_once();

    size_t in_flight() const;

    // Free slots: concurrency minus the larger of jobs in flight and
    // sandboxes provisioned
    int available_slots() const;

    // Ticks skipped after the most recent queue failure (0 when healthy)
    int backoff_ticks() const;

private:
    struct JobThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void poll_loop();
    void dispatch(SubmissionJob job);
    void process(const SubmissionJob& job);
    bool report(const SignedResult& result);
    void reap_finished();

    JobQueue& queue_;
    JobRunner runner_;
    const ActiveSandboxes& active_;
    Options options_;

    std::atomic<bool> running_{false};
    std::thread poll_thread_;
    std::mutex poll_mutex_;
    std::condition_variable poll_cv_;

    std::atomic<int> backoff_ticks_{0};
    int skip_remaining_ = 0;           // Poll thread only

    mutable std::mutex jobs_mutex_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;
    std::list<JobThread> job_threads_;
};

} // namespace contestrun
