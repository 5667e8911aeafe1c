#include "job_source.h"
#include "active_sandboxes.h"
#include <algorithm>
#include <iostream>

namespace contestrun {

JobSourceAdapter::JobSourceAdapter(JobQueue& queue, JobRunner runner,
                                   const ActiveSandboxes& active, Options options)
    : queue_(queue), runner_(std::move(runner)), active_(active), options_(options) {}

JobSourceAdapter::~JobSourceAdapter() {
    stop();
    std::list<JobThread> threads;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        threads.swap(job_threads_);
    }
    for (auto& job : threads) {
        if (job.thread.joinable()) {
            job.thread.join();
        }
    }
}

void JobSourceAdapter::start() {
    if (running_.exchange(true)) {
        return;
    }
    poll_thread_ = std::thread(&JobSourceAdapter::poll_loop, this);
    std::cout << "[JobSource] Polling every " << options_.poll_interval.count()
              << "ms with concurrency " << options_.concurrency << std::endl;
}

void JobSourceAdapter::stop() {
    {
        std::lock_guard<std::mutex> lock(poll_mutex_);
        if (!running_.exchange(false) && !poll_thread_.joinable()) {
            return;
        }
    }
    poll_cv_.notify_all();
    if (poll_thread_.joinable() && poll_thread_.get_id() != std::this_thread::get_id()) {
        poll_thread_.join();
        std::cout << "[JobSource] Stopped pulling jobs" << std::endl;
    }
}

bool JobSourceAdapter::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return in_flight_ == 0; });
}

size_t JobSourceAdapter::in_flight() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return in_flight_;
}

int JobSourceAdapter::available_slots() const {
    size_t busy = std::max(in_flight(), active_.size());
    return options_.concurrency - static_cast<int>(busy);
}

int JobSourceAdapter::backoff_ticks() const {
    return backoff_ticks_;
}

void JobSourceAdapter::poll_loop() {
    std::unique_lock<std::mutex> lock(poll_mutex_);
    while (running_) {
        lock.unlock();
        poll_once();
        lock.lock();
        poll_cv_.wait_for(lock, options_.poll_interval, [this]() { return !running_; });
    }
}

bool JobSourceAdapter::poll_once() {
    reap_finished();

    if (skip_remaining_ > 0) {
        --skip_remaining_;
        return false;
    }

    // Capacity first: a job is never dequeued without a slot to run it
    if (available_slots() <= 0) {
        return false;
    }

    std::optional<SubmissionJob> job;
    try {
        job = queue_.fetch_job();
    } catch (const std::exception& e) {
        int ticks = backoff_ticks_.load();
        backoff_ticks_ = ticks == 0 ? 1 : std::min(ticks * 2, MAX_POLL_BACKOFF_TICKS);
        skip_remaining_ = backoff_ticks_;
        std::cerr << "[JobSource] Queue unavailable, backing off " << skip_remaining_
                  << " tick(s): " << e.what() << std::endl;
        return false;
    }

    if (backoff_ticks_ != 0) {
        std::cout << "[JobSource] Queue reachable again" << std::endl;
        backoff_ticks_ = 0;
    }
    if (!job) {
        return false;
    }

    std::cout << "[JobSource] Dequeued submission " << job->submission_id
              << " (" << job->language_name << ")" << std::endl;
    dispatch(std::move(*job));
    return true;
}

void JobSourceAdapter::dispatch(SubmissionJob job) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    ++in_flight_;
    JobThread entry;
    entry.done = done;
    entry.thread = std::thread([this, done, job = std::move(job)]() {
        process(job);
        std::lock_guard<std::mutex> guard(jobs_mutex_);
        --in_flight_;
        done->store(true);
        idle_cv_.notify_all();
    });
    job_threads_.push_back(std::move(entry));
}

void JobSourceAdapter::reap_finished() {
    std::list<JobThread> finished;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (auto it = job_threads_.begin(); it != job_threads_.end();) {
            if (it->done->load()) {
                finished.splice(finished.end(), job_threads_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& job : finished) {
        job.thread.join();
    }
}

void JobSourceAdapter::process(const SubmissionJob& job) {
    SignedResult result;
    try {
        result = runner_(job);
    } catch (const std::exception& e) {
        // Nothing unsigned leaves the worker; redelivery recovers the job
        std::cerr << "[JobSource] Submission " << job.submission_id
                  << " not reported: " << e.what() << std::endl;
        return;
    }

    if (!report(result)) {
        std::cerr << "[JobSource] Submission " << job.submission_id << " lost after "
                  << options_.report_attempts << " report attempts" << std::endl;
    }
}

bool JobSourceAdapter::report(const SignedResult& result) {
    std::chrono::milliseconds backoff = options_.report_backoff;
    for (int attempt = 1; attempt <= options_.report_attempts; attempt++) {
        try {
            queue_.report_result(result);
            std::cout << "[JobSource] Reported submission " << result.result.submission_id
                      << ": " << verdict_to_string(result.result.verdict) << std::endl;
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[JobSource] Report attempt " << attempt << " for submission "
                      << result.result.submission_id << " failed: " << e.what() << std::endl;
        }
        if (attempt < options_.report_attempts) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    return false;
}

} // namespace contestrun
