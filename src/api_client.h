#pragma once

#include "submission.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace contestrun {

class WorkerIdentity;

// Queue side of the platform API. Both calls throw ApiError on transport
// failure or an unexpected status.
class JobQueue {
public:
    virtual ~JobQueue() = default;

    // Next job, or nullopt when the queue is empty
    virtual std::optional<SubmissionJob> fetch_job() = 0;

    virtual void report_result(const SignedResult& result) = 0;
};

struct Registration {
    std::string worker_id;
    std::string public_key_pem;
    std::vector<std::string> capabilities;   // Language wire names
    int max_concurrency = 0;
};

struct Heartbeat {
    std::string worker_id;
    int64_t timestamp_ms = 0;
    bool draining = false;
    size_t active_jobs = 0;
};

// Registry side of the platform API. Throws ApiError.
class WorkerRegistry {
public:
    virtual ~WorkerRegistry() = default;

    virtual void register_worker(const Registration& registration) = 0;

    virtual void heartbeat(const Heartbeat& heartbeat) = 0;
};

// JSON over HTTP against {API_URL}/api/runner/...
class HttpApiClient : public JobQueue, public WorkerRegistry {
public:
    HttpApiClient(std::string base_url, std::string worker_id, const WorkerIdentity& identity);

    std::optional<SubmissionJob> fetch_job() override;
    void report_result(const SignedResult& result) override;
    void register_worker(const Registration& registration) override;
    void heartbeat(const Heartbeat& heartbeat) override;

    // JSON bodies (exposed for tests)
    static std::string registration_body(const Registration& registration);
    static std::string heartbeat_body(const Heartbeat& heartbeat);

private:
    std::string url(const std::string& path) const;

    std::string base_url_;
    std::string worker_id_;
    const WorkerIdentity& identity_;
};

} // namespace contestrun
