#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace contestrun {

// Process-wide bookkeeping of provisioned containers. The only mutable
// state shared between job threads; every access goes through mutex_.
class ActiveSandboxes {
public:
    // Register container once it exists
    void add(const std::string& container_id, const std::string& submission_id);

    // Forget container once it has been removed
    void remove(const std::string& container_id);

    bool contains(const std::string& container_id) const;

    size_t size() const;

    // Container ids at this instant (shutdown sweep)
    std::vector<std::string> snapshot() const;

    // Submission a container belongs to; empty if unknown
    std::string submission_of(const std::string& container_id) const;

    // Flag a container the worker kills on its own behalf (shutdown sweep).
    // The flag outlives remove() so the owning job can still observe it.
    void mark_reclaimed(const std::string& container_id);

    // True once if container was reclaimed; clears the flag
    bool take_reclaimed(const std::string& container_id);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> containers_;  // container id -> submission id
    std::set<std::string> reclaimed_;
};

} // namespace contestrun
