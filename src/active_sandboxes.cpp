#include "active_sandboxes.h"

namespace contestrun {

void ActiveSandboxes::add(const std::string& container_id, const std::string& submission_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    containers_[container_id] = submission_id;
}

void ActiveSandboxes::remove(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    containers_.erase(container_id);
}

bool ActiveSandboxes::contains(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return containers_.count(container_id) > 0;
}

size_t ActiveSandboxes::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return containers_.size();
}

std::vector<std::string> ActiveSandboxes::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(containers_.size());
    for (const auto& entry : containers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::string ActiveSandboxes::submission_of(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = containers_.find(container_id);
    return it == containers_.end() ? "" : it->second;
}

void ActiveSandboxes::mark_reclaimed(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reclaimed_.insert(container_id);
}

bool ActiveSandboxes::take_reclaimed(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return reclaimed_.erase(container_id) > 0;
}

} // namespace contestrun
