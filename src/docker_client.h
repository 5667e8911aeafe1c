#pragma once

#include "container_runtime.h"
#include "http_client.h"
#include <string>

namespace contestrun {

// Docker Engine API client over the daemon's unix socket
class DockerClient : public ContainerRuntime {
public:
    explicit DockerClient(const std::string& socket_path,
                          const std::string& api_version = "v1.41");

    std::string create(const ContainerSpec& spec) override;
    void put_archive(const std::string& id, const std::string& path,
                     const std::string& tar) override;
    void start(const std::string& id) override;
    void stream_logs(const std::string& id, OutputCapture& capture,
                     const std::atomic<bool>& cancel) override;
    std::optional<int> wait(const std::string& id, std::chrono::milliseconds timeout) override;
    ContainerState inspect(const std::string& id) override;
    uint64_t memory_usage(const std::string& id) override;
    void kill(const std::string& id) override;
    void remove(const std::string& id) override;
    std::vector<std::string> list_by_label(const std::string& label) override;
    bool ping() override;

    // JSON body for POST /containers/create (exposed for tests)
    static std::string create_body(const ContainerSpec& spec);

private:
    std::string socket_path_;
    std::string base_url_;

    HttpRequest make_request(const std::string& method, const std::string& path,
                             long timeout_ms) const;
    HttpResponse call(const std::string& method, const std::string& path,
                      long timeout_ms, const std::string& body = "",
                      const std::string& content_type = "application/json") const;
};

} // namespace contestrun
