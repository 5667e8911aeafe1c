#include "docker_client.h"
#include "constants.h"
#include "errors.h"
#include <json/json.h>
#include <algorithm>
#include <initializer_list>
#include <memory>

namespace contestrun {

namespace {

Json::Value parse_json(const std::string& body, const std::string& what) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw ContainerRuntimeError("unparseable " + what + " response: " + errors);
    }
    return root;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

// Docker error bodies look like {"message": "..."}
std::string error_message(const HttpResponse& response) {
    if (!response.transport_error.empty()) {
        return response.transport_error;
    }
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    const std::string& body = response.body;
    if (reader->parse(body.data(), body.data() + body.size(), &root, nullptr) &&
        root.isObject() && root["message"].isString()) {
        return root["message"].asString();
    }
    return "HTTP " + std::to_string(response.status_code);
}

void expect(const HttpResponse& response, const std::string& operation,
            std::initializer_list<long> accepted) {
    if (!response.transport_error.empty() ||
        std::find(accepted.begin(), accepted.end(), response.status_code) == accepted.end()) {
        throw ContainerRuntimeError(operation + " failed: " + error_message(response),
                                    response.status_code);
    }
}

} // namespace

DockerClient::DockerClient(const std::string& socket_path, const std::string& api_version)
    : socket_path_(socket_path),
      // Host part is ignored when talking over a unix socket
      base_url_("http://localhost/" + api_version) {}

HttpRequest DockerClient::make_request(const std::string& method, const std::string& path,
                                       long timeout_ms) const {
    HttpRequest request;
    request.method = method;
    request.url = base_url_ + path;
    request.unix_socket = socket_path_;
    request.timeout_ms = timeout_ms;
    return request;
}

HttpResponse DockerClient::call(const std::string& method, const std::string& path,
                                 long timeout_ms, const std::string& body,
                                 const std::string& content_type) const {
    HttpRequest request = make_request(method, path, timeout_ms);
    request.body = body;
    if (method == "POST" || method == "PUT") {
        request.headers["Content-Type"] = content_type;
    }
    return HttpClient::perform(request);
}

std::string DockerClient::create_body(const ContainerSpec& spec) {
    Json::Value body(Json::objectValue);
    body["Image"] = spec.image;
    body["WorkingDir"] = spec.working_dir;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["Tty"] = false;
    body["OpenStdin"] = false;
    body["NetworkDisabled"] = spec.network_disabled;

    Json::Value cmd(Json::arrayValue);
    for (const auto& arg : spec.command) {
        cmd.append(arg);
    }
    body["Cmd"] = cmd;

    Json::Value env(Json::arrayValue);
    for (const auto& var : spec.env) {
        env.append(var);
    }
    body["Env"] = env;

    Json::Value labels(Json::objectValue);
    for (const auto& [key, value] : spec.labels) {
        labels[key] = value;
    }
    body["Labels"] = labels;

    Json::Value host(Json::objectValue);
    host["Memory"] = static_cast<Json::UInt64>(spec.memory_bytes);
    host["MemorySwap"] = static_cast<Json::UInt64>(spec.memory_bytes);
    host["NanoCpus"] = static_cast<Json::Int64>(spec.nano_cpus);
    host["PidsLimit"] = static_cast<Json::Int64>(spec.pids_limit);
    host["NetworkMode"] = spec.network_disabled ? "none" : "bridge";
    host["ReadonlyRootfs"] = spec.readonly_rootfs;
    host["Privileged"] = false;
    host["AutoRemove"] = false;

    Json::Value cap_drop(Json::arrayValue);
    cap_drop.append("ALL");
    host["CapDrop"] = cap_drop;

    Json::Value security(Json::arrayValue);
    for (const auto& opt : spec.security_opts) {
        security.append(opt);
    }
    host["SecurityOpt"] = security;

    Json::Value tmpfs(Json::objectValue);
    for (const auto& [mount, options] : spec.tmpfs) {
        tmpfs[mount] = options;
    }
    host["Tmpfs"] = tmpfs;

    if (!spec.workspace_volume.empty()) {
        Json::Value mount(Json::objectValue);
        mount["Type"] = "volume";
        mount["Target"] = spec.workspace_volume;
        mount["ReadOnly"] = false;
        Json::Value mounts(Json::arrayValue);
        mounts.append(mount);
        host["Mounts"] = mounts;
    }

    Json::Value ulimits(Json::arrayValue);
    if (spec.max_open_files > 0) {
        Json::Value nofile(Json::objectValue);
        nofile["Name"] = "nofile";
        nofile["Soft"] = static_cast<Json::Int64>(spec.max_open_files);
        nofile["Hard"] = static_cast<Json::Int64>(spec.max_open_files);
        ulimits.append(nofile);
    }
    if (spec.max_file_size_bytes > 0) {
        Json::Value fsize(Json::objectValue);
        fsize["Name"] = "fsize";
        fsize["Soft"] = static_cast<Json::Int64>(spec.max_file_size_bytes);
        fsize["Hard"] = static_cast<Json::Int64>(spec.max_file_size_bytes);
        ulimits.append(fsize);
    }
    host["Ulimits"] = ulimits;

    Json::Value log_config(Json::objectValue);
    log_config["Type"] = "json-file";
    log_config["Config"]["max-size"] = spec.log_max_size;
    log_config["Config"]["max-file"] = "1";
    host["LogConfig"] = log_config;

    body["HostConfig"] = host;
    return write_json(body);
}

std::string DockerClient::create(const ContainerSpec& spec) {
    std::string path = "/containers/create";
    if (!spec.name.empty()) {
        path += "?name=" + HttpClient::escape(spec.name);
    }
    HttpResponse response = call("POST", path, DOCKER_REQUEST_TIMEOUT_MS, create_body(spec));
    expect(response, "create " + spec.name, {201});

    Json::Value root = parse_json(response.body, "create");
    if (!root["Id"].isString() || root["Id"].asString().empty()) {
        throw ContainerRuntimeError("create returned no container id");
    }
    return root["Id"].asString();
}

void DockerClient::put_archive(const std::string& id, const std::string& path,
                               const std::string& tar) {
    HttpResponse response = call("PUT",
                                 "/containers/" + id + "/archive?path=" + HttpClient::escape(path),
                                 DOCKER_REQUEST_TIMEOUT_MS, tar, "application/x-tar");
    expect(response, "archive upload", {200});
}

void DockerClient::start(const std::string& id) {
    HttpResponse response = call("POST", "/containers/" + id + "/start", DOCKER_REQUEST_TIMEOUT_MS);
    expect(response, "start", {204, 304});
}

void DockerClient::stream_logs(const std::string& id, OutputCapture& capture,
                               const std::atomic<bool>& cancel) {
    HttpRequest request = make_request(
        "GET", "/containers/" + id + "/logs?follow=1&stdout=1&stderr=1", 0);

    BodySink sink = [&capture](const char* data, size_t len) {
        capture.feed(data, len);
        return true;
    };
    HttpResponse response = HttpClient::perform_streaming(request, sink, &cancel);

    if (cancel.load()) {
        return;
    }
    expect(response, "log stream", {200});
}

std::optional<int> DockerClient::wait(const std::string& id, std::chrono::milliseconds timeout) {
    HttpResponse response = call("POST", "/containers/" + id + "/wait",
                                 static_cast<long>(timeout.count()));
    if (response.timed_out) {
        return std::nullopt;
    }
    expect(response, "wait", {200});

    Json::Value root = parse_json(response.body, "wait");
    if (root.isMember("Error") && root["Error"].isObject() && root["Error"]["Message"].isString()) {
        throw ContainerRuntimeError("wait reported: " + root["Error"]["Message"].asString());
    }
    return root["StatusCode"].asInt();
}

ContainerState DockerClient::inspect(const std::string& id) {
    HttpResponse response = call("GET", "/containers/" + id + "/json", DOCKER_REQUEST_TIMEOUT_MS);
    expect(response, "inspect", {200});

    Json::Value root = parse_json(response.body, "inspect");
    const Json::Value& state = root["State"];

    ContainerState result;
    result.running = state["Running"].asBool();
    result.exit_code = state["ExitCode"].asInt();
    result.oom_killed = state["OOMKilled"].asBool();
    return result;
}

uint64_t DockerClient::memory_usage(const std::string& id) {
    HttpResponse response = call("GET", "/containers/" + id + "/stats?stream=0&one-shot=1",
                                 DOCKER_REQUEST_TIMEOUT_MS);
    expect(response, "stats", {200});

    Json::Value root = parse_json(response.body, "stats");
    const Json::Value& memory = root["memory_stats"];
    // max_usage only exists on cgroup v1 hosts
    uint64_t usage = memory["usage"].isNumeric() ? memory["usage"].asUInt64() : 0;
    uint64_t max_usage = memory["max_usage"].isNumeric() ? memory["max_usage"].asUInt64() : 0;
    return std::max(usage, max_usage);
}

void DockerClient::kill(const std::string& id) {
    HttpResponse response = call("POST", "/containers/" + id + "/kill?signal=SIGKILL",
                                 DOCKER_STOP_TIMEOUT_MS);
    // 409: not running any more; 404: already gone
    expect(response, "kill", {204, 404, 409});
}

void DockerClient::remove(const std::string& id) {
    HttpResponse response = call("DELETE", "/containers/" + id + "?force=1&v=1",
                                 DOCKER_STOP_TIMEOUT_MS);
    // 409: removal already in progress
    expect(response, "remove", {204, 404, 409});
}

std::vector<std::string> DockerClient::list_by_label(const std::string& label) {
    Json::Value filters(Json::objectValue);
    filters["label"].append(label);

    HttpResponse response = call("GET",
                                 "/containers/json?all=1&filters=" + HttpClient::escape(write_json(filters)),
                                 DOCKER_REQUEST_TIMEOUT_MS);
    expect(response, "list", {200});

    std::vector<std::string> ids;
    Json::Value root = parse_json(response.body, "list");
    for (const auto& container : root) {
        if (container["Id"].isString()) {
            ids.push_back(container["Id"].asString());
        }
    }
    return ids;
}

bool DockerClient::ping() {
    HttpResponse response = call("GET", "/_ping", DOCKER_STOP_TIMEOUT_MS);
    return response.ok();
}

} // namespace contestrun
