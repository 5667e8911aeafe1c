#include "api_client.h"
#include "constants.h"
#include "errors.h"
#include "http_client.h"
#include "worker_identity.h"
#include <json/json.h>
#include <stdexcept>

namespace contestrun {

namespace {

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

void expect_success(const HttpResponse& response, const std::string& operation) {
    if (!response.transport_error.empty()) {
        throw ApiError(operation + " failed: " + response.transport_error);
    }
    if (!response.ok()) {
        throw ApiError(operation + " returned HTTP " + std::to_string(response.status_code),
                       response.status_code);
    }
}

} // namespace

HttpApiClient::HttpApiClient(std::string base_url, std::string worker_id,
                             const WorkerIdentity& identity)
    : base_url_(std::move(base_url)), worker_id_(std::move(worker_id)), identity_(identity) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string HttpApiClient::url(const std::string& path) const {
    return base_url_ + path;
}

std::optional<SubmissionJob> HttpApiClient::fetch_job() {
    HttpRequest request;
    request.method = "GET";
    request.url = url("/api/runner/job");
    request.timeout_ms = API_REQUEST_TIMEOUT_MS;
    request.headers["X-Runner-ID"] = worker_id_;
    request.headers["X-Runner-Signature"] = identity_.sign("job-request");

    HttpResponse response = HttpClient::perform(request);
    if (response.transport_error.empty() && response.status_code == 204) {
        return std::nullopt;
    }
    expect_success(response, "job fetch");

    try {
        return SubmissionJob::from_json(response.body);
    } catch (const std::invalid_argument& e) {
        throw ApiError(std::string("malformed job: ") + e.what(), response.status_code);
    }
}

void HttpApiClient::report_result(const SignedResult& result) {
    HttpRequest request;
    request.method = "POST";
    request.url = url("/api/runner/result");
    request.timeout_ms = API_REQUEST_TIMEOUT_MS;
    request.headers["Content-Type"] = "application/json";
    request.headers["X-Runner-ID"] = result.worker_id;
    request.headers["X-Runner-Signature"] = result.signature;
    request.body = result.to_json();

    expect_success(HttpClient::perform(request), "result report");
}

std::string HttpApiClient::registration_body(const Registration& registration) {
    Json::Value body(Json::objectValue);
    body["runnerId"] = registration.worker_id;
    body["publicKey"] = registration.public_key_pem;
    Json::Value capabilities(Json::arrayValue);
    for (const auto& name : registration.capabilities) {
        capabilities.append(name);
    }
    body["capabilities"] = capabilities;
    body["maxConcurrency"] = registration.max_concurrency;
    return write_json(body);
}

std::string HttpApiClient::heartbeat_body(const Heartbeat& heartbeat) {
    Json::Value body(Json::objectValue);
    body["runnerId"] = heartbeat.worker_id;
    body["timestamp"] = static_cast<Json::Int64>(heartbeat.timestamp_ms);
    body["status"] = heartbeat.draining ? "draining" : "healthy";
    body["activeJobs"] = static_cast<Json::UInt64>(heartbeat.active_jobs);
    return write_json(body);
}

void HttpApiClient::register_worker(const Registration& registration) {
    HttpRequest request;
    request.method = "POST";
    request.url = url("/api/runner/register");
    request.timeout_ms = API_REQUEST_TIMEOUT_MS;
    request.headers["Content-Type"] = "application/json";
    request.body = registration_body(registration);

    expect_success(HttpClient::perform(request), "registration");
}

void HttpApiClient::heartbeat(const Heartbeat& heartbeat) {
    HttpRequest request;
    request.method = "POST";
    request.url = url("/api/runner/heartbeat");
    request.timeout_ms = API_REQUEST_TIMEOUT_MS;
    request.headers["Content-Type"] = "application/json";
    request.headers["X-Runner-ID"] = heartbeat.worker_id;
    request.body = heartbeat_body(heartbeat);

    expect_success(HttpClient::perform(request), "heartbeat");
}

} // namespace contestrun
