#include "http_client.h"
#include <curl/curl.h>
#include <mutex>

namespace contestrun {

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

struct TransferState {
    const BodySink* sink = nullptr;
    std::string* buffer = nullptr;
    const std::atomic<bool>* cancel = nullptr;
};

size_t write_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t len = size * nmemb;
    if (state->sink) {
        // Returning a short count makes libcurl abort with CURLE_WRITE_ERROR
        return (*state->sink)(data, len) ? len : 0;
    }
    state->buffer->append(data, len);
    return len;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userdata);
    if (state->cancel && state->cancel->load()) {
        return 1;
    }
    return 0;
}

HttpResponse run_transfer(const HttpRequest& request, TransferState& state) {
    ensure_curl_initialized();

    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.transport_error = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (!request.unix_socket.empty()) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, request.unix_socket.c_str());
    }
    if (request.method == "POST" || request.method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    }

    struct curl_slist* headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        headers = curl_slist_append(headers, (key + ": " + value).c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    if (state.cancel) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (res != CURLE_OK) {
        response.transport_error = curl_easy_strerror(res);
        response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace

HttpResponse HttpClient::perform(const HttpRequest& request) {
    std::string body;
    TransferState state;
    state.buffer = &body;
    HttpResponse response = run_transfer(request, state);
    response.body = std::move(body);
    return response;
}

HttpResponse HttpClient::perform_streaming(const HttpRequest& request,
                                           const BodySink& sink,
                                           const std::atomic<bool>* cancel) {
    TransferState state;
    state.sink = &sink;
    state.cancel = cancel;
    return run_transfer(request, state);
}

std::string HttpClient::escape(const std::string& value) {
    ensure_curl_initialized();
    char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return "";
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace contestrun
