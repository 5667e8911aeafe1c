#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>

namespace contestrun {

// Simple HTTP request
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 0;          // 0: no overall deadline
    std::string unix_socket;      // Non-empty: connect through this socket
};

// Simple HTTP response
struct HttpResponse {
    long status_code = 0;         // 0 when the transfer never got a status
    std::string body;
    std::string transport_error;  // libcurl error text, empty on success
    bool timed_out = false;

    bool ok() const { return transport_error.empty() && status_code >= 200 && status_code < 300; }
};

// Receives body bytes as they arrive; return false to abort the transfer
using BodySink = std::function<bool(const char* data, size_t len)>;

// Blocking HTTP/1.1 client over libcurl. Every call uses its own easy
// handle, so one client may be shared by any number of job threads.
class HttpClient {
public:
    static HttpResponse perform(const HttpRequest& request);

    // Stream the body into sink instead of buffering it. The transfer is
    // aborted once cancel becomes true.
    static HttpResponse perform_streaming(const HttpRequest& request,
                                          const BodySink& sink,
                                          const std::atomic<bool>* cancel = nullptr);

    // Percent-encode a query parameter value
    static std::string escape(const std::string& value);
};

} // namespace contestrun
