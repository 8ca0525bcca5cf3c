#pragma once
// HTTP Endpoint: turns individual HTTP calls into session traffic
//
//   POST   /mcp     request      -> 200 with the correlated reply
//                   notification -> 202, never waits for processing
//   DELETE /mcp     terminate the session (repeat calls are no-ops)
//   GET    /health  200 "OK", no session interaction
//
// Socket-free: HttpServer feeds it parsed requests, tests call it directly.

#include <almanac/transport/session.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace almanac::transport {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

constexpr const char* SESSION_HEADER = "Mcp-Session-Id";

struct EndpointOptions {
    size_t max_body_bytes = 1024 * 1024;
    std::chrono::milliseconds idle_timeout{0};  // 0 = wait for reply or close
};

class McpEndpoint {
public:
    McpEndpoint(Session& session, EndpointOptions options = {})
        : session_(session), options_(options) {}

    // Thread-safe; POST requests block the calling thread until resolved
    HttpResponse handle(const HttpRequest& request);

    // Response for a body the transport refused to buffer
    HttpResponse payload_too_large(unsigned version, bool keep_alive) const;

    const EndpointOptions& options() const { return options_; }

private:
    HttpResponse handle_post(const HttpRequest& request);
    HttpResponse handle_delete(const HttpRequest& request);
    HttpResponse handle_health(const HttpRequest& request);

    bool session_header_mismatch(const HttpRequest& request) const;

    Session& session_;
    EndpointOptions options_;
};

} // namespace almanac::transport
