#include <almanac/transport/http_endpoint.hpp>
#include <almanac/rpc/protocol.hpp>
#include <almanac/log.hpp>
#include <almanac/version.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace almanac::transport {

namespace {

const std::string MCP_PATH = "/mcp";
const std::string HEALTH_PATH = "/health";

std::string path_of(const HttpRequest& request) {
    std::string target(request.target());
    auto query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }
    return target;
}

HttpResponse make_response(const HttpRequest& request, http::status status) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, ALMANAC_SERVER_NAME "/" ALMANAC_VERSION);
    response.keep_alive(request.keep_alive());
    return response;
}

void set_json_body(HttpResponse& response, std::string body) {
    response.set(http::field::content_type, "application/json");
    response.body() = std::move(body);
}

void set_text_body(HttpResponse& response, std::string body) {
    response.set(http::field::content_type, "text/plain; charset=utf-8");
    response.body() = std::move(body);
}

std::string error_body(const rpc::json& id, int code, const std::string& message) {
    return rpc::dump(rpc::make_error(id, code, message));
}

} // namespace

HttpResponse McpEndpoint::handle(const HttpRequest& request) {
    std::string path = path_of(request);
    HttpResponse response;

    if (path == MCP_PATH) {
        if (request.method() == http::verb::post) {
            response = handle_post(request);
        } else if (request.method() == http::verb::delete_) {
            response = handle_delete(request);
        } else {
            response = make_response(request, http::status::method_not_allowed);
            response.set(http::field::allow, "POST, DELETE");
            set_text_body(response, "Method Not Allowed");
        }
    } else if (path == HEALTH_PATH && request.method() == http::verb::get) {
        response = handle_health(request);
    } else {
        response = make_response(request, http::status::not_found);
        set_text_body(response, "Not Found");
    }

    response.prepare_payload();
    log_debug("http", "%s %s -> %u", std::string(request.method_string()).c_str(),
              path.c_str(), static_cast<unsigned>(response.result_int()));
    return response;
}

HttpResponse McpEndpoint::payload_too_large(unsigned version, bool keep_alive) const {
    HttpResponse response{http::status::payload_too_large, version};
    response.set(http::field::server, ALMANAC_SERVER_NAME "/" ALMANAC_VERSION);
    response.keep_alive(keep_alive);
    response.set(http::field::content_type, "text/plain; charset=utf-8");
    response.body() = "Request body exceeds " + std::to_string(options_.max_body_bytes) + " bytes";
    response.prepare_payload();
    return response;
}

HttpResponse McpEndpoint::handle_post(const HttpRequest& request) {
    const std::string& body = request.body();

    if (body.size() > options_.max_body_bytes) {
        log_notice("http", "rejecting %zu-byte body (cap %zu)", body.size(), options_.max_body_bytes);
        return payload_too_large(request.version(), request.keep_alive());
    }

    if (session_header_mismatch(request)) {
        auto response = make_response(request, http::status::not_found);
        set_json_body(response, error_body(rpc::json(), rpc::error::SESSION_TERMINATED,
                                           "Unknown session"));
        return response;
    }

    std::string error_msg;
    auto envelope = rpc::decode_envelope(body, error_msg);
    if (!envelope) {
        log_debug("http", "undecodable body: %s", error_msg.c_str());
        auto response = make_response(request, http::status::bad_request);
        set_json_body(response, error_body(rpc::json(), rpc::error::PARSE_ERROR, error_msg));
        return response;
    }

    auto submission = session_.submit(body, envelope->has_correlation_id);

    if (submission.admission == Admission::SessionClosed) {
        auto response = make_response(request, http::status::not_found);
        set_json_body(response, error_body(envelope->id, rpc::error::SESSION_TERMINATED,
                                           "Session terminated"));
        return response;
    }
    if (submission.admission == Admission::TooManyPending) {
        auto response = make_response(request, http::status::service_unavailable);
        response.set(http::field::retry_after, "1");
        set_json_body(response, error_body(envelope->id, rpc::error::INTERNAL_ERROR,
                                           "Too many outstanding requests"));
        return response;
    }

    if (!envelope->has_correlation_id) {
        auto response = make_response(request, http::status::accepted);
        response.set(SESSION_HEADER, session_.id());
        return response;
    }

    Outcome outcome = session_.registry().await_resolution(submission.waiter, options_.idle_timeout);

    switch (outcome.kind) {
        case Outcome::Kind::Reply: {
            auto response = make_response(request, http::status::ok);
            response.set(SESSION_HEADER, session_.id());
            set_json_body(response, std::move(outcome.payload));
            return response;
        }
        case Outcome::Kind::Cancelled: {
            auto response = make_response(request, http::status::gone);
            set_json_body(response, error_body(envelope->id, rpc::error::SESSION_TERMINATED,
                                               "Session terminated: " + outcome.reason));
            return response;
        }
        case Outcome::Kind::TimedOut: {
            auto response = make_response(request, http::status::gateway_timeout);
            response.set(SESSION_HEADER, session_.id());
            set_json_body(response, error_body(envelope->id, rpc::error::INTERNAL_ERROR,
                                               "Request timed out: " + outcome.reason));
            return response;
        }
    }

    throw std::logic_error(std::string("unhandled outcome ") + outcome_kind_name(outcome.kind));
}

HttpResponse McpEndpoint::handle_delete(const HttpRequest& request) {
    if (session_header_mismatch(request)) {
        auto response = make_response(request, http::status::not_found);
        set_text_body(response, "Unknown session");
        return response;
    }

    if (session_.close("session terminated by client")) {
        log_info("http", "session %s terminated by DELETE", session_.id().c_str());
    }

    auto response = make_response(request, http::status::ok);
    response.set(SESSION_HEADER, session_.id());
    return response;
}

HttpResponse McpEndpoint::handle_health(const HttpRequest& request) {
    auto response = make_response(request, http::status::ok);
    set_text_body(response, "OK");
    return response;
}

bool McpEndpoint::session_header_mismatch(const HttpRequest& request) const {
    auto it = request.find(SESSION_HEADER);
    if (it == request.end()) return false;
    return std::string(it->value()) != session_.id();
}

} // namespace almanac::transport
