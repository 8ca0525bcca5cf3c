#pragma once
// RPC Protocol: JSON-RPC 2.0 envelope helpers and error codes
//
// Shared by the message processor (building replies) and the HTTP adapter
// (classifying inbound bodies and building its own error replies).

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace almanac::rpc {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // Implementation-defined range
    constexpr int SESSION_TERMINATED = -32000;
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int TOOL_EXECUTION_ERROR = -32002;
}

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

// Serialize without throwing on invalid UTF-8 coming back from tools
inline std::string dump(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Minimal envelope view: just enough to decide request vs notification
struct Envelope {
    json message;
    bool has_correlation_id = false;
    json id;  // null when absent
};

// Decode a body into an envelope. Only a JSON object qualifies; arrays
// (batches), scalars and malformed text are rejected with error_msg set.
// A present "id" member marks a request even when its value is null.
inline std::optional<Envelope> decode_envelope(const std::string& body, std::string& error_msg) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        error_msg = "Parse error: body is not valid JSON";
        return std::nullopt;
    }
    if (!parsed.is_object()) {
        error_msg = "Invalid request: expected a single JSON-RPC object";
        return std::nullopt;
    }

    Envelope envelope;
    envelope.has_correlation_id = parsed.contains("id");
    if (envelope.has_correlation_id) {
        envelope.id = parsed["id"];
    }
    envelope.message = std::move(parsed);
    return envelope;
}

// Validate JSON-RPC 2.0 request shape
inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

} // namespace almanac::rpc
