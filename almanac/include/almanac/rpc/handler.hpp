#pragma once
// RPC Handler: JSON-RPC / MCP request dispatcher
//
// The single sequential message processor behind every transport (stdio and
// HTTP). Owns the tool registry and answers the MCP lifecycle methods.
// Tools are registered by the embedding program; server_info is built in.

#include "protocol.hpp"
#include "types.hpp"
#include "../log.hpp"
#include "../version.hpp"
#include "../transport/processor.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace almanac::rpc {

using json = nlohmann::json;

class Handler : public transport::MessageProcessor {
public:
    explicit Handler(std::string server_name = ALMANAC_SERVER_NAME)
        : server_name_(std::move(server_name)),
          start_time_(std::chrono::steady_clock::now()) {
        register_builtin_tools();
    }

    // Register or replace a tool
    void add_tool(ToolSchema schema, ToolHandler handler) {
        std::string name = schema.name;
        auto existing = handlers_.find(name);
        if (existing != handlers_.end()) {
            for (auto& tool : tools_) {
                if (tool.name == name) {
                    tool = std::move(schema);
                    break;
                }
            }
        } else {
            tools_.push_back(std::move(schema));
        }
        handlers_[name] = std::move(handler);
    }

    const std::vector<ToolSchema>& tools() const { return tools_; }

    // Decode one message and produce its reply. Notifications (no "id"
    // member) never produce a reply, even when malformed.
    std::optional<std::string> process(const std::string& message) override {
        json request = json::parse(message, nullptr, false);
        if (request.is_discarded()) {
            return dump(make_error(json(), error::PARSE_ERROR, "Parse error: invalid JSON"));
        }
        if (!request.is_object()) {
            return dump(make_error(json(), error::INVALID_REQUEST,
                                   "Invalid request: expected a JSON-RPC object"));
        }

        bool expects_reply = request.contains("id");
        json response = handle_request(request);

        if (!expects_reply) {
            if (!response.is_null() && response.contains("error")) {
                log_debug("rpc", "dropping error for notification: %s",
                          response["error"].value("message", "").c_str());
            }
            return std::nullopt;
        }
        if (response.is_null()) {
            // A notification method sent with an id still gets an answer
            response = make_result(request["id"], json::object());
        }
        return dump(response);
    }

    std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
    }

private:
    std::string server_name_;
    std::chrono::steady_clock::time_point start_time_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            return make_error(request.value("id", json()), error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        log_debug("rpc", "method=%s", info.method.c_str());

        if (info.method.rfind("notifications/", 0) == 0) {
            return json();
        } else if (info.method == "initialize") {
            return handle_initialize(info.params, info.id);
        } else if (info.method == "ping") {
            return make_result(info.id, json::object());
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        }

        return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
    }

    json handle_initialize(const json& params, const json& id) {
        if (params.is_object() && params.contains("protocolVersion") &&
            params["protocolVersion"].is_string()) {
            std::string requested = params["protocolVersion"].get<std::string>();
            if (!version::protocol_supported(requested)) {
                log_notice("rpc", "client requested protocol %s, answering with %s",
                           requested.c_str(), ALMANAC_MCP_PROTOCOL_VERSION);
            }
        }

        return make_result(id, {
            {"protocolVersion", ALMANAC_MCP_PROTOCOL_VERSION},
            {"serverInfo", {
                {"name", server_name_},
                {"version", ALMANAC_VERSION}
            }},
            {"capabilities", {
                {"tools", {{"listChanged", false}}}
            }}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back(tool.to_listing());
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (!arguments.is_object()) {
            return make_error(id, error::INVALID_PARAMS, "Tool arguments must be an object");
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            return make_result(id, result.to_call_result());
        } catch (const std::exception& e) {
            log_warning("rpc", "tool %s failed: %s", name.c_str(), e.what());
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }

    void register_builtin_tools() {
        add_tool({
            "server_info",
            "Report server name, version, MCP protocol revision and uptime.",
            {
                {"type", "object"},
                {"properties", json::object()},
                {"required", json::array()}
            }
        }, [this](const json&) {
            auto uptime_ms = uptime().count();
            json data = {
                {"name", server_name_},
                {"version", ALMANAC_VERSION},
                {"protocolVersion", ALMANAC_MCP_PROTOCOL_VERSION},
                {"uptimeMs", uptime_ms}
            };
            return ToolResult::ok(server_name_ + " " + ALMANAC_VERSION + " (up " +
                                  std::to_string(uptime_ms / 1000) + "s)", data);
        });
    }
};

} // namespace almanac::rpc
