#pragma once
// RPC Types: what a tool declares and what it returns
//
// Each type knows its MCP wire shape, so the dispatcher only routes:
//   ToolSchema  -> one entry of tools/list
//   ToolResult  -> the result member of a tools/call reply

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace almanac::rpc {

using json = nlohmann::json;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for the arguments object

    json to_listing() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema.is_null() ? json{{"type", "object"}} : input_schema}
        };
    }
};

// Outcome of one tool invocation. A failed tool is still a successful
// JSON-RPC call: the failure travels in isError, not as an RPC error.
struct ToolResult {
    bool is_error = false;
    std::string text;
    json structured;  // null unless the tool has machine-readable output

    static ToolResult ok(std::string text, json structured = json()) {
        return {false, std::move(text), std::move(structured)};
    }

    static ToolResult error(std::string message) {
        return {true, std::move(message), json()};
    }

    json to_call_result() const {
        json content = json::array();
        content.push_back({{"type", "text"}, {"text", text}});

        json result = {
            {"content", content},
            {"isError", is_error}
        };
        if (!structured.is_null()) {
            result["structuredContent"] = structured;
        }
        return result;
    }
};

// Receives the arguments object (never null; {} when the caller sent none)
using ToolHandler = std::function<ToolResult(const json& arguments)>;

} // namespace almanac::rpc
