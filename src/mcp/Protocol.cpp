#include "Protocol.hpp"

namespace mcp_stdio {

std::optional<ToolDescriptor> ToolDescriptor::from_json(const json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return std::nullopt;
    }

    ToolDescriptor tool;
    tool.name = j["name"].get<std::string>();
    if (j.contains("description") && j["description"].is_string()) {
        tool.description = j["description"].get<std::string>();
    }
    tool.input_schema = j.value("inputSchema", json::object());
    return tool;
}

json ToolDescriptor::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

json make_request(int64_t id, const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json make_notification(const std::string& method, const json& params) {
    json notification = {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json make_result_response(const json& id, const json& result) {
    return {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

json make_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

bool is_response(const json& message) {
    return message.is_object() && message.contains("id") && !message.contains("method");
}

std::optional<ResponseEnvelope> parse_response(const json& message) {
    if (!is_response(message)) {
        return std::nullopt;
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != protocol::kJsonRpcVersion) {
        return std::nullopt;
    }

    const json& id = message["id"];
    if (!id.is_number_integer()) {
        return std::nullopt;
    }

    bool has_result = message.contains("result");
    bool has_error = message.contains("error");
    if (has_result == has_error) {
        return std::nullopt;  // exactly one must be present
    }

    ResponseEnvelope response;
    response.id = id.get<int64_t>();

    if (has_result) {
        response.result = message["result"];
        return response;
    }

    const json& error = message["error"];
    if (!error.is_object() || !error.contains("code") || !error["code"].is_number_integer() ||
        !error.contains("message") || !error["message"].is_string()) {
        return std::nullopt;
    }

    RpcError rpc_error;
    rpc_error.code = error["code"].get<int>();
    rpc_error.message = error["message"].get<std::string>();
    if (error.contains("data")) {
        rpc_error.data = error["data"];
    }
    response.error = std::move(rpc_error);
    return response;
}

std::optional<std::vector<ToolDescriptor>> parse_tool_list(const json& result) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return std::nullopt;
    }

    std::vector<ToolDescriptor> tools;
    for (const auto& entry : result["tools"]) {
        if (auto tool = ToolDescriptor::from_json(entry)) {
            tools.push_back(std::move(*tool));
        }
    }
    return tools;
}

} // namespace mcp_stdio
