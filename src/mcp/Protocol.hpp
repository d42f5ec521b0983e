#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_stdio {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 and MCP wire constants
 */
namespace protocol {
    inline constexpr const char* kJsonRpcVersion = "2.0";
    inline constexpr const char* kProtocolVersion = "2024-11-05";

    inline constexpr const char* kInitialize = "initialize";
    inline constexpr const char* kInitialized = "notifications/initialized";
    inline constexpr const char* kToolsList = "tools/list";
    inline constexpr const char* kToolsCall = "tools/call";
    inline constexpr const char* kPing = "ping";
    inline constexpr const char* kRootsList = "roots/list";

    inline constexpr int kParseError = -32700;
    inline constexpr int kInvalidRequest = -32600;
    inline constexpr int kMethodNotFound = -32601;
    inline constexpr int kInvalidParams = -32602;
    inline constexpr int kInternalError = -32603;
} // namespace protocol

/**
 * @brief JSON-RPC error object
 */
struct RpcError {
    int code = 0;
    std::string message;
    json data;  // null when absent
};

/**
 * @brief Parsed response; exactly one of result/error is set
 */
struct ResponseEnvelope {
    int64_t id = 0;
    std::optional<json> result;
    std::optional<RpcError> error;

    bool is_error() const { return error.has_value(); }
};

/**
 * @brief Tool metadata advertised by the peer via tools/list
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments

    static std::optional<ToolDescriptor> from_json(const json& j);
    json to_json() const;
};

/**
 * @brief Build a request envelope; params omitted when null
 */
json make_request(int64_t id, const std::string& method, const json& params = json());

/**
 * @brief Build a notification envelope (no id); params omitted when null
 */
json make_notification(const std::string& method, const json& params = json());

/**
 * @brief Build a success response to a peer-initiated request
 */
json make_result_response(const json& id, const json& result);

/**
 * @brief Build an error response to a peer-initiated request
 */
json make_error_response(const json& id, int code, const std::string& message);

/**
 * @brief Check whether a message is a response (has id, no method)
 */
bool is_response(const json& message);

/**
 * @brief Validate and parse a response envelope
 * @return std::nullopt if the message is not a well-formed response
 */
std::optional<ResponseEnvelope> parse_response(const json& message);

/**
 * @brief Extract result.tools; entries without a name are skipped
 * @return std::nullopt if result has no tools array
 */
std::optional<std::vector<ToolDescriptor>> parse_tool_list(const json& result);

} // namespace mcp_stdio
