#pragma once

#include "Protocol.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_stdio {

using json = nlohmann::json;

/**
 * @brief Failure categories reported by MCPClient
 */
enum class ErrorKind {
    SpawnFailed,
    HandshakeTimeout,
    HandshakeRejected,
    NotConnected,
    RequestTimeout,
    PeerExited,
    MalformedResponse,
    RemoteError,
    Interrupted
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnFailed:       return "SpawnFailed";
        case ErrorKind::HandshakeTimeout:  return "HandshakeTimeout";
        case ErrorKind::HandshakeRejected: return "HandshakeRejected";
        case ErrorKind::NotConnected:      return "NotConnected";
        case ErrorKind::RequestTimeout:    return "RequestTimeout";
        case ErrorKind::PeerExited:        return "PeerExited";
        case ErrorKind::MalformedResponse: return "MalformedResponse";
        case ErrorKind::RemoteError:       return "RemoteError";
        case ErrorKind::Interrupted:       return "Interrupted";
    }
    return "Unknown";
}

/**
 * @brief Structured failure value
 *
 * For RemoteError, code/message/data are the peer's JSON-RPC error object
 * passed through verbatim. For other kinds, code is 0.
 */
struct ClientError {
    ErrorKind kind;
    int code = 0;
    std::string message;
    json data;  // null when absent

    std::string describe() const {
        std::string text = to_string(kind);
        if (kind == ErrorKind::RemoteError) {
            text += " (" + std::to_string(code) + ")";
        }
        if (!message.empty()) {
            text += ": " + message;
        }
        return text;
    }

    static ClientError remote(const RpcError& error) {
        return {ErrorKind::RemoteError, error.code, error.message, error.data};
    }
};

/**
 * @brief Outcome of a request: a result value or an error
 */
struct CallResult {
    json result;
    std::optional<ClientError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief Outcome of tools/list; tools is empty whenever error is set
 */
struct ToolListResult {
    std::vector<ToolDescriptor> tools;
    std::optional<ClientError> error;

    bool ok() const { return !error.has_value(); }
};

} // namespace mcp_stdio
