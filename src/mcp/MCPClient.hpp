#pragma once

#include "ClientError.hpp"
#include "ITransport.hpp"
#include "Protocol.hpp"
#include "core/ChildProcess.hpp"
#include "core/LaunchSpec.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace mcp_stdio {

using json = nlohmann::json;

enum class ConnectionState {
    Disconnected,
    Connecting,
    Ready,
    ShuttingDown
};

const char* to_string(ConnectionState state);

/**
 * @brief What the peer announced in its initialize result
 */
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
    json capabilities = json::object();
    std::string instructions;
};

/**
 * @brief Per-client timeouts and identity
 */
struct ClientOptions {
    ClientInfo client_info;
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds list_tools_timeout{10000};
    // First listing on a connection; peers launched through package
    // runners may still be provisioning themselves
    std::chrono::milliseconds first_list_tools_timeout{100000};
    std::chrono::milliseconds call_timeout{30000};
    std::chrono::milliseconds diagnostic_timeout{1000};
    ShutdownPolicy shutdown;
    json roots = json::array();  // answered to roots/list
};

/**
 * @brief MCP client speaking JSON-RPC 2.0 to one stdio peer
 *
 * Owns at most one peer process at a time. connect() spawns the peer and
 * performs the initialize handshake; list_tools()/call_tool() are strict
 * request/response round trips; disconnect() (also run by the destructor)
 * tears the peer down.
 *
 * Calls on one instance are serialised internally. Failures are returned
 * as values, never thrown.
 */
class MCPClient {
public:
    /**
     * @brief Construct a disconnected client
     * @param spec Peer to launch on connect()
     * @param options Timeouts and client identity
     * @param logger Logger to use (spdlog default logger if null)
     * @param factory Transport factory (spawns a StdioTransport if empty)
     * @throws std::invalid_argument if spec has no executable
     */
    explicit MCPClient(LaunchSpec spec,
                       ClientOptions options = {},
                       std::shared_ptr<spdlog::logger> logger = nullptr,
                       TransportFactory factory = nullptr);

    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    /**
     * @brief Spawn the peer and perform the handshake
     *
     * On failure the peer is torn down and last_error() holds SpawnFailed,
     * HandshakeTimeout, HandshakeRejected, PeerExited or Interrupted.
     *
     * @param timeout Bound on the wait for the initialize response
     * @return true if the client is Ready
     */
    bool connect(std::chrono::milliseconds timeout);
    bool connect() { return connect(options_.connect_timeout); }

    /**
     * @brief Fetch the peer's tool catalog (never cached)
     *
     * On failure returns no tools and the error; the error is also logged.
     *
     * @param timeout Response bound; defaults to the first-run timeout for
     *        the first listing of a connection and the interactive one after
     */
    ToolListResult list_tools(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Invoke a tool; the result object is returned uninterpreted
     * @param name Tool name
     * @param arguments Argument object (null is sent as {})
     * @param timeout Response bound (ClientOptions::call_timeout if unset)
     */
    CallResult call_tool(const std::string& name,
                         const json& arguments,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Generic request/response round trip
     * @param params Request params; omitted from the envelope when null
     */
    CallResult request(const std::string& method, const json& params, std::chrono::milliseconds timeout);

    /**
     * @brief Send a notification; no response is awaited
     */
    bool notify(const std::string& method, const json& params = json());

    /**
     * @brief Liveness check via the MCP ping request
     */
    CallResult ping(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Tear down the peer; idempotent and never throws
     */
    void disconnect();

    ConnectionState state() const { return state_.load(); }
    bool is_connected() const { return state_.load() == ConnectionState::Ready; }

    std::optional<ClientError> last_error() const;
    std::optional<ServerInfo> server_info() const;

    /**
     * @brief Id of the most recent request on the current connection
     */
    int64_t last_request_id() const;

    const LaunchSpec& launch_spec() const { return spec_; }
    const ClientOptions& options() const { return options_; }

private:
    std::optional<ClientError> require_ready(const std::string& operation);

    CallResult round_trip(const std::string& method, const json& params, std::chrono::milliseconds timeout);
    CallResult await_response(int64_t id, const std::string& method, std::chrono::milliseconds timeout);

    /**
     * @brief Answer or log peer-initiated requests and notifications
     */
    void handle_peer_message(const json& message);

    void log_diagnostic();
    void log_diagnostic(std::chrono::milliseconds first_wait);
    bool fail_connect(ClientError error);
    void disconnect_locked();

    LaunchSpec spec_;
    ClientOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    TransportFactory factory_;

    std::unique_ptr<ITransport> transport_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    int64_t next_id_ = 0;
    bool tools_listed_ = false;
    std::optional<ClientError> last_error_;
    std::optional<ServerInfo> server_info_;

    mutable std::mutex mutex_;
};

/**
 * @brief Scoped release: disconnects the client when leaving scope
 */
class ConnectionGuard {
public:
    explicit ConnectionGuard(MCPClient& client) : client_(client) {}
    ~ConnectionGuard() { client_.disconnect(); }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    MCPClient& client_;
};

} // namespace mcp_stdio
