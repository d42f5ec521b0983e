#include "MCPClient.hpp"
#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mcp_stdio {

namespace {

constexpr size_t kMaxLoggedLine = 200;
constexpr size_t kMaxDiagnosticLines = 20;

std::string truncate_for_log(const std::string& text) {
    if (text.size() <= kMaxLoggedLine) {
        return text;
    }
    return text.substr(0, kMaxLoggedLine) + "...";
}

std::chrono::milliseconds time_left(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return remaining.count() < 0 ? std::chrono::milliseconds(0) : remaining;
}

} // namespace

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Ready:        return "Ready";
        case ConnectionState::ShuttingDown: return "ShuttingDown";
    }
    return "Unknown";
}

MCPClient::MCPClient(LaunchSpec spec,
                     ClientOptions options,
                     std::shared_ptr<spdlog::logger> logger,
                     TransportFactory factory)
    : spec_(std::move(spec)),
      options_(std::move(options)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      factory_(std::move(factory)) {
    if (spec_.executable.empty()) {
        throw std::invalid_argument("Launch spec executable cannot be empty");
    }
    if (!factory_) {
        factory_ = StdioTransport::factory(logger_, options_.shutdown);
    }
}

MCPClient::~MCPClient() {
    disconnect();
}

bool MCPClient::connect(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != ConnectionState::Disconnected) {
        logger_->error("connect() called while {}", to_string(state_.load()));
        return false;
    }

    state_ = ConnectionState::Connecting;
    last_error_.reset();
    server_info_.reset();
    next_id_ = 0;
    tools_listed_ = false;

    logger_->info("Starting {} MCP server: {}", options_.client_info.name, spec_.describe());

    std::string spawn_error;
    try {
        transport_ = factory_(spec_, &spawn_error);
    } catch (const std::exception& e) {
        spawn_error = e.what();
        transport_.reset();
    }
    if (!transport_) {
        return fail_connect({ErrorKind::SpawnFailed, 0, spawn_error, json()});
    }

    logger_->info("MCP server process started, initializing...");

    json params = {
        {"protocolVersion", protocol::kProtocolVersion},
        {"capabilities", {
            {"roots", {{"listChanged", true}}}
        }},
        {"clientInfo", {
            {"name", options_.client_info.name},
            {"version", options_.client_info.version}
        }}
    };

    CallResult response = round_trip(protocol::kInitialize, params, timeout);
    if (!response.ok()) {
        ClientError error = *response.error;
        if (error.kind == ErrorKind::RequestTimeout) {
            error.kind = ErrorKind::HandshakeTimeout;
            error.message = "no initialize response within " + std::to_string(timeout.count()) + " ms";
        } else if (error.kind == ErrorKind::RemoteError) {
            error.kind = ErrorKind::HandshakeRejected;
            error.message = "initialize rejected (" + std::to_string(error.code) + "): " + error.message;
        }
        return fail_connect(std::move(error));
    }

    const json& result = response.result;
    if (!result.is_object() || !result.contains("protocolVersion") || !result["protocolVersion"].is_string()) {
        return fail_connect({ErrorKind::HandshakeRejected, 0,
                             "initialize result missing protocolVersion: " + truncate_for_log(result.dump()),
                             json()});
    }

    ServerInfo info;
    info.protocol_version = result["protocolVersion"].get<std::string>();
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        info.name = result["serverInfo"].value("name", "unknown");
        info.version = result["serverInfo"].value("version", "unknown");
    }
    if (result.contains("capabilities") && result["capabilities"].is_object()) {
        info.capabilities = result["capabilities"];
    }
    if (result.contains("instructions") && result["instructions"].is_string()) {
        info.instructions = result["instructions"].get<std::string>();
    }

    if (info.protocol_version != protocol::kProtocolVersion) {
        logger_->warn("Server negotiated protocol version {} (requested {})",
                      info.protocol_version, protocol::kProtocolVersion);
    }

    if (!transport_->write_message(make_notification(protocol::kInitialized))) {
        return fail_connect({ErrorKind::PeerExited, 0, "failed to send initialized notification", json()});
    }

    logger_->info("Successfully connected to {} {} (protocol {})", info.name, info.version, info.protocol_version);
    server_info_ = std::move(info);
    state_ = ConnectionState::Ready;
    return true;
}

ToolListResult MCPClient::list_tools(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto error = require_ready("tools/list")) {
        return {{}, error};
    }

    auto wait = timeout.value_or(tools_listed_ ? options_.list_tools_timeout
                                               : options_.first_list_tools_timeout);
    tools_listed_ = true;

    CallResult response = round_trip(protocol::kToolsList, json(), wait);
    if (!response.ok()) {
        logger_->error("Failed to list tools: {}", response.error->describe());
        return {{}, response.error};
    }

    auto tools = parse_tool_list(response.result);
    if (!tools) {
        logger_->warn("tools/list result has no tools array: {}", truncate_for_log(response.result.dump()));
        return {{}, std::nullopt};
    }

    logger_->debug("Peer advertised {} tools", tools->size());
    return {std::move(*tools), std::nullopt};
}

CallResult MCPClient::call_tool(const std::string& name,
                                const json& arguments,
                                std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto error = require_ready("tools/call")) {
        return {json(), error};
    }

    json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    };

    logger_->debug("Calling tool: {} with args: {}", name, params["arguments"].dump());

    CallResult response = round_trip(protocol::kToolsCall, params, timeout.value_or(options_.call_timeout));
    if (!response.ok()) {
        logger_->error("Failed to call tool {}: {}", name, response.error->describe());
    }
    return response;
}

CallResult MCPClient::request(const std::string& method, const json& params, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto error = require_ready(method)) {
        return {json(), error};
    }
    return round_trip(method, params, timeout);
}

bool MCPClient::notify(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto error = require_ready(method)) {
        return false;
    }
    if (!transport_->write_message(make_notification(method, params))) {
        last_error_ = ClientError{ErrorKind::PeerExited, 0, "failed to send " + method, json()};
        disconnect_locked();
        return false;
    }
    return true;
}

CallResult MCPClient::ping(std::optional<std::chrono::milliseconds> timeout) {
    return request(protocol::kPing, json(), timeout.value_or(options_.list_tools_timeout));
}

void MCPClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked();
}

std::optional<ClientError> MCPClient::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::optional<ServerInfo> MCPClient::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

int64_t MCPClient::last_request_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_;
}

std::optional<ClientError> MCPClient::require_ready(const std::string& operation) {
    if (state_ == ConnectionState::Ready && transport_) {
        return std::nullopt;
    }

    ClientError error{ErrorKind::NotConnected, 0,
                      operation + " requires a ready connection (state: " + to_string(state_.load()) + ")",
                      json()};
    logger_->error("{}", error.describe());
    last_error_ = error;
    return error;
}

CallResult MCPClient::round_trip(const std::string& method,
                                 const json& params,
                                 std::chrono::milliseconds timeout) {
    int64_t id = ++next_id_;

    if (!transport_->write_message(make_request(id, method, params))) {
        ClientError error{ErrorKind::PeerExited, 0, "failed to send " + method + " request", json()};
        last_error_ = error;
        if (state_ == ConnectionState::Ready) {
            disconnect_locked();
        }
        return {json(), error};
    }

    CallResult response = await_response(id, method, timeout);
    if (!response.ok()) {
        last_error_ = response.error;
        if (response.error->kind == ErrorKind::PeerExited && state_ == ConnectionState::Ready) {
            logger_->error("Peer exited during {}, disconnecting", method);
            disconnect_locked();
        }
    }
    return response;
}

CallResult MCPClient::await_response(int64_t id, const std::string& method, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;

    const auto deadline = clock::now() + timeout;
    bool saw_malformed = false;

    while (true) {
        ReadResult read = transport_->read_message(time_left(deadline));

        switch (read.status) {
            case ReadStatus::Message: {
                if (!is_response(read.message)) {
                    handle_peer_message(read.message);
                    break;
                }

                auto response = parse_response(read.message);
                if (!response) {
                    ClientError malformed{ErrorKind::MalformedResponse, 0,
                                          "invalid response envelope: " + truncate_for_log(read.message.dump()),
                                          json()};
                    logger_->error("{}", malformed.describe());
                    saw_malformed = true;
                    log_diagnostic(std::min(options_.diagnostic_timeout, time_left(deadline)));
                    break;
                }

                if (response->id != id) {
                    logger_->warn("Discarding stale response id {} while waiting for {} (id {})",
                                  response->id, method, id);
                    break;
                }

                if (response->is_error()) {
                    return {json(), ClientError::remote(*response->error)};
                }
                return {std::move(*response->result), std::nullopt};
            }

            case ReadStatus::Empty:
                break;

            case ReadStatus::Malformed: {
                ClientError malformed{ErrorKind::MalformedResponse, 0,
                                      "unparseable line: " + truncate_for_log(read.raw), json()};
                logger_->error("{}", malformed.describe());
                saw_malformed = true;
                log_diagnostic(std::min(options_.diagnostic_timeout, time_left(deadline)));
                break;
            }

            case ReadStatus::Timeout: {
                std::string message = method + " response timed out after " +
                                      std::to_string(timeout.count()) + " ms";
                if (saw_malformed) {
                    message += " (malformed output discarded)";
                }
                logger_->error("{}", message);
                log_diagnostic();
                return {json(), ClientError{ErrorKind::RequestTimeout, 0, message, json()}};
            }

            case ReadStatus::Closed:
                log_diagnostic();
                return {json(), ClientError{ErrorKind::PeerExited, 0,
                                            "peer closed its output while waiting for " + method, json()}};

            case ReadStatus::Interrupted:
                return {json(), ClientError{ErrorKind::Interrupted, 0,
                                            "interrupted while waiting for " + method, json()}};
        }

        if (clock::now() >= deadline) {
            std::string message = method + " response timed out after " + std::to_string(timeout.count()) + " ms";
            logger_->error("{}", message);
            return {json(), ClientError{ErrorKind::RequestTimeout, 0, message, json()}};
        }
    }
}

void MCPClient::handle_peer_message(const json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        logger_->warn("Discarding unexpected message: {}", truncate_for_log(message.dump()));
        return;
    }

    std::string method = message["method"];

    if (!message.contains("id")) {
        logger_->debug("Peer notification: {}", method);
        return;
    }

    const json& id = message["id"];
    json reply;
    if (method == protocol::kPing) {
        reply = make_result_response(id, json::object());
    } else if (method == protocol::kRootsList) {
        reply = make_result_response(id, {{"roots", options_.roots}});
    } else {
        logger_->debug("Rejecting peer request: {}", method);
        reply = make_error_response(id, protocol::kMethodNotFound, "Method not found: " + method);
    }

    if (!transport_->write_message(reply)) {
        logger_->warn("Failed to answer peer request {}", method);
    }
}

void MCPClient::log_diagnostic() {
    log_diagnostic(options_.diagnostic_timeout);
}

void MCPClient::log_diagnostic(std::chrono::milliseconds first_wait) {
    if (!transport_) {
        return;
    }
    // Only the first line may wait; the rest are logged if already buffered
    auto wait = first_wait;
    for (size_t i = 0; i < kMaxDiagnosticLines; i++) {
        auto line = transport_->read_diagnostic(wait);
        if (!line) {
            break;
        }
        logger_->error("Server stderr: {}", *line);
        wait = std::chrono::milliseconds(0);
    }
}

bool MCPClient::fail_connect(ClientError error) {
    logger_->error("Failed to connect to MCP server: {}", error.describe());
    last_error_ = std::move(error);
    disconnect_locked();
    return false;
}

void MCPClient::disconnect_locked() {
    if (!transport_) {
        state_ = ConnectionState::Disconnected;
        return;
    }

    state_ = ConnectionState::ShuttingDown;

    try {
        transport_->close();
    } catch (const std::exception& e) {
        logger_->error("Error during disconnect: {}", e.what());
        try {
            transport_->abort();
        } catch (const std::exception& kill_error) {
            logger_->error("Forced kill failed: {}", kill_error.what());
        }
    }

    transport_.reset();
    state_ = ConnectionState::Disconnected;
    logger_->info("Disconnected from {} MCP server", options_.client_info.name);
}

} // namespace mcp_stdio
