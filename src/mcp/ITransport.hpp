#pragma once

#include "core/LaunchSpec.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_stdio {

using json = nlohmann::json;

/**
 * @brief Outcome of a single read attempt on a transport
 */
enum class ReadStatus {
    Message,     // one well-formed JSON value was read
    Empty,       // blank line, no data this cycle
    Malformed,   // a line arrived but was not valid JSON
    Timeout,     // nothing arrived within the timeout
    Closed,      // peer closed its output (usually exited)
    Interrupted  // wait cut short by SIGINT/SIGTERM
};

struct ReadResult {
    ReadStatus status;
    json message;     // set when status == Message
    std::string raw;  // offending line when status == Malformed
};

/**
 * @brief Abstract interface for the client side of an MCP transport
 *
 * Implementations carry newline-delimited JSON-RPC messages to and from a
 * peer and own the peer's lifetime.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message, waiting at most timeout
     */
    virtual ReadResult read_message(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Write one JSON-RPC message as a single flushed line
     * @return false if the peer can no longer receive
     */
    virtual bool write_message(const json& message) = 0;

    /**
     * @brief Best-effort read of one diagnostic line from the peer
     */
    virtual std::optional<std::string> read_diagnostic(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Check if transport is still open
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Graceful shutdown of the peer; idempotent
     */
    virtual void close() = 0;

    /**
     * @brief Immediate forced shutdown; used when close() itself failed
     */
    virtual void abort() = 0;
};

/**
 * @brief Creates a connected transport for a launch spec
 *
 * Returns nullptr and fills error when the peer cannot be started.
 */
using TransportFactory =
    std::function<std::unique_ptr<ITransport>(const LaunchSpec& spec, std::string* error)>;

} // namespace mcp_stdio
