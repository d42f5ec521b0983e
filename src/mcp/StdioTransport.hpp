#pragma once

#include "ITransport.hpp"
#include "core/ChildProcess.hpp"
#include <memory>
#include <spdlog/logger.h>

namespace mcp_stdio {

/**
 * @brief Transport over a spawned child's standard streams
 *
 * Writes JSON messages line-by-line to the child's stdin and reads them
 * line-by-line from its stdout. The child's stderr is only used for
 * diagnostics. Owns the child: close() runs the EOF / SIGTERM / SIGKILL
 * shutdown sequence.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Spawn the peer described by spec
     * @param spec Launch specification
     * @param logger Logger for wire traces and shutdown events
     * @param policy Shutdown timing
     * @param error Receives the spawn diagnostic on failure (may be null)
     * @return Transport, or nullptr if the process could not be started
     */
    static std::unique_ptr<StdioTransport> launch(const LaunchSpec& spec,
                                                  std::shared_ptr<spdlog::logger> logger,
                                                  const ShutdownPolicy& policy,
                                                  std::string* error);

    /**
     * @brief Factory spawning a StdioTransport per connect
     */
    static TransportFactory factory(std::shared_ptr<spdlog::logger> logger,
                                    const ShutdownPolicy& policy);

    /**
     * @brief Restricts construction to launch()
     */
    class Token {
        friend class StdioTransport;
        Token() {}
    };

    StdioTransport(Token, std::shared_ptr<spdlog::logger> logger, const ShutdownPolicy& policy);
    ~StdioTransport() override;

    ReadResult read_message(std::chrono::milliseconds timeout) override;
    bool write_message(const json& message) override;
    std::optional<std::string> read_diagnostic(std::chrono::milliseconds timeout) override;
    bool is_open() const override;
    void close() override;
    void abort() override;

    pid_t pid() const { return process_.pid(); }

private:
    std::shared_ptr<spdlog::logger> logger_;
    ShutdownPolicy policy_;
    ChildProcess process_;
    std::string command_;
    bool output_closed_ = false;
};

} // namespace mcp_stdio
