#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcp_stdio {

StdioTransport::StdioTransport(Token, std::shared_ptr<spdlog::logger> logger, const ShutdownPolicy& policy)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()), policy_(policy) {}

std::unique_ptr<StdioTransport> StdioTransport::launch(const LaunchSpec& spec,
                                                       std::shared_ptr<spdlog::logger> logger,
                                                       const ShutdownPolicy& policy,
                                                       std::string* error) {
    auto transport = std::make_unique<StdioTransport>(Token{}, std::move(logger), policy);
    if (!transport->process_.spawn(spec, error)) {
        return nullptr;
    }

    transport->command_ = spec.describe();
    transport->logger_->debug("Spawned '{}' (pid {})", transport->command_, transport->process_.pid());
    return transport;
}

TransportFactory StdioTransport::factory(std::shared_ptr<spdlog::logger> logger,
                                         const ShutdownPolicy& policy) {
    return [logger, policy](const LaunchSpec& spec, std::string* error) -> std::unique_ptr<ITransport> {
        return launch(spec, logger, policy, error);
    };
}

StdioTransport::~StdioTransport() {
    // ChildProcess reaps on destruction; close() is the graceful path
    if (process_.is_spawned()) {
        logger_->debug("StdioTransport destroyed with live process, forcing shutdown");
    }
}

ReadResult StdioTransport::read_message(std::chrono::milliseconds timeout) {
    auto read = process_.read_line(ChildProcess::Stream::Output, timeout);

    switch (read.status) {
        case ChildProcess::LineStatus::Timeout:
            return {ReadStatus::Timeout, json(), {}};
        case ChildProcess::LineStatus::Interrupted:
            return {ReadStatus::Interrupted, json(), {}};
        case ChildProcess::LineStatus::Eof:
            logger_->debug("Reached end of peer output stream");
            output_closed_ = true;
            return {ReadStatus::Closed, json(), {}};
        case ChildProcess::LineStatus::Error:
            logger_->error("Error reading from peer output: {}", read.text);
            output_closed_ = true;
            return {ReadStatus::Closed, json(), {}};
        case ChildProcess::LineStatus::Line:
            break;
    }

    const std::string& line = read.text;
    if (line.find_first_not_of(" \t") == std::string::npos) {
        logger_->debug("Read empty line, treating as no message");
        return {ReadStatus::Empty, json(), {}};
    }

    try {
        json message = json::parse(line);
        logger_->trace("<- {}", line);
        return {ReadStatus::Message, std::move(message), {}};
    } catch (const json::parse_error& e) {
        logger_->error("JSON parse error: {}", e.what());
        return {ReadStatus::Malformed, json(), line};
    }
}

bool StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    if (!process_.write_line(serialized)) {
        logger_->error("Failed to write to peer stdin");
        return false;
    }
    logger_->trace("-> {}", serialized);
    return true;
}

std::optional<std::string> StdioTransport::read_diagnostic(std::chrono::milliseconds timeout) {
    auto read = process_.read_line(ChildProcess::Stream::Error, timeout);
    if (read.status == ChildProcess::LineStatus::Line && !read.text.empty()) {
        return read.text;
    }
    return std::nullopt;
}

bool StdioTransport::is_open() const {
    return process_.is_spawned() && !output_closed_;
}

void StdioTransport::close() {
    if (!process_.is_spawned()) {
        return;
    }

    auto report = process_.shutdown(policy_);
    if (report.path == ChildProcess::ExitPath::Killed) {
        logger_->warn("Process '{}' didn't terminate gracefully, killed forcefully", command_);
    } else {
        logger_->info("Process '{}' {} ({})", command_, ChildProcess::to_string(report.path),
                      ChildProcess::describe_status(report.exit_status));
    }
}

void StdioTransport::abort() {
    if (!process_.is_spawned()) {
        return;
    }
    process_.kill_and_reap();
    process_.shutdown(policy_);
    logger_->warn("Process '{}' aborted", command_);
}

} // namespace mcp_stdio
