#include "MockTransport.hpp"
#include <stdexcept>

namespace mcp_stdio {

MockTransport::MockTransport(std::shared_ptr<Record> record, Responder responder)
    : record_(std::move(record)), responder_(std::move(responder)) {}

ReadResult MockTransport::read_message(std::chrono::milliseconds) {
    if (reads_.empty()) {
        if (output_closed_) {
            return {ReadStatus::Closed, json(), {}};
        }
        return {ReadStatus::Timeout, json(), {}};
    }

    ReadResult result = reads_.front();
    reads_.pop_front();
    return result;
}

bool MockTransport::write_message(const json& message) {
    if (!open_ || fail_writes_) {
        return false;
    }

    record_->written.push_back(message);
    if (responder_) {
        responder_(message, *this);
    }
    return true;
}

std::optional<std::string> MockTransport::read_diagnostic(std::chrono::milliseconds timeout) {
    record_->diagnostic_reads++;
    record_->diagnostic_waits.push_back(timeout);
    if (diagnostics_.empty()) {
        return std::nullopt;
    }

    std::string line = diagnostics_.front();
    diagnostics_.pop_front();
    return line;
}

bool MockTransport::is_open() const {
    return open_;
}

void MockTransport::close() {
    record_->close_calls++;
    if (record_->throw_on_close) {
        throw std::runtime_error("close failed");
    }
    open_ = false;
}

void MockTransport::abort() {
    record_->abort_calls++;
    open_ = false;
}

void MockTransport::push_line(const std::string& line) {
    if (line.find_first_not_of(" \t") == std::string::npos) {
        reads_.push_back({ReadStatus::Empty, json(), {}});
        return;
    }

    json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        reads_.push_back({ReadStatus::Malformed, json(), line});
    } else {
        reads_.push_back({ReadStatus::Message, message, {}});
    }
}

void MockTransport::push_message(const json& message) {
    reads_.push_back({ReadStatus::Message, message, {}});
}

void MockTransport::push_diagnostic(const std::string& line) {
    diagnostics_.push_back(line);
}

void MockTransport::close_output() {
    output_closed_ = true;
}

} // namespace mcp_stdio
