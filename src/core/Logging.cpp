#include "Logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mcp_stdio {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    } else if (name == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(level);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

} // namespace mcp_stdio
