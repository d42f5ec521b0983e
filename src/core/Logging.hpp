#pragma once

#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace mcp_stdio {

/**
 * @brief Map a level name (trace, debug, info, warn, error, critical, off)
 * @return std::nullopt for unknown names
 */
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Create a logger writing to stderr
 *
 * stdout stays reserved for command output.
 */
std::shared_ptr<spdlog::logger> make_logger(const std::string& name, spdlog::level::level_enum level);

} // namespace mcp_stdio
