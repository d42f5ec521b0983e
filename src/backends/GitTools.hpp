#pragma once

#include "mcp/MCPClient.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mcp_stdio {
namespace git {

/**
 * Typed wrappers for the tools of a git MCP server.
 *
 * Each call forwards to MCPClient::call_tool with a fixed tool name;
 * repo_path is only sent when given. Results are returned uninterpreted.
 */

CallResult status(MCPClient& client, const std::optional<std::string>& repo_path = std::nullopt);

CallResult log(MCPClient& client, int max_count = 10,
               const std::optional<std::string>& repo_path = std::nullopt);

CallResult diff(MCPClient& client, bool cached = false,
                const std::optional<std::string>& repo_path = std::nullopt);

CallResult commit(MCPClient& client, const std::string& message,
                  const std::optional<std::string>& repo_path = std::nullopt);

CallResult add(MCPClient& client, const std::vector<std::string>& files,
               const std::optional<std::string>& repo_path = std::nullopt);

} // namespace git
} // namespace mcp_stdio
