#pragma once

#include "core/Config.hpp"
#include "mcp/MCPClient.hpp"
#include <vector>

namespace mcp_stdio {
namespace backends {

/**
 * @brief git tools via `uvx mcp-server-git`
 */
ServerProfile git();

/**
 * @brief AWS documentation via `uvx awslabs.aws-documentation-mcp-server@latest`
 *
 * Uses a long connect timeout: the first launch downloads the server.
 */
ServerProfile aws_docs();

/**
 * @brief All built-in profiles
 */
std::vector<ServerProfile> builtin();

/**
 * @brief Client options for a profile, on top of the given defaults
 */
ClientOptions client_options(const ServerProfile& profile, ClientOptions defaults = {});

} // namespace backends
} // namespace mcp_stdio
