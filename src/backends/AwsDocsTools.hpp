#pragma once

#include "mcp/MCPClient.hpp"
#include <string>

namespace mcp_stdio {
namespace aws_docs {

/**
 * @brief Search the documentation index
 *
 * On success the result is the decoded payload (see decode_payload).
 *
 * @param extra Additional tool arguments merged into the call
 */
CallResult search(MCPClient& client, const std::string& search_phrase, const json& extra = json::object());

/**
 * @brief Read one documentation page; result is the page text as a string
 */
CallResult read(MCPClient& client, const std::string& url, const json& extra = json::object());

/**
 * @brief Related pages for a documentation URL, decoded
 */
CallResult recommend(MCPClient& client, const std::string& url);

} // namespace aws_docs
} // namespace mcp_stdio
