#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_stdio {

using json = nlohmann::json;

/**
 * @brief Text of the first content item of a tools/call result
 * @return result.content[0].text, or std::nullopt if absent
 */
std::optional<std::string> first_text(const json& result);

/**
 * @brief Decode a tool payload carried as JSON text
 *
 * Tool results wrap their payload in content[0].text, which is often itself
 * JSON. Parses that text; non-JSON text becomes {"text": ...}. A result
 * without text content is returned unchanged.
 */
json decode_payload(const json& result);

} // namespace mcp_stdio
