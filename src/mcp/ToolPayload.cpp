#include "ToolPayload.hpp"

namespace mcp_stdio {

std::optional<std::string> first_text(const json& result) {
    if (!result.is_object() || !result.contains("content")) {
        return std::nullopt;
    }

    const json& content = result["content"];
    if (!content.is_array() || content.empty()) {
        return std::nullopt;
    }

    const json& first = content[0];
    if (!first.is_object() || !first.contains("text") || !first["text"].is_string()) {
        return std::nullopt;
    }
    return first["text"].get<std::string>();
}

json decode_payload(const json& result) {
    auto text = first_text(result);
    if (!text) {
        return result;
    }

    json decoded = json::parse(*text, nullptr, false);
    if (decoded.is_discarded()) {
        return {{"text", *text}};
    }
    return decoded;
}

} // namespace mcp_stdio
