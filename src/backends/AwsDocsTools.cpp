#include "AwsDocsTools.hpp"
#include "mcp/ToolPayload.hpp"

namespace mcp_stdio {
namespace aws_docs {

namespace {

json merge(json args, const json& extra) {
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            args[it.key()] = it.value();
        }
    }
    return args;
}

} // namespace

CallResult search(MCPClient& client, const std::string& search_phrase, const json& extra) {
    CallResult response = client.call_tool("search_documentation",
                                           merge({{"search_phrase", search_phrase}}, extra));
    if (response.ok()) {
        response.result = decode_payload(response.result);
    }
    return response;
}

CallResult read(MCPClient& client, const std::string& url, const json& extra) {
    CallResult response = client.call_tool("read_documentation", merge({{"url", url}}, extra));
    if (response.ok()) {
        auto text = first_text(response.result);
        response.result = text ? json(*text) : json("");
    }
    return response;
}

CallResult recommend(MCPClient& client, const std::string& url) {
    CallResult response = client.call_tool("recommend", {{"url", url}});
    if (response.ok()) {
        response.result = decode_payload(response.result);
    }
    return response;
}

} // namespace aws_docs
} // namespace mcp_stdio
