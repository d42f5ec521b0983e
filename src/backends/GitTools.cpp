#include "GitTools.hpp"

namespace mcp_stdio {
namespace git {

namespace {

CallResult call(MCPClient& client, const std::string& tool, json args,
                const std::optional<std::string>& repo_path) {
    if (repo_path) {
        args["repo_path"] = *repo_path;
    }
    return client.call_tool(tool, args);
}

} // namespace

CallResult status(MCPClient& client, const std::optional<std::string>& repo_path) {
    return call(client, "git_status", json::object(), repo_path);
}

CallResult log(MCPClient& client, int max_count, const std::optional<std::string>& repo_path) {
    return call(client, "git_log", {{"max_count", max_count}}, repo_path);
}

CallResult diff(MCPClient& client, bool cached, const std::optional<std::string>& repo_path) {
    return call(client, "git_diff", {{"cached", cached}}, repo_path);
}

CallResult commit(MCPClient& client, const std::string& message, const std::optional<std::string>& repo_path) {
    return call(client, "git_commit", {{"message", message}}, repo_path);
}

CallResult add(MCPClient& client, const std::vector<std::string>& files,
               const std::optional<std::string>& repo_path) {
    return call(client, "git_add", {{"files", files}}, repo_path);
}

} // namespace git
} // namespace mcp_stdio
