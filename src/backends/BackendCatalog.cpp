#include "BackendCatalog.hpp"

namespace mcp_stdio {
namespace backends {

ServerProfile git() {
    ServerProfile profile;
    profile.name = "git";
    profile.launch.executable = "uvx";
    profile.launch.arguments = {"mcp-server-git"};
    profile.client_name = "git-client";
    profile.connect_timeout = std::chrono::seconds(30);
    return profile;
}

ServerProfile aws_docs() {
    ServerProfile profile;
    profile.name = "aws-docs";
    profile.launch.executable = "uvx";
    profile.launch.arguments = {"awslabs.aws-documentation-mcp-server@latest"};
    profile.launch.environment = {{"FASTMCP_LOG_LEVEL", "ERROR"}};
    profile.client_name = "aws-docs-client";
    profile.connect_timeout = std::chrono::seconds(100);
    return profile;
}

std::vector<ServerProfile> builtin() {
    return {git(), aws_docs()};
}

ClientOptions client_options(const ServerProfile& profile, ClientOptions defaults) {
    ClientOptions options = std::move(defaults);
    if (!profile.client_name.empty()) {
        options.client_info.name = profile.client_name;
    }
    if (profile.connect_timeout) {
        options.connect_timeout = *profile.connect_timeout;
    }
    if (profile.list_tools_timeout) {
        options.list_tools_timeout = *profile.list_tools_timeout;
    }
    if (profile.call_timeout) {
        options.call_timeout = *profile.call_timeout;
    }
    return options;
}

} // namespace backends
} // namespace mcp_stdio
