#include "backends/AwsDocsTools.hpp"
#include "backends/BackendCatalog.hpp"
#include "backends/GitTools.hpp"
#include "core/Config.hpp"
#include "core/Logging.hpp"
#include "core/SignalGuard.hpp"
#include "mcp/MCPClient.hpp"
#include "mcp/ToolPayload.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <optional>

using namespace mcp_stdio;

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
}

int failure_exit_code() {
    if (SignalGuard::requested()) {
        return 128 + SignalGuard::last_signal();
    }
    return 1;
}

int print_result(const CallResult& response) {
    if (!response.ok()) {
        std::cerr << "Error: " << response.error->describe() << std::endl;
        return failure_exit_code();
    }

    if (response.result.is_string()) {
        std::cout << response.result.get<std::string>() << std::endl;
    } else {
        std::cout << response.result.dump(2) << std::endl;
    }
    return 0;
}

int print_tools(MCPClient& client) {
    ToolListResult listing = client.list_tools();
    if (!listing.ok()) {
        std::cerr << "Error: " << listing.error->describe() << std::endl;
        return failure_exit_code();
    }

    if (listing.tools.empty()) {
        std::cout << "No tools advertised" << std::endl;
        return 0;
    }

    std::cout << "Available tools:" << std::endl;
    for (const auto& tool : listing.tools) {
        std::cout << "- " << tool.name << std::endl;
        std::cout << "  Description: " << tool.description << std::endl;
    }
    return 0;
}

bool parse_env_override(const std::string& entry, LaunchSpec& spec) {
    auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    spec.environment[entry.substr(0, eq)] = entry.substr(eq + 1);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"MCP stdio client - talk to tool servers over JSON-RPC"};

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)")
        ->default_val("warn");

    std::string server_name = "git";
    app.add_option("-s,--server", server_name, "Named server from the config or built-ins (git, aws-docs)")
        ->default_val("git");

    std::string config_path;
    app.add_option("-c,--config", config_path, "JSON config file with an mcpServers section");

    std::string command;
    app.add_option("--command", command, "Launch an ad-hoc server executable instead of a named one");

    std::vector<std::string> command_args;
    app.add_option("--arg", command_args, "Argument for --command (repeatable)")->allow_extra_args(false);

    std::vector<std::string> env_overrides;
    app.add_option("--env", env_overrides, "Environment override KEY=VALUE (repeatable)")->allow_extra_args(false);

    double connect_timeout = 0;
    app.add_option("--connect-timeout", connect_timeout, "Handshake timeout in seconds");

    double timeout = 0;
    app.add_option("-t,--timeout", timeout, "Request timeout in seconds");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    auto* tools_cmd = app.add_subcommand("tools", "List the tools the server advertises");

    auto* call_cmd = app.add_subcommand("call", "Call a tool");
    std::string tool_name;
    std::string tool_arguments = "{}";
    bool raw = false;
    call_cmd->add_option("name", tool_name, "Tool name")->required();
    call_cmd->add_option("-a,--arguments", tool_arguments, "Tool arguments as a JSON object");
    call_cmd->add_flag("--raw", raw, "Print the result envelope without decoding the payload");

    auto* ping_cmd = app.add_subcommand("ping", "Check that the server responds");

    auto* search_cmd = app.add_subcommand("search", "Search documentation (aws-docs)");
    std::string search_phrase;
    std::string service;
    search_cmd->add_option("query", search_phrase, "Search query")->required();
    search_cmd->add_option("--service", service, "Restrict to one product type");

    auto* read_cmd = app.add_subcommand("read", "Read a documentation page (aws-docs)");
    std::string read_url;
    read_cmd->add_option("url", read_url, "Page URL")->required();

    auto* recommend_cmd = app.add_subcommand("recommend", "Related documentation pages (aws-docs)");
    std::string recommend_url;
    recommend_cmd->add_option("url", recommend_url, "Page URL")->required();

    std::string repo_path;
    auto* git_status_cmd = app.add_subcommand("git-status", "Show working tree status (git)");
    git_status_cmd->add_option("--repo", repo_path, "Repository path");

    int max_count = 10;
    auto* git_log_cmd = app.add_subcommand("git-log", "Show commit history (git)");
    git_log_cmd->add_option("--repo", repo_path, "Repository path");
    git_log_cmd->add_option("-n,--max-count", max_count, "Number of commits")->default_val(10);

    app.require_subcommand(0, 1);

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcp-stdio version 1.0.0" << std::endl;
        return 0;
    }

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
        return 0;
    }

    auto level = parse_log_level(log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }
    auto logger = make_logger("mcp-stdio", *level);

    SignalGuard::install();

    try {
        ServerProfile profile;
        if (!command.empty()) {
            profile.name = command;
            profile.client_name = "mcp-stdio-cli";
            profile.launch.executable = command;
            profile.launch.arguments = command_args;
        } else {
            Config config;
            if (!config_path.empty()) {
                config = Config::load(config_path);
            }
            config.add_defaults(backends::builtin());

            const ServerProfile* found = config.server(server_name);
            if (!found) {
                std::cerr << "Unknown server '" << server_name << "'. Known servers:";
                for (const auto& name : config.server_names()) {
                    std::cerr << " " << name;
                }
                std::cerr << std::endl;
                return 1;
            }
            profile = *found;
        }

        for (const auto& entry : env_overrides) {
            if (!parse_env_override(entry, profile.launch)) {
                std::cerr << "Invalid --env value (expected KEY=VALUE): " << entry << std::endl;
                return 1;
            }
        }

        ClientOptions options = backends::client_options(profile);
        if (connect_timeout > 0) {
            options.connect_timeout = seconds_to_ms(connect_timeout);
        }
        if (timeout > 0) {
            options.list_tools_timeout = seconds_to_ms(timeout);
            options.first_list_tools_timeout = seconds_to_ms(timeout);
            options.call_timeout = seconds_to_ms(timeout);
        }

        MCPClient client(profile.launch, options, logger);
        ConnectionGuard guard(client);

        logger->info("Connecting to '{}'", profile.name);
        if (!client.connect()) {
            auto error = client.last_error();
            std::cerr << "Failed to connect to '" << profile.name << "': "
                      << (error ? error->describe() : std::string("unknown error")) << std::endl;
            return failure_exit_code();
        }

        std::optional<std::string> repo;
        if (!repo_path.empty()) {
            repo = repo_path;
        }

        if (*tools_cmd) {
            return print_tools(client);
        }
        if (*call_cmd) {
            json arguments = json::parse(tool_arguments, nullptr, false);
            if (arguments.is_discarded() || !arguments.is_object()) {
                std::cerr << "--arguments must be a JSON object" << std::endl;
                return 1;
            }
            CallResult response = client.call_tool(tool_name, arguments);
            if (response.ok() && !raw) {
                response.result = decode_payload(response.result);
            }
            return print_result(response);
        }
        if (*ping_cmd) {
            return print_result(client.ping());
        }
        if (*search_cmd) {
            json extra = json::object();
            if (!service.empty()) {
                extra["product_types"] = json::array({service});
            }
            return print_result(aws_docs::search(client, search_phrase, extra));
        }
        if (*read_cmd) {
            return print_result(aws_docs::read(client, read_url));
        }
        if (*recommend_cmd) {
            return print_result(aws_docs::recommend(client, recommend_url));
        }
        if (*git_status_cmd) {
            return print_result(git::status(client, repo));
        }
        if (*git_log_cmd) {
            return print_result(git::log(client, max_count, repo));
        }
        return 0;

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        logger->critical("Fatal error: {}", e.what());
        return 1;
    }
}
