#pragma once

#include "LaunchSpec.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_stdio {

using json = nlohmann::json;

/**
 * @brief Configuration file could not be read or is invalid
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One named peer: how to launch it and how long to wait on it
 *
 * Unset timeouts fall back to ClientOptions defaults.
 */
struct ServerProfile {
    std::string name;
    LaunchSpec launch;
    std::string client_name;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> list_tools_timeout;
    std::optional<std::chrono::milliseconds> call_timeout;
};

/**
 * @brief Named server profiles loaded from JSON
 *
 * File format:
 * {
 *   "mcpServers": {
 *     "git": {
 *       "command": "uvx",
 *       "args": ["mcp-server-git"],
 *       "env": {"KEY": "VALUE"},
 *       "timeouts": {"connect": 30, "list_tools": 10, "call": 30}
 *     }
 *   }
 * }
 * Timeouts are in seconds.
 */
class Config {
public:
    /**
     * @brief Parse configuration from JSON
     * @throws ConfigError on invalid structure
     */
    static Config from_json(const json& j);

    /**
     * @brief Load configuration from a file
     * @throws ConfigError if the file is missing or invalid
     */
    static Config load(const std::string& path);

    /**
     * @brief Add profiles not already present (file entries win)
     */
    void add_defaults(const std::vector<ServerProfile>& profiles);

    /**
     * @brief Look up a profile by name
     * @return nullptr if no such server
     */
    const ServerProfile* server(const std::string& name) const;

    std::vector<std::string> server_names() const;

    bool empty() const { return servers_.empty(); }

private:
    std::map<std::string, ServerProfile> servers_;
};

} // namespace mcp_stdio
