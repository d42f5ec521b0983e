#include "Config.hpp"
#include <fstream>

namespace mcp_stdio {

namespace {

// One year; keeps the millisecond conversion far from int64_t overflow
constexpr double kMaxTimeoutSeconds = 365.0 * 24 * 60 * 60;

std::optional<std::chrono::milliseconds> read_seconds(const json& timeouts, const char* key,
                                                      const std::string& server) {
    if (!timeouts.contains(key)) {
        return std::nullopt;
    }
    const json& value = timeouts[key];
    if (!value.is_number() || value.get<double>() <= 0) {
        throw ConfigError("Server '" + server + "': timeout '" + key + "' must be a positive number");
    }
    double seconds = value.get<double>();
    if (seconds > kMaxTimeoutSeconds) {
        throw ConfigError("Server '" + server + "': timeout '" + key + "' is out of range");
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
}

ServerProfile parse_server(const std::string& name, const json& entry) {
    if (!entry.is_object()) {
        throw ConfigError("Server '" + name + "' must be an object");
    }
    if (!entry.contains("command") || !entry["command"].is_string() ||
        entry["command"].get<std::string>().empty()) {
        throw ConfigError("Server '" + name + "' is missing required field: command");
    }

    ServerProfile profile;
    profile.name = name;
    profile.launch.executable = entry["command"].get<std::string>();

    try {
        profile.client_name = entry.value("clientName", name + "-client");
        if (entry.contains("args")) {
            profile.launch.arguments = entry["args"].get<std::vector<std::string>>();
        }
        if (entry.contains("env")) {
            profile.launch.environment = entry["env"].get<std::map<std::string, std::string>>();
        }
    } catch (const json::exception& e) {
        throw ConfigError("Server '" + name + "': " + e.what());
    }

    if (entry.contains("timeouts")) {
        const json& timeouts = entry["timeouts"];
        if (!timeouts.is_object()) {
            throw ConfigError("Server '" + name + "': timeouts must be an object");
        }
        profile.connect_timeout = read_seconds(timeouts, "connect", name);
        profile.list_tools_timeout = read_seconds(timeouts, "list_tools", name);
        profile.call_timeout = read_seconds(timeouts, "call", name);
    }

    return profile;
}

} // namespace

Config Config::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    Config config;
    if (!j.contains("mcpServers")) {
        return config;
    }

    const json& servers = j["mcpServers"];
    if (!servers.is_object()) {
        throw ConfigError("mcpServers must be an object");
    }

    for (auto it = servers.begin(); it != servers.end(); ++it) {
        config.servers_[it.key()] = parse_server(it.key(), it.value());
    }
    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }

    try {
        return from_json(json::parse(file));
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }
}

void Config::add_defaults(const std::vector<ServerProfile>& profiles) {
    for (const auto& profile : profiles) {
        servers_.emplace(profile.name, profile);
    }
}

const ServerProfile* Config::server(const std::string& name) const {
    auto it = servers_.find(name);
    return it == servers_.end() ? nullptr : &it->second;
}

std::vector<std::string> Config::server_names() const {
    std::vector<std::string> names;
    for (const auto& [name, profile] : servers_) {
        names.push_back(name);
    }
    return names;
}

} // namespace mcp_stdio
