#pragma once

#include <map>
#include <string>
#include <vector>

namespace mcp_stdio {

/**
 * @brief Identifies the peer process to spawn
 *
 * Environment entries override (or extend) the environment inherited
 * from the hosting program. A bare executable name is searched on the
 * PATH of that merged environment.
 */
struct LaunchSpec {
    std::string executable;
    std::vector<std::string> arguments;
    std::map<std::string, std::string> environment;

    /**
     * @brief Render as a single command line for diagnostics
     */
    std::string describe() const {
        std::string line = executable;
        for (const auto& arg : arguments) {
            line += ' ';
            line += arg;
        }
        return line;
    }
};

/**
 * @brief Static client identity announced during the handshake
 */
struct ClientInfo {
    std::string name = "mcp-stdio-client";
    std::string version = "1.0.0";
};

} // namespace mcp_stdio
