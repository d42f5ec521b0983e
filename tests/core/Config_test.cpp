#include <gtest/gtest.h>
#include "core/Config.hpp"
#include <filesystem>
#include <fstream>

using namespace mcp_stdio;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "mcp_stdio_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }
};

TEST_F(ConfigTest, ParsesServerEntries) {
    json j = {
        {"mcpServers", {
            {"git", {
                {"command", "uvx"},
                {"args", {"mcp-server-git"}}
            }},
            {"docs", {
                {"command", "/opt/docs-server"},
                {"args", {"--stdio", "--quiet"}},
                {"env", {{"FASTMCP_LOG_LEVEL", "ERROR"}}},
                {"clientName", "docs-reader"},
                {"timeouts", {{"connect", 100}, {"list_tools", 2.5}, {"call", 60}}}
            }}
        }}
    };

    Config config = Config::from_json(j);
    EXPECT_FALSE(config.empty());
    EXPECT_EQ(config.server_names(), (std::vector<std::string>{"docs", "git"}));

    const ServerProfile* git = config.server("git");
    ASSERT_NE(git, nullptr);
    EXPECT_EQ(git->launch.executable, "uvx");
    EXPECT_EQ(git->launch.arguments, std::vector<std::string>{"mcp-server-git"});
    EXPECT_TRUE(git->launch.environment.empty());
    EXPECT_EQ(git->client_name, "git-client");
    EXPECT_FALSE(git->connect_timeout.has_value());

    const ServerProfile* docs = config.server("docs");
    ASSERT_NE(docs, nullptr);
    EXPECT_EQ(docs->launch.arguments.size(), 2u);
    EXPECT_EQ(docs->launch.environment.at("FASTMCP_LOG_LEVEL"), "ERROR");
    EXPECT_EQ(docs->client_name, "docs-reader");
    EXPECT_EQ(docs->connect_timeout, std::chrono::milliseconds(100000));
    EXPECT_EQ(docs->list_tools_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(docs->call_timeout, std::chrono::milliseconds(60000));

    EXPECT_EQ(config.server("missing"), nullptr);
}

TEST_F(ConfigTest, MissingServersSectionIsEmpty) {
    Config config = Config::from_json(json::object());
    EXPECT_TRUE(config.empty());
}

TEST_F(ConfigTest, RejectsInvalidStructure) {
    EXPECT_THROW(Config::from_json(json::array()), ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", "git"}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"args", {"x"}}}}}}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"command", ""}}}}}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"command", "uvx"}, {"args", "oops"}}}}}}),
                 ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"command", "uvx"}, {"env", {{"A", 1}}}}}}}}),
                 ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"command", "uvx"},
                                                             {"timeouts", {{"call", -1}}}}}}}}),
                 ConfigError);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_file("servers.json", R"({
        "mcpServers": {
            "local": {"command": "./peer", "args": ["--mode", "normal"]}
        }
    })");

    Config config = Config::load(path.string());
    const ServerProfile* local = config.server("local");
    ASSERT_NE(local, nullptr);
    EXPECT_EQ(local->launch.describe(), "./peer --mode normal");
}

TEST_F(ConfigTest, LoadReportsMissingAndInvalidFiles) {
    EXPECT_THROW(Config::load((test_dir_ / "absent.json").string()), ConfigError);

    auto path = write_file("broken.json", "{ not json");
    EXPECT_THROW(Config::load(path.string()), ConfigError);
}

TEST_F(ConfigTest, FileEntriesWinOverDefaults) {
    Config config = Config::from_json({{"mcpServers", {{"git", {{"command", "/usr/local/bin/git-mcp"}}}}}});

    ServerProfile fallback_git;
    fallback_git.name = "git";
    fallback_git.launch.executable = "uvx";
    ServerProfile fallback_docs;
    fallback_docs.name = "aws-docs";
    fallback_docs.launch.executable = "uvx";

    config.add_defaults({fallback_git, fallback_docs});

    ASSERT_NE(config.server("git"), nullptr);
    EXPECT_EQ(config.server("git")->launch.executable, "/usr/local/bin/git-mcp");
    ASSERT_NE(config.server("aws-docs"), nullptr);
    EXPECT_EQ(config.server_names().size(), 2u);
}

TEST_F(ConfigTest, WrongFieldTypesAreConfigErrors) {
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"command", "uvx"}, {"clientName", 42}}}}}}),
                 ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"command", "uvx"},
                                                             {"timeouts", {{"connect", 1e300}}}}}}}}),
                 ConfigError);
    EXPECT_THROW(Config::from_json({{"mcpServers", {{"git", {{"command", "uvx"},
                                                             {"timeouts", {{"list_tools", "ten"}}}}}}}}),
                 ConfigError);
}
