#include "mcp/Protocol.hpp"
#include <gtest/gtest.h>

using namespace mcp_stdio;
using json = nlohmann::json;

TEST(ProtocolTest, RequestEnvelope) {
    json request = make_request(3, "tools/call", {{"name", "git_status"}});
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(request["id"], 3);
    EXPECT_EQ(request["method"], "tools/call");
    EXPECT_EQ(request["params"]["name"], "git_status");
}

TEST(ProtocolTest, NullParamsAreOmitted) {
    json request = make_request(1, "tools/list");
    EXPECT_FALSE(request.contains("params"));

    json notification = make_notification("notifications/initialized");
    EXPECT_FALSE(notification.contains("params"));
    EXPECT_FALSE(notification.contains("id"));
    EXPECT_EQ(notification["jsonrpc"], "2.0");
}

TEST(ProtocolTest, EnvelopeSerialisesToSingleLine) {
    json request = make_request(1, "tools/call", {{"arguments", {{"text", "line one\nline two"}}}});
    std::string serialized = request.dump();
    EXPECT_EQ(serialized.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(serialized), request);
}

TEST(ProtocolTest, ParseResultResponse) {
    auto response = parse_response({{"jsonrpc", "2.0"}, {"id", 4}, {"result", {{"tools", json::array()}}}});
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->id, 4);
    EXPECT_FALSE(response->is_error());
    ASSERT_TRUE(response->result.has_value());
    EXPECT_TRUE((*response->result)["tools"].is_array());
}

TEST(ProtocolTest, ParseErrorResponse) {
    auto response = parse_response({
        {"jsonrpc", "2.0"},
        {"id", 2},
        {"error", {{"code", -32602}, {"message", "bad params"}, {"data", {{"field", "url"}}}}}
    });
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->is_error());
    EXPECT_EQ(response->error->code, protocol::kInvalidParams);
    EXPECT_EQ(response->error->message, "bad params");
    EXPECT_EQ(response->error->data["field"], "url");
}

TEST(ProtocolTest, NullResultIsStillAResult) {
    auto response = parse_response({{"jsonrpc", "2.0"}, {"id", 1}, {"result", nullptr}});
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->is_error());
    EXPECT_TRUE(response->result->is_null());
}

TEST(ProtocolTest, RejectsInvalidEnvelopes) {
    // Wrong version
    EXPECT_FALSE(parse_response({{"jsonrpc", "1.0"}, {"id", 1}, {"result", 1}}).has_value());
    // Missing version
    EXPECT_FALSE(parse_response({{"id", 1}, {"result", 1}}).has_value());
    // Non-integer id
    EXPECT_FALSE(parse_response({{"jsonrpc", "2.0"}, {"id", "abc"}, {"result", 1}}).has_value());
    // Neither result nor error
    EXPECT_FALSE(parse_response({{"jsonrpc", "2.0"}, {"id", 1}}).has_value());
    // Both result and error
    EXPECT_FALSE(parse_response({{"jsonrpc", "2.0"}, {"id", 1}, {"result", 1},
                                 {"error", {{"code", 1}, {"message", "x"}}}}).has_value());
    // Error without message
    EXPECT_FALSE(parse_response({{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", 1}}}}).has_value());
    // A request is not a response
    EXPECT_FALSE(parse_response(make_request(1, "ping")).has_value());
    // Not an object
    EXPECT_FALSE(parse_response(json::array({1, 2})).has_value());
}

TEST(ProtocolTest, ResponseDetection) {
    EXPECT_TRUE(is_response({{"jsonrpc", "2.0"}, {"id", 1}, {"result", 1}}));
    EXPECT_FALSE(is_response(make_request(1, "roots/list")));
    EXPECT_FALSE(is_response(make_notification("notifications/message")));
    EXPECT_FALSE(is_response("text"));
}

TEST(ProtocolTest, ReplyEnvelopesEchoPeerId) {
    json result = make_result_response("srv-1", {{"roots", json::array()}});
    EXPECT_EQ(result["id"], "srv-1");
    EXPECT_TRUE(result["result"]["roots"].is_array());

    json error = make_error_response(9, protocol::kMethodNotFound, "Method not found: sampling/createMessage");
    EXPECT_EQ(error["id"], 9);
    EXPECT_EQ(error["error"]["code"], -32601);
    EXPECT_FALSE(error.contains("result"));
}

TEST(ProtocolTest, ParseToolList) {
    json result = {
        {"tools", json::array({
            {{"name", "read_documentation"}, {"description", "Fetch a page"},
             {"inputSchema", {{"type", "object"}, {"required", json::array({"url"})}}}},
            {{"description", "no name, skipped"}},
            {{"name", "recommend"}}
        })}
    };

    auto tools = parse_tool_list(result);
    ASSERT_TRUE(tools.has_value());
    ASSERT_EQ(tools->size(), 2u);
    EXPECT_EQ((*tools)[0].name, "read_documentation");
    EXPECT_EQ((*tools)[0].input_schema["required"][0], "url");
    EXPECT_EQ((*tools)[1].name, "recommend");
    EXPECT_TRUE((*tools)[1].description.empty());
    EXPECT_TRUE((*tools)[1].input_schema.is_object());

    EXPECT_FALSE(parse_tool_list(json::object()).has_value());
    EXPECT_FALSE(parse_tool_list({{"tools", "none"}}).has_value());
}

TEST(ProtocolTest, ToolDescriptorToJson) {
    ToolDescriptor tool{"git_log", "Show log", {{"type", "object"}}};
    json j = tool.to_json();
    EXPECT_EQ(j["name"], "git_log");
    EXPECT_EQ(j["inputSchema"]["type"], "object");

    auto parsed = ToolDescriptor::from_json(j);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->description, "Show log");
}
