#include "mcp/ToolPayload.hpp"
#include <gtest/gtest.h>

using namespace mcp_stdio;
using json = nlohmann::json;

namespace {

json text_result(const std::string& text) {
    return {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

} // namespace

TEST(ToolPayloadTest, FirstText) {
    EXPECT_EQ(first_text(text_result("hello")), "hello");
    EXPECT_FALSE(first_text(json::object()).has_value());
    EXPECT_FALSE(first_text({{"content", json::array()}}).has_value());
    EXPECT_FALSE(first_text({{"content", json::array({{{"type", "image"}, {"data", "..."}}})}}).has_value());
}

TEST(ToolPayloadTest, DecodesJsonText) {
    json decoded = decode_payload(text_result("{\"branch\":\"main\",\"clean\":true}"));
    EXPECT_EQ(decoded["branch"], "main");
    EXPECT_EQ(decoded["clean"], true);
}

TEST(ToolPayloadTest, DecodesJsonArrays) {
    json decoded = decode_payload(text_result("[{\"url\":\"https://docs.aws.amazon.com/s3/\"}]"));
    ASSERT_TRUE(decoded.is_array());
    EXPECT_EQ(decoded[0]["url"], "https://docs.aws.amazon.com/s3/");
}

TEST(ToolPayloadTest, PlainTextIsWrapped) {
    json decoded = decode_payload(text_result("On branch main\nnothing to commit"));
    EXPECT_EQ(decoded, json({{"text", "On branch main\nnothing to commit"}}));
}

TEST(ToolPayloadTest, ResultWithoutTextIsUnchanged) {
    json result = {{"content", json::array()}, {"isError", false}};
    EXPECT_EQ(decode_payload(result), result);
}
