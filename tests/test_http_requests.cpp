/**
 * @file test_http_requests.cpp
 * @brief Request body validation for the turn and tool routes
 */

#include <gtest/gtest.h>
#include "encoding.hpp"
#include "http_requests.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using namespace receipt_assistant;
using namespace receipt_assistant::test_support;

TEST(TurnRequestTest, ReadsRoleTextAndImages) {
    auto request = parse_turn_request(json{
        {"role", "user"},
        {"text", "lunch yesterday"},
        {"images", {{{"data", base64_encode(bytes_of("jpeg bytes"))}, {"mime_type", "image/jpeg"}}}}
    });
    ASSERT_TRUE(request.ok()) << request.error().message;
    EXPECT_EQ(request.value().role, Role::User);
    EXPECT_EQ(request.value().text, "lunch yesterday");
    ASSERT_EQ(request.value().images.size(), 1u);
    EXPECT_EQ(request.value().images[0].data, bytes_of("jpeg bytes"));
    EXPECT_EQ(request.value().images[0].mime_type, "image/jpeg");
}

TEST(TurnRequestTest, MissingFieldsTakeDefaults) {
    auto request = parse_turn_body("{}");
    ASSERT_TRUE(request.ok());
    EXPECT_EQ(request.value().role, Role::User);
    EXPECT_TRUE(request.value().text.empty());
    EXPECT_TRUE(request.value().images.empty());

    auto image = parse_turn_request(json{{"images", {{{"data", base64_encode(bytes_of("x"))}}}}});
    ASSERT_TRUE(image.ok());
    EXPECT_EQ(image.value().images[0].mime_type, "application/octet-stream");
}

TEST(TurnRequestTest, NonObjectBodiesAreRejected) {
    for (const char* body : {"[]", "\"text\"", "42", "null", "true"}) {
        auto request = parse_turn_body(body);
        ASSERT_FALSE(request.ok()) << body;
        EXPECT_EQ(request.code(), ErrorCode::InvalidArgument) << body;
    }
    auto garbage = parse_turn_body("{ not json");
    ASSERT_FALSE(garbage.ok());
    EXPECT_EQ(garbage.code(), ErrorCode::InvalidArgument);
}

TEST(TurnRequestTest, WrongFieldTypesAreRejected) {
    std::vector<json> bodies = {
        {{"role", 7}},
        {{"role", "system"}},
        {{"text", {{"nested", true}}}},
        {{"images", "not-an-array"}},
        {{"images", {42}}},
        {{"images", {{{"mime_type", "image/png"}}}}},
        {{"images", {{{"data", 12}}}}},
        {{"images", {{{"data", base64_encode(bytes_of("x"))}, {"mime_type", 3}}}}},
    };
    for (const auto& body : bodies) {
        auto request = parse_turn_request(body);
        ASSERT_FALSE(request.ok()) << body.dump();
        EXPECT_EQ(request.code(), ErrorCode::InvalidArgument) << body.dump();
    }
}

TEST(TurnRequestTest, BadBase64NamesTheImage) {
    auto request = parse_turn_request(json{
        {"images", {{{"data", base64_encode(bytes_of("ok"))}}, {{"data", "abc"}}}}
    });
    ASSERT_FALSE(request.ok());
    EXPECT_EQ(request.code(), ErrorCode::InvalidArgument);
    EXPECT_NE(request.error().message.find("images[1]"), std::string::npos);
}

TEST(TurnRequestTest, AssistantTurnsCarryNoImages) {
    auto text_only = parse_turn_request(json{{"role", "assistant"}, {"text", "Stored it."}});
    ASSERT_TRUE(text_only.ok());
    EXPECT_EQ(text_only.value().role, Role::Assistant);

    auto with_image = parse_turn_request(json{
        {"role", "assistant"},
        {"images", {{{"data", base64_encode(bytes_of("x"))}}}}
    });
    EXPECT_EQ(with_image.code(), ErrorCode::InvalidArgument);
}

TEST(ToolCallRequestTest, ReadsSessionAndArguments) {
    auto request = parse_tool_body(R"({"session_id": "s1", "arguments": {"receipt_id": "abc"}})");
    ASSERT_TRUE(request.ok());
    EXPECT_EQ(request.value().session_id, "s1");
    EXPECT_EQ(request.value().arguments, (json{{"receipt_id", "abc"}}));

    auto no_args = parse_tool_request(json{{"session_id", "s1"}});
    ASSERT_TRUE(no_args.ok());
    EXPECT_TRUE(no_args.value().arguments.is_object());
    EXPECT_TRUE(no_args.value().arguments.empty());
}

TEST(ToolCallRequestTest, MalformedCallsAreRejected) {
    std::vector<json> bodies = {
        json::array(),
        json("s1"),
        json::object(),
        {{"session_id", ""}},
        {{"session_id", 12}},
        {{"session_id", "s1"}, {"arguments", "receipt_id=abc"}},
        {{"session_id", "s1"}, {"arguments", {1, 2}}},
    };
    for (const auto& body : bodies) {
        auto request = parse_tool_request(body);
        ASSERT_FALSE(request.ok()) << body.dump();
        EXPECT_EQ(request.code(), ErrorCode::InvalidArgument) << body.dump();
    }
}
