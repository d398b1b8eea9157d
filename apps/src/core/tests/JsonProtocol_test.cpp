#include "client/api/ListPeers.h"
#include "client/api/ReplEval.h"
#include "client/api/ReplRun.h"
#include "core/network/JsonProtocol.h"
#include <gtest/gtest.h>

using namespace RNodeClient;
using namespace RNodeClient::Network;

TEST(JsonProtocolTest, CommandCarriesNameIdAndFields)
{
    auto json = makeJsonCommand(5, Api::ReplEval::Command{ .fileName = "contract.rho" });

    EXPECT_EQ(json["command"], "Repl.Eval");
    EXPECT_EQ(json["id"], 5);
    EXPECT_EQ(json["fileName"], "contract.rho");
}

TEST(JsonProtocolTest, SuccessResponseParsesValue)
{
    const std::string text = R"({"id": 5, "success": true, "value": {"output": "OK"}})";

    auto result = parseJsonResponse<Api::ReplRun::Okay>(text);
    ASSERT_TRUE(result.isValue());
    ASSERT_TRUE(result.value().isValue());
    EXPECT_EQ(result.value().value().output, "OK");
}

TEST(JsonProtocolTest, ErrorMemberBecomesApiError)
{
    const std::string text = R"({"id": 5, "error": "node is syncing"})";

    auto result = parseJsonResponse<Api::ReplRun::Okay>(text);
    ASSERT_TRUE(result.isValue());
    ASSERT_TRUE(result.value().isError());
    EXPECT_EQ(result.value().errorValue().message, "node is syncing");
}

TEST(JsonProtocolTest, StructuredErrorMessageIsUsed)
{
    const std::string text = R"({"id": 5, "error": {"message": "bad request"}})";

    auto result = parseJsonResponse<Api::ListPeers::Okay>(text);
    ASSERT_TRUE(result.isValue());
    ASSERT_TRUE(result.value().isError());
    EXPECT_EQ(result.value().errorValue().message, "bad request");
}

TEST(JsonProtocolTest, MissingValueIsProtocolError)
{
    auto result = parseJsonResponse<Api::ReplRun::Okay>(R"({"id": 5, "success": true})");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("missing 'value'"), std::string::npos);
}

TEST(JsonProtocolTest, UnparseableTextIsProtocolError)
{
    auto result = parseJsonResponse<Api::ReplRun::Okay>("<html>");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Invalid JSON response"), std::string::npos);
}

TEST(JsonProtocolTest, ResponseBuilderMatchesParser)
{
    auto response = Api::ListPeers::Response::okay({ .peers = { "p1", "p2" } });

    auto json = makeJsonResponse(11, response);
    EXPECT_EQ(json["id"], 11);
    EXPECT_EQ(json["success"], true);

    auto parsed = parseJsonResponse<Api::ListPeers::Okay>(json.dump());
    ASSERT_TRUE(parsed.isValue());
    ASSERT_TRUE(parsed.value().isValue());
    EXPECT_EQ(parsed.value().value().peers, (std::vector<std::string>{ "p1", "p2" }));
}
