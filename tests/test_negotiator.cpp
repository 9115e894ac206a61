/// @file test_negotiator.cpp
/// Unit tests for negotiator.hpp and graphql_client.hpp against a scripted
/// transport.

#include "errors.hpp"
#include "fake_transport.hpp"
#include "graphql_client.hpp"
#include "negotiator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace asset_upload;
using namespace asset_upload::fakes;
using json = nlohmann::json;

namespace {

class NegotiatorTest : public ::testing::Test {
protected:
    FakeTransport            transport;
    GraphQLClient            client{transport, kTestEndpoint, "shpat_test"};
    StagedTransferNegotiator negotiator{client};

    FileDescriptor jpeg() const { return describeFile("a.jpg", "image/jpeg", 17408); }
};

} // namespace

// ============================================================================
// GraphQLClient
// ============================================================================

TEST(GraphQLClient, RejectsMalformedEndpoint) {
    FakeTransport transport;
    EXPECT_THROW(GraphQLClient(transport, "not-a-url"), std::invalid_argument);
}

TEST(GraphQLClient, PostsJsonWithAccessToken) {
    FakeTransport transport;
    transport.query.push_back(ScriptedReply::json({{"data", {{"ok", true}}}}));
    GraphQLClient client(transport, kTestEndpoint, "shpat_test");

    auto resp = client.execute("query { shop { name } }", {{"x", 1}});
    EXPECT_EQ(resp.httpStatus, 200u);
    EXPECT_EQ(resp.body["data"]["ok"], true);

    ASSERT_EQ(transport.requests.size(), 1u);
    const auto& req = transport.requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, kTestEndpoint);

    HttpResponse headers;
    headers.headers = req.headers;
    EXPECT_EQ(headers.header("content-type"), "application/json");
    EXPECT_EQ(headers.header("X-Shopify-Access-Token"), "shpat_test");

    auto payload = json::parse(req.body);
    EXPECT_EQ(payload["query"], "query { shop { name } }");
    EXPECT_EQ(payload["variables"]["x"], 1);
}

TEST(GraphQLClient, NonJsonBodyThrows) {
    FakeTransport transport;
    transport.query.push_back(ScriptedReply{502, "<html>Bad gateway</html>"});
    GraphQLClient client(transport, kTestEndpoint);

    EXPECT_THROW(client.execute("query { shop { name } }"), std::runtime_error);
}

// ============================================================================
// StagedTransferNegotiator
// ============================================================================

TEST_F(NegotiatorTest, SendsDescriptorAndReturnsTarget) {
    transport.staged.push_back(ScriptedReply::json(stagedTargetReply(
        "https://storage.example.com/bucket", "res://abc",
        {{"policy", "p1"}, {"signature", "s1"}})));

    StagedTarget target = negotiator.negotiate(jpeg());

    EXPECT_EQ(target.uploadUrl, "https://storage.example.com/bucket");
    EXPECT_EQ(target.resourceUrl, "res://abc");
    ASSERT_EQ(target.parameters.size(), 2u);
    EXPECT_EQ(target.parameters[0].name, "policy");
    EXPECT_EQ(target.parameters[1].name, "signature");

    auto input = FakeTransport::variablesOf(transport.requests[0])["input"][0];
    EXPECT_EQ(input["filename"], "a.jpg");
    EXPECT_EQ(input["mimeType"], "image/jpeg");
    EXPECT_EQ(input["resource"], "IMAGE");
    EXPECT_EQ(input["fileSize"], "17408");
    EXPECT_EQ(input["httpMethod"], "POST");
}

TEST_F(NegotiatorTest, EachCallAllocatesANewTarget) {
    auto first  = negotiator.negotiate(jpeg());
    auto second = negotiator.negotiate(jpeg());
    EXPECT_NE(first.resourceUrl, second.resourceUrl);
    EXPECT_EQ(transport.count(Route::Staged), 2);
}

TEST_F(NegotiatorTest, PutMethodIsForwarded) {
    StagedTransferNegotiator putNegotiator(client, "PUT");
    putNegotiator.negotiate(jpeg());

    auto input = FakeTransport::variablesOf(transport.requests[0])["input"][0];
    EXPECT_EQ(input["httpMethod"], "PUT");
}

TEST_F(NegotiatorTest, UserErrorsBecomeNegotiationError) {
    json reply = {{"data", {{"stagedUploadsCreate", {
        {"stagedTargets", json::array()},
        {"userErrors", json::array({
            {{"field", json::array({"input", "0", "fileSize"})}, {"message", "File too large"}}
        })}
    }}}}};
    transport.staged.push_back(ScriptedReply::json(reply));

    try {
        negotiator.negotiate(jpeg());
        FAIL() << "expected NegotiationError";
    } catch (const NegotiationError& e) {
        ASSERT_EQ(e.messages().size(), 1u);
        EXPECT_EQ(e.messages()[0], "input.0.fileSize: File too large");
    }
}

TEST_F(NegotiatorTest, GraphqlErrorsBecomeNegotiationError) {
    transport.staged.push_back(ScriptedReply::json(
        {{"errors", json::array({{{"message", "Access denied for stagedUploadsCreate"}}})}}));

    try {
        negotiator.negotiate(jpeg());
        FAIL() << "expected NegotiationError";
    } catch (const NegotiationError& e) {
        ASSERT_EQ(e.messages().size(), 1u);
        EXPECT_EQ(e.messages()[0], "Access denied for stagedUploadsCreate");
    }
}

TEST_F(NegotiatorTest, HttpErrorStatusIsReported) {
    transport.staged.push_back(ScriptedReply::json(
        {{"errors", json::array({{{"message", "Invalid API key"}}})}}, 401));

    try {
        negotiator.negotiate(jpeg());
        FAIL() << "expected NegotiationError";
    } catch (const NegotiationError& e) {
        ASSERT_EQ(e.messages().size(), 2u);
        EXPECT_EQ(e.messages()[0], "HTTP 401");
        EXPECT_EQ(e.messages()[1], "Invalid API key");
    }
}

TEST_F(NegotiatorTest, EmptyTargetListIsAnError) {
    transport.staged.push_back(ScriptedReply::json({{"data", {{"stagedUploadsCreate", {
        {"stagedTargets", json::array()}, {"userErrors", json::array()}
    }}}}}));
    EXPECT_THROW(negotiator.negotiate(jpeg()), NegotiationError);
}

TEST_F(NegotiatorTest, MalformedTargetIsAnError) {
    transport.staged.push_back(ScriptedReply::json({{"data", {{"stagedUploadsCreate", {
        {"stagedTargets", json::array({{{"url", "https://s"}}})},
        {"userErrors", json::array()}
    }}}}}));
    EXPECT_THROW(negotiator.negotiate(jpeg()), NegotiationError);
}

TEST_F(NegotiatorTest, TransportFailureIsWrapped) {
    transport.staged.push_back(ScriptedReply::transportFailure());
    EXPECT_THROW(negotiator.negotiate(jpeg()), NegotiationError);
}

TEST_F(NegotiatorTest, CancelledBeforeRequest) {
    CancellationToken cancel;
    cancel.cancel();

    EXPECT_THROW(negotiator.negotiate(jpeg(), &cancel), OperationCancelled);
    EXPECT_TRUE(transport.requests.empty());
}
