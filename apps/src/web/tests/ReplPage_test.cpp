#include "tests/MockWebSocketService.h"
#include "web/ReplPage.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace RNodeClient;
using namespace RNodeClient::Tests;
using namespace RNodeClient::Web;

namespace {
constexpr std::string_view kTestTemplate =
    "<ul><!-- PART --></ul><textarea><!-- PART --></textarea><pre><!-- PART --></pre>";
} // namespace

class ReplPageTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_ = std::make_shared<MockWebSocketService>();
        auto connection = std::make_shared<Connection>(mock_, kDefaultNodeHost, kDefaultNodePort);
        diagnostics_ = std::make_unique<DiagnosticsClient>(connection);
        repl_ = std::make_unique<ReplClient>(connection);
        mock_->expectSuccess<Api::ListPeers::Command>({ .peers = { "peer-b", "peer-a" } });
    }

    ReplPage makePage(PageOptions options = {})
    {
        return ReplPage(*diagnostics_, *repl_, options, kTestTemplate);
    }

    std::shared_ptr<MockWebSocketService> mock_;
    std::unique_ptr<DiagnosticsClient> diagnostics_;
    std::unique_ptr<ReplClient> repl_;
};

TEST(FormatStoreContentsTest, BreaksAfterEverySeparator)
{
    EXPECT_EQ(
        formatStoreContents("@{x}!(2) | for(...) { Nil } | for(...) { Nil }"),
        "@{x}!(2) |\nfor(...) { Nil } |\nfor(...) { Nil }");
}

TEST(FormatStoreContentsTest, LeavesTextWithoutSeparatorAlone)
{
    EXPECT_EQ(formatStoreContents(""), "");
    EXPECT_EQ(formatStoreContents("a|b"), "a|b");
    EXPECT_EQ(formatStoreContents("trailing |"), "trailing |");
}

TEST(EscapeHtmlTest, EscapesMarkupCharacters)
{
    EXPECT_EQ(escapeHtml(R"(<a href="x">'&'</a>)"),
        "&lt;a href=&quot;x&quot;&gt;&#39;&amp;&#39;&lt;/a&gt;");
    EXPECT_EQ(escapeHtml("plain"), "plain");
}

TEST_F(ReplPageTest, TemplateWithWrongMarkerCountIsRejected)
{
    EXPECT_THROW(
        { ReplPage page(*diagnostics_, *repl_, {}, "<!-- PART --><!-- PART -->"); },
        std::invalid_argument);
    EXPECT_THROW(
        {
            ReplPage page(
                *diagnostics_,
                *repl_,
                {},
                "<!-- PART --><!-- PART --><!-- PART --><!-- PART -->");
        },
        std::invalid_argument);
}

TEST_F(ReplPageTest, EmbeddedTemplateIsAccepted)
{
    EXPECT_NO_THROW({ ReplPage page(*diagnostics_, *repl_); });
}

TEST_F(ReplPageTest, IdlePageListsPeersInServerOrder)
{
    auto page = makePage();

    auto html = page.get();
    ASSERT_TRUE(html.isValue());
    EXPECT_EQ(
        html.value(),
        "<ul><li>peer-b</li><li>peer-a</li></ul><textarea></textarea><pre></pre>");
    EXPECT_FALSE(page.session().hasResult);
}

TEST_F(ReplPageTest, PostStoresCodeAndTransformedContents)
{
    mock_->expectSuccess<Api::ReplRun::Command>(
        { .output = "@{x}!(2) | for(...) { Nil } | for(...) { Nil }" });
    auto page = makePage();

    auto html = page.post(std::string("@{x}!(2)"));
    ASSERT_TRUE(html.isValue());

    const std::string expected =
        "<ul><li>peer-b</li><li>peer-a</li></ul><textarea>@{x}!(2)</textarea>"
        "<pre>@{x}!(2) |\nfor(...) { Nil } |\nfor(...) { Nil }</pre>";
    EXPECT_EQ(html.value(), expected);

    auto session = page.session();
    EXPECT_TRUE(session.hasResult);
    EXPECT_EQ(session.lastSubmittedCode, "@{x}!(2)");

    auto after = page.get();
    ASSERT_TRUE(after.isValue());
    EXPECT_EQ(after.value(), expected);
}

TEST_F(ReplPageTest, RepeatedGetsAreIdentical)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "a | b" });
    auto page = makePage();
    ASSERT_TRUE(page.post(std::string("code")).isValue());

    auto first = page.get();
    auto second = page.get();
    ASSERT_TRUE(first.isValue());
    ASSERT_TRUE(second.isValue());
    EXPECT_EQ(first.value(), second.value());
}

TEST_F(ReplPageTest, LaterPostOverwritesSession)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "first" });
    auto page = makePage();
    ASSERT_TRUE(page.post(std::string("one")).isValue());

    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "second" });
    ASSERT_TRUE(page.post(std::string("two")).isValue());

    auto session = page.session();
    EXPECT_EQ(session.lastSubmittedCode, "two");
    EXPECT_EQ(session.lastStoreContents, "second");
}

TEST_F(ReplPageTest, MissingFieldSendsNoRpc)
{
    auto page = makePage();

    auto html = page.post(std::nullopt);
    ASSERT_TRUE(html.isError());
    EXPECT_EQ(html.errorValue().kind, ClientError::Kind::MissingField);
    EXPECT_TRUE(mock_->sentCommands().empty());
    EXPECT_EQ(page.session().lastSubmittedCode, "");
}

TEST_F(ReplPageTest, FailedRunKeepsNewCodeAndStaleContents)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "old store" });
    auto page = makePage();
    ASSERT_TRUE(page.post(std::string("old code")).isValue());

    mock_->expectError<Api::ReplRun::Command>("Syntax error");
    auto html = page.post(std::string("broken {"));
    ASSERT_TRUE(html.isError());
    EXPECT_EQ(html.errorValue().kind, ClientError::Kind::RpcFailure);

    auto session = page.session();
    EXPECT_EQ(session.lastSubmittedCode, "broken {");
    EXPECT_EQ(session.lastStoreContents, "old store");
    EXPECT_TRUE(session.hasResult);
}

TEST_F(ReplPageTest, ListPeersFailureFailsTheRequest)
{
    mock_->expectError<Api::ListPeers::Command>("diagnostics disabled");
    auto page = makePage();

    auto html = page.get();
    ASSERT_TRUE(html.isError());
    EXPECT_EQ(html.errorValue().kind, ClientError::Kind::RpcFailure);
}

TEST_F(ReplPageTest, ValuesAreInsertedVerbatimByDefault)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "<b>" });
    auto page = makePage();

    auto html = page.post(std::string("</textarea>"));
    ASSERT_TRUE(html.isValue());
    EXPECT_NE(html.value().find("<textarea></textarea></textarea>"), std::string::npos);
    EXPECT_NE(html.value().find("<pre><b></pre>"), std::string::npos);
}

TEST_F(ReplPageTest, EscapingOptionEscapesInsertedValues)
{
    mock_->expectSuccess<Api::ListPeers::Command>({ .peers = { "<peer>" } });
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "a & b" });
    auto page = makePage(PageOptions{ .escapeHtml = true });

    auto html = page.post(std::string("x < y"));
    ASSERT_TRUE(html.isValue());
    EXPECT_EQ(
        html.value(),
        "<ul><li>&lt;peer&gt;</li></ul><textarea>x &lt; y</textarea><pre>a &amp; b</pre>");
}
