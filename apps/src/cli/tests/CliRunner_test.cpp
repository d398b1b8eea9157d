#include "cli/CliRunner.h"
#include "client/ClientConfig.h"
#include "core/ConfigLoader.h"
#include "tests/MockWebSocketService.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

using namespace RNodeClient;
using namespace RNodeClient::Cli;
using namespace RNodeClient::Tests;

namespace {

class RecordingWebUi : public Web::WebUiServerInterface {
public:
    explicit RecordingWebUi(int& runCount) : runCount_(runCount) {}

    Result<std::monostate, std::string> bind(const std::string& address, int port) override
    {
        address_ = address;
        port_ = port;
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }

    std::string url() const override
    {
        return "http://" + address_ + ":" + std::to_string(port_);
    }

    void run() override { ++runCount_; }
    void stop() override {}

private:
    int& runCount_;
    std::string address_;
    int port_ = -1;
};

} // namespace

class CliRunnerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        configDir_ = std::filesystem::temp_directory_path()
            / ("rnode_cli_runner_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(configDir_);
        writeConfig("{}");

        mock_ = std::make_shared<MockWebSocketService>();
        services_.openConnection =
            [this](const std::string& host, int port, const ConnectionOptions& options) {
                ++connectionsOpened_;
                lastHost_ = host;
                lastPort_ = port;
                lastOptions_ = options;
                return std::make_shared<Connection>(mock_, host, port, options);
            };
        services_.makeWebUi =
            [this](DiagnosticsClient&, ReplClient&, const Web::PageOptions& options) {
                lastPageOptions_ = options;
                return std::make_unique<RecordingWebUi>(webUiRuns_);
            };
    }

    void TearDown() override
    {
        ConfigLoader::clearConfigDir();
        std::filesystem::remove_all(configDir_);
    }

    void writeConfig(const std::string& content)
    {
        std::ofstream(configDir_ / kClientConfigFile) << content;
    }

    // Prepends the program name and pins the config to the test directory.
    int run(std::vector<std::string> args)
    {
        std::vector<std::string> argv{ "rnode-client", "--config-dir", configDir_.string() };
        argv.insert(argv.end(), args.begin(), args.end());
        return runCli(argv, out_, err_, services_);
    }

    std::string sentLine(size_t index = 0) const
    {
        return Network::deserialize_payload<Api::ReplRun::Command>(
                   mock_->sentEnvelopes().at(index).payload)
            .line;
    }

    std::filesystem::path configDir_;
    std::shared_ptr<MockWebSocketService> mock_;
    CliServices services_;
    std::ostringstream out_;
    std::ostringstream err_;
    int connectionsOpened_ = 0;
    std::string lastHost_;
    int lastPort_ = -1;
    ConnectionOptions lastOptions_;
    Web::PageOptions lastPageOptions_;
    int webUiRuns_ = 0;
};

TEST_F(CliRunnerTest, InlineCodePrintsOutputAndExitsZero)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "OK" });

    EXPECT_EQ(run({ "-c", "new x in { x!(1 + 1) }" }), 0);

    EXPECT_EQ(out_.str(), "OK\n");
    EXPECT_EQ(err_.str(), "");
    ASSERT_EQ(mock_->sentCommands().size(), 1u);
    EXPECT_EQ(sentLine(), "new x in { x!(1 + 1) }");
    EXPECT_EQ(lastHost_, "127.0.0.1");
    EXPECT_EQ(lastPort_, 50000);
}

TEST_F(CliRunnerTest, TrailingDashCIsItselfTheLastArgument)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "ran" });

    EXPECT_EQ(run({ "new x in { x!(1) }", "-c" }), 0);

    ASSERT_EQ(mock_->sentCommands().size(), 1u);
    EXPECT_EQ(sentLine(), "-c");
}

TEST_F(CliRunnerTest, InlineCodeIsLastArgumentEvenAfterOtherPositionals)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "ran" });

    EXPECT_EQ(run({ "-c", "foo", "new x in { x!(1+1) }" }), 0);

    EXPECT_EQ(sentLine(), "new x in { x!(1+1) }");
}

TEST_F(CliRunnerTest, ConnectionOptionsAreNotPartOfTheArgumentSequence)
{
    mock_->expectSuccess<Api::ReplRun::Command>({ .output = "ran" });

    EXPECT_EQ(run({ "-c", "@0!(1)", "--host", "10.0.0.5", "--port=40401", "-t", "750" }), 0);

    EXPECT_EQ(sentLine(), "@0!(1)");
    EXPECT_EQ(lastHost_, "10.0.0.5");
    EXPECT_EQ(lastPort_, 40401);
    EXPECT_EQ(lastOptions_.responseTimeoutMs, 750);
}

TEST_F(CliRunnerTest, FileModeEvaluatesFirstArgument)
{
    mock_->expectSuccess<Api::ReplEval::Command>({ .output = "evaluated" });

    EXPECT_EQ(run({ "-v", "contract.rho" }), 0);

    EXPECT_EQ(out_.str(), "evaluated\n");
    ASSERT_EQ(mock_->sentEnvelopes().size(), 1u);
    auto cmd = Network::deserialize_payload<Api::ReplEval::Command>(
        mock_->sentEnvelopes().front().payload);
    EXPECT_EQ(cmd.fileName, "contract.rho");
}

TEST_F(CliRunnerTest, MissingPathIsUsageErrorWithoutRpc)
{
    EXPECT_EQ(run({}), 1);

    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(err_.str().rfind("Error: ", 0), 0u) << err_.str();
    EXPECT_TRUE(mock_->sentCommands().empty());
    EXPECT_EQ(mock_->connectCount(), 0);
}

TEST_F(CliRunnerTest, NodeFaultExitsOneWithMessageOnStderr)
{
    mock_->expectError<Api::ReplRun::Command>("syntax error at 1:4");

    EXPECT_EQ(run({ "-c", "new x in" }), 1);

    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(err_.str().rfind("Error: ", 0), 0u) << err_.str();
    EXPECT_NE(err_.str().find("syntax error at 1:4"), std::string::npos);
}

TEST_F(CliRunnerTest, UnreachableNodeExitsOne)
{
    mock_->failNextConnect("Connection failed (ws://127.0.0.1:50000)");

    EXPECT_EQ(run({ "-c", "@0!(1)" }), 1);

    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Cannot reach node"), std::string::npos);
}

TEST_F(CliRunnerTest, MalformedConfigExitsOneBeforeConnecting)
{
    writeConfig("{ \"host\": ");

    EXPECT_EQ(run({ "-c", "@0!(1)" }), 1);

    EXPECT_NE(err_.str().find("Parse error"), std::string::npos);
    EXPECT_EQ(connectionsOpened_, 0);
}

TEST_F(CliRunnerTest, NodePortZeroIsRejected)
{
    EXPECT_EQ(run({ "--port", "0", "-c", "@0!(1)" }), 1);

    EXPECT_NE(err_.str().find("--port must be between 1 and 65535"), std::string::npos);
    EXPECT_EQ(connectionsOpened_, 0);
}

TEST_F(CliRunnerTest, UnknownOptionIsAParseError)
{
    EXPECT_EQ(run({ "--no-such-option" }), 1);

    EXPECT_FALSE(err_.str().empty());
    EXPECT_EQ(connectionsOpened_, 0);
}

TEST_F(CliRunnerTest, WebModePrintsBannerOnceAndServes)
{
    writeConfig(R"({"escape_html": true})");

    EXPECT_EQ(run({ "-w" }), 0);

    EXPECT_EQ(out_.str(), "rnode web UI at http://0.0.0.0:8888\n");
    EXPECT_EQ(webUiRuns_, 1);
    EXPECT_TRUE(lastPageOptions_.escapeHtml);
    EXPECT_TRUE(mock_->sentCommands().empty());
}

TEST_F(CliRunnerTest, HelpExitsZeroAndNamesTheTransport)
{
    EXPECT_EQ(run({ "--help" }), 0);

    EXPECT_NE(out_.str().find("WebSocket"), std::string::npos);
    EXPECT_NE(out_.str().find("gRPC"), std::string::npos);
    EXPECT_EQ(connectionsOpened_, 0);
}

TEST(ModeArgumentsTest, KeepsOrderAndDropsAmbientOptions)
{
    const std::vector<std::string> argv{ "prog", "-v",   "--timeout=5", "-wc", "--port",
                                         "1",    "code", "-t",          "9",   "--",
                                         "-c" };

    const std::vector<std::string> expected{ "prog", "-w", "-c", "code", "-c" };
    EXPECT_EQ(modeArguments(argv), expected);
}

TEST(ModeArgumentsTest, AttachedShortTimeoutValueIsDropped)
{
    const std::vector<std::string> argv{ "prog", "-t500", "script.rho" };

    const std::vector<std::string> expected{ "prog", "script.rho" };
    EXPECT_EQ(modeArguments(argv), expected);
}
