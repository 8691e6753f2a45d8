#include "gtest/gtest.h"
#include "TestFixtures.h"
#include "../../src/Logic/RouteDispatcher.h"
#include <string>
#include <vector>

namespace
{
    // Records invocations instead of launching anything
    class FakeDelegate : public ToolDelegate
    {
    public:
        std::vector<DelegateInvocation> calls;
        bool fail = false;

        DelegationResult Delegate(const DelegateInvocation &invocation) override
        {
            calls.push_back(invocation);
            DelegationResult result;
            result.launched = true;
            result.exitCode = fail ? 2 : 0;
            result.success = !fail;
            result.outputLines.push_back("tool saw " + std::to_string(invocation.coreArgs.size()) + " args");
            if (fail)
            {
                result.errorLines.push_back("tool: bad input");
            }
            return result;
        }
    };

    OutputDocument SampleDocument()
    {
        OutputDocument document;
        document.command = "snake .";
        document.path = ".";
        document.rows.push_back({"rename", "./A B.txt", "./a_b.txt", "applied", ""});
        document.files = {"./a_b.txt", "./c.txt"};
        document.summary = "1 operation(s) applied.";
        return document;
    }

    RouteClause Clause(RouteKind kind)
    {
        RouteClause clause;
        clause.kind = kind;
        return clause;
    }
}

TEST(RouteDispatcherTest, ResolveKeepsOrder)
{
    RouteClause to = Clause(RouteKind::To);
    to.tool = "zip";
    to.args = {"-q", "out.zip"};
    RouteClause format = Clause(RouteKind::Format);
    format.format = OutputFormat::Json;
    RouteClause into = Clause(RouteKind::Into);
    into.path = "report.json";

    std::vector<RouteEffect> effects = RouteDispatcher::Resolve({to, format, into});
    ASSERT_EQ(effects.size(), 3u);
    EXPECT_EQ(effects[0].kind, EffectKind::Delegate);
    EXPECT_EQ(effects[0].invocation.userArgs, (std::vector<std::string>{"-q", "out.zip"}));
    EXPECT_EQ(effects[1].kind, EffectKind::SelectFormat);
    EXPECT_EQ(effects[2].kind, EffectKind::WriteOutput);
    EXPECT_EQ(RouteDispatcher::SelectedFormat(effects), OutputFormat::Json);
    EXPECT_EQ(RouteDispatcher::SelectedFormat({}), OutputFormat::Text);
}

TEST(RouteDispatcherTest, PrintsTextWithoutRoutes)
{
    DispatchResult result = RouteDispatcher::Dispatch({}, SampleDocument(), ".", false, nullptr);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.printedOutput, ReportSerializer::ToText(SampleDocument()));
}

TEST(RouteDispatcherTest, DelegateGetsPathThenFilesThenUserArgs)
{
    FakeDelegate delegate;
    RouteClause to = Clause(RouteKind::To);
    to.tool = "wc";
    to.args = {"-l"};

    DispatchResult result = RouteDispatcher::Dispatch(RouteDispatcher::Resolve({to}), SampleDocument(), "docs", false, &delegate);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(delegate.calls.size(), 1u);
    EXPECT_EQ(delegate.calls[0].tool, "wc");
    EXPECT_EQ(delegate.calls[0].coreArgs, (std::vector<std::string>{"docs", "./a_b.txt", "./c.txt"}));
    EXPECT_EQ(delegate.calls[0].userArgs, (std::vector<std::string>{"-l"}));
    EXPECT_NE(result.printedOutput.find("tool saw 3 args"), std::string::npos);
}

TEST(RouteDispatcherTest, DelegateFailureIsReported)
{
    FakeDelegate delegate;
    delegate.fail = true;
    RouteClause to = Clause(RouteKind::To);
    to.tool = "lint";

    DispatchResult result = RouteDispatcher::Dispatch(RouteDispatcher::Resolve({to}), SampleDocument(), ".", false, &delegate);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.delegationFailed);
    ASSERT_EQ(result.errorLog.size(), 2u);
    EXPECT_NE(result.errorLog[0].find("exit code 2"), std::string::npos);
    EXPECT_EQ(result.errorLog[1], "tool: bad input");

    DispatchResult missing = RouteDispatcher::Dispatch(RouteDispatcher::Resolve({to}), SampleDocument(), ".", false, nullptr);
    EXPECT_FALSE(missing.success);
    EXPECT_TRUE(missing.delegationFailed);
}

TEST(RouteDispatcherTest, PreviewRunsNothing)
{
    FakeDelegate delegate;
    RouteClause to = Clause(RouteKind::To);
    to.tool = "zip";
    RouteClause into = Clause(RouteKind::Into);
    into.path = fs::temp_directory_path() / "SmartMoveGTests_never_written.txt";

    DispatchResult result = RouteDispatcher::Dispatch(RouteDispatcher::Resolve({to, into}), SampleDocument(), ".", true, &delegate);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(delegate.calls.empty());
    EXPECT_TRUE(result.writtenFiles.empty());
    EXPECT_FALSE(fs::exists(into.path));
    EXPECT_EQ(result.infoLog.size(), 2u);
    EXPECT_FALSE(result.printedOutput.empty());
}

TEST_F(SmartMoveFilesystemTest, RouteDispatcher_WritesReportFile)
{
    RouteClause format = Clause(RouteKind::Format);
    format.format = OutputFormat::Csv;
    RouteClause into = Clause(RouteKind::Into);
    into.path = tempTestDir / "report.csv";

    DispatchResult result = RouteDispatcher::Dispatch(RouteDispatcher::Resolve({format, into}), SampleDocument(), ".", false, nullptr);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.writtenFiles.size(), 1u);
    EXPECT_TRUE(result.printedOutput.empty());
    EXPECT_EQ(ReadFile(tempTestDir / "report.csv"), ReportSerializer::ToCsv(SampleDocument()));
}

TEST_F(SmartMoveFilesystemTest, RouteDispatcher_MissingReportFolderFails)
{
    RouteClause into = Clause(RouteKind::Into);
    into.path = tempTestDir / "no_such_folder" / "report.txt";

    DispatchResult result = RouteDispatcher::Dispatch(RouteDispatcher::Resolve({into}), SampleDocument(), ".", false, nullptr);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.delegationFailed);
    EXPECT_EQ(result.errorLog.size(), 1u);
    // The report still reaches stdout
    EXPECT_FALSE(result.printedOutput.empty());
}
