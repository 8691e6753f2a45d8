#include "gtest/gtest.h"
#include "TestFixtures.h"
#include "../../src/App/CommandRunner.h"
#include "../../src/App/Settings.h"
#include "../../src/Logic/FileScanner.h"
#include <rapidjson/document.h>
#include <wx/utils.h>
#include <string>
#include <vector>

namespace
{
    class RecordingDelegate : public ToolDelegate
    {
    public:
        std::vector<DelegateInvocation> calls;
        int exitCode = 0;

        DelegationResult Delegate(const DelegateInvocation &invocation) override
        {
            calls.push_back(invocation);
            DelegationResult result;
            result.launched = true;
            result.exitCode = exitCode;
            result.success = exitCode == 0;
            return result;
        }
    };
}

class CommandRunnerTest : public SmartMoveFilesystemTest
{
protected:
    Settings settings;
    RecordingDelegate delegate;

    void SetUp() override
    {
        SmartMoveFilesystemTest::SetUp();
        settings.configRoot = tempTestDir / ".history";
        settings.historyRoot = historyDir;
    }

    RunResult Run(std::vector<std::string> tokens, ConfirmCallback confirm = nullptr)
    {
        CommandRunner runner(settings, &delegate, confirm);
        return runner.Run(tokens);
    }

    std::string Dir() const
    {
        return tempTestDir.string();
    }
};

TEST_F(CommandRunnerTest, ChangeRemovesPrefix)
{
    CreateDummyFile(tempTestDir / "IMG_1234.jpg", "jpeg");

    RunResult result = Run({"CHANGE", "IMG_", "INTO", "", Dir()});
    ASSERT_EQ(result.status, ExitStatus::Success);
    EXPECT_TRUE(result.errorLog.empty());
    EXPECT_EQ(ReadFile(tempTestDir / "1234.jpg"), "jpeg");
    EXPECT_FALSE(fs::exists(tempTestDir / "IMG_1234.jpg"));
    EXPECT_NE(result.output.find("1 operation(s) applied"), std::string::npos);
}

TEST_F(CommandRunnerTest, RawCommandLine)
{
    CreateDummyFile(tempTestDir / "IMG_1.jpg");

    CommandRunner runner(settings, &delegate);
    RunResult result = runner.Run("CHANGE \"IMG_\" INTO \"photo \" " + Dir());
    ASSERT_EQ(result.status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "photo 1.jpg"));
}

TEST_F(CommandRunnerTest, SplitSnakeAndKebab)
{
    CreateDummyFile(tempTestDir / "featureWishList.md");
    CreateDummyFile(tempTestDir / "Document Template.txt");

    ASSERT_EQ(Run({"split", "snake", Dir(), "EXT:md"}).status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "feature_wish_list.md"));

    ASSERT_EQ(Run({"kebab", Dir(), "EXT:txt"}).status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "document-template.txt"));
}

TEST_F(CommandRunnerTest, FiltersSelectOnlyMatchingFiles)
{
    CreateSizedFile(tempTestDir / "big.md", 2 * 1024 * 1024);
    CreateSizedFile(tempTestDir / "small.md", 500 * 1024);
    CreateSizedFile(tempTestDir / "big.txt", 2 * 1024 * 1024);

    RunResult result = Run({"upper", Dir(), "EXT:md", "SIZE>1MB"});
    ASSERT_EQ(result.status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "BIG.md"));
    EXPECT_TRUE(fs::exists(tempTestDir / "small.md"));
    EXPECT_TRUE(fs::exists(tempTestDir / "big.txt"));
}

TEST_F(CommandRunnerTest, PreviewChangesNothing)
{
    CreateDummyFile(tempTestDir / "My File.txt", "x");
    CreateDummyFile(tempTestDir / "sub" / "Other File.txt", "y");
    const auto before = SnapshotTree(tempTestDir);

    RunResult result = Run({"snake", Dir(), "-rp"});
    ASSERT_EQ(result.status, ExitStatus::Success);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
    EXPECT_NE(result.output.find("Preview"), std::string::npos);
    EXPECT_NE(result.output.find("my_file.txt"), std::string::npos);
    EXPECT_FALSE(fs::exists(historyDir));
}

TEST_F(CommandRunnerTest, ExitCodes)
{
    CreateDummyFile(tempTestDir / "a.txt");

    EXPECT_EQ(Run({"frobnicate", Dir()}).status, ExitStatus::InvalidCommand);
    EXPECT_EQ(Run({"snake", Dir(), "-z"}).status, ExitStatus::InvalidCommand);
    EXPECT_EQ(Run({"snake", Dir(), "SIZE>lots"}).status, ExitStatus::InvalidCommand);
    EXPECT_EQ(Run({"REGEX", "([a-z", "INTO", "x", Dir()}).status, ExitStatus::InvalidCommand);
    EXPECT_EQ(Run({"snake", (tempTestDir / "missing").string()}).status, ExitStatus::FileOperationFailed);
    EXPECT_EQ(Run({"snake", Dir(), "-T"}).status, ExitStatus::GeneralError);
    EXPECT_EQ(Run({"undo"}).status, ExitStatus::GeneralError);
    EXPECT_TRUE(fs::exists(tempTestDir / "a.txt"));
}

TEST_F(CommandRunnerTest, ConflictIsReportedAndSkipped)
{
    CreateDummyFile(tempTestDir / "IMG_7.jpg", "new");
    CreateDummyFile(tempTestDir / "7.jpg", "old");

    RunResult result = Run({"CHANGE", "IMG_", "INTO", "", Dir()});
    EXPECT_EQ(result.status, ExitStatus::Success);
    ASSERT_FALSE(result.warningLog.empty());
    EXPECT_NE(result.warningLog[0].find("Conflict"), std::string::npos);
    EXPECT_EQ(ReadFile(tempTestDir / "7.jpg"), "old");
    EXPECT_NE(result.output.find("Nothing was changed"), std::string::npos);

    RunResult forced = Run({"CHANGE", "IMG_", "INTO", "", Dir(), "-f"});
    EXPECT_EQ(forced.status, ExitStatus::Success);
    EXPECT_EQ(ReadFile(tempTestDir / "7.jpg"), "new");

    // The overwritten file comes back on undo
    ASSERT_EQ(Run({"undo"}).status, ExitStatus::Success);
    EXPECT_EQ(ReadFile(tempTestDir / "7.jpg"), "old");
    EXPECT_EQ(ReadFile(tempTestDir / "IMG_7.jpg"), "new");
}

TEST_F(CommandRunnerTest, UndoAndHistory)
{
    CreateDummyFile(tempTestDir / "Alpha Beta.txt");
    const auto before = SnapshotTree(tempTestDir);

    ASSERT_EQ(Run({"pascal", Dir()}).status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "AlphaBeta.txt"));

    RunResult listed = Run({"history", "FORMAT:json"});
    ASSERT_EQ(listed.status, ExitStatus::Success);
    rapidjson::Document parsed;
    parsed.Parse(listed.output.c_str());
    ASSERT_FALSE(parsed.HasParseError()) << listed.output;
    ASSERT_EQ(parsed["operations"].Size(), 1u);
    EXPECT_STREQ(parsed["operations"][0]["status"].GetString(), "live");

    RunResult preview = Run({"undo", "-p"});
    ASSERT_EQ(preview.status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "AlphaBeta.txt"));

    ASSERT_EQ(Run({"-u"}).status, ExitStatus::Success);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);

    RunResult again = Run({"undo"});
    EXPECT_EQ(again.status, ExitStatus::GeneralError);
    ASSERT_FALSE(again.errorLog.empty());
}

TEST_F(CommandRunnerTest, MoveCopyAndRemoveActOnPath)
{
    CreateDummyFile(tempTestDir / "report.pdf", "pdf");
    CreateDummyFile(tempTestDir / "cache" / "blob.bin", "blob");
    const auto before = SnapshotTree(tempTestDir);

    ASSERT_EQ(Run({"mv", (tempTestDir / "report.pdf").string(), "INTO", (tempTestDir / "archive").string() + "/"}).status, ExitStatus::Success);
    EXPECT_EQ(ReadFile(tempTestDir / "archive" / "report.pdf"), "pdf");

    ASSERT_EQ(Run({"cp", (tempTestDir / "cache").string(), (tempTestDir / "cache2").string(), "-r"}).status, ExitStatus::Success);
    EXPECT_EQ(ReadFile(tempTestDir / "cache2" / "blob.bin"), "blob");

    ASSERT_EQ(Run({"rm", (tempTestDir / "cache").string(), "-r"}).status, ExitStatus::Success);
    EXPECT_FALSE(fs::exists(tempTestDir / "cache"));

    ASSERT_EQ(Run({"undo"}).status, ExitStatus::Success);
    ASSERT_EQ(Run({"undo"}).status, ExitStatus::Success);
    ASSERT_EQ(Run({"undo"}).status, ExitStatus::Success);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
}

TEST_F(CommandRunnerTest, MkdirAndTouch)
{
    ASSERT_EQ(Run({"mkdir", (tempTestDir / "a" / "b").string()}).status, ExitStatus::Success);
    EXPECT_TRUE(fs::is_directory(tempTestDir / "a" / "b"));

    ASSERT_EQ(Run({"touch", (tempTestDir / "a" / "b" / "note.txt").string()}).status, ExitStatus::Success);
    EXPECT_TRUE(fs::is_regular_file(tempTestDir / "a" / "b" / "note.txt"));

    // Already there
    RunResult again = Run({"touch", (tempTestDir / "a" / "b" / "note.txt").string()});
    EXPECT_EQ(again.status, ExitStatus::Success);
    EXPECT_NE(again.output.find("unchanged"), std::string::npos);
}

TEST_F(CommandRunnerTest, GroupByStem)
{
    CreateDummyFile(tempTestDir / "song.mp3");
    CreateDummyFile(tempTestDir / "song.txt");
    CreateDummyFile(tempTestDir / "cover.png");

    ASSERT_EQ(Run({"group", Dir()}).status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "song" / "song.mp3"));
    EXPECT_TRUE(fs::exists(tempTestDir / "song" / "song.txt"));
    EXPECT_TRUE(fs::exists(tempTestDir / "cover" / "cover.png"));
}

TEST_F(CommandRunnerTest, FlattenLeavesFolders)
{
    CreateDummyFile(tempTestDir / "a" / "b" / "deep.txt");

    ASSERT_EQ(Run({"flatten", Dir()}).status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "deep.txt"));
    EXPECT_TRUE(fs::is_directory(tempTestDir / "a" / "b"));
}

TEST_F(CommandRunnerTest, UserGroupsFromSettings)
{
    settings.groups.push_back({"logs", "EXT:log TYPE:file"});
    settings.groups.push_back({"media", "EXT:xyz"});
    CreateDummyFile(tempTestDir / "server.log");
    CreateDummyFile(tempTestDir / "keep.txt");

    CommandRunner runner(settings, &delegate);
    EXPECT_TRUE(runner.Registry().Resolve("logs").has_value());

    RunResult result = runner.Run(std::vector<std::string>{"rm", Dir(), "FOR:logs"});
    ASSERT_EQ(result.status, ExitStatus::Success);
    EXPECT_FALSE(fs::exists(tempTestDir / "server.log"));
    EXPECT_TRUE(fs::exists(tempTestDir / "keep.txt"));
}

TEST_F(CommandRunnerTest, RoutesWriteAndDelegate)
{
    CreateDummyFile(tempTestDir / "A.md");

    RunResult written = Run({"lower", Dir(), "INTO:" + (tempTestDir / "report.json").string(), "FORMAT:json"});
    ASSERT_EQ(written.status, ExitStatus::Success);
    EXPECT_TRUE(written.output.empty());
    rapidjson::Document parsed;
    parsed.Parse(ReadFile(tempTestDir / "report.json").c_str());
    ASSERT_FALSE(parsed.HasParseError());
    EXPECT_EQ(parsed["counts"]["applied"].GetUint64(), 1u);

    RunResult delegated = Run({"upper", Dir(), "EXT:md", "TO:wc:-l"});
    ASSERT_EQ(delegated.status, ExitStatus::Success);
    ASSERT_EQ(delegate.calls.size(), 1u);
    EXPECT_EQ(delegate.calls[0].tool, "wc");
    EXPECT_EQ(delegate.calls[0].userArgs, (std::vector<std::string>{"-l"}));
    ASSERT_EQ(delegate.calls[0].coreArgs.size(), 2u);
    EXPECT_EQ(fs::path(delegate.calls[0].coreArgs[1]).filename(), "A.md");

    delegate.exitCode = 4;
    RunResult failed = Run({"lower", Dir(), "TO:wc"});
    EXPECT_EQ(failed.status, ExitStatus::GeneralError);
    EXPECT_FALSE(failed.errorLog.empty());
}

TEST_F(CommandRunnerTest, InteractiveConfirmation)
{
    CreateDummyFile(tempTestDir / "Some Name.txt");
    std::string shown;

    RunResult declined = Run({"snake", Dir(), "-I"}, [&shown](const std::string &preview)
                             { shown = preview; return false; });
    EXPECT_EQ(declined.status, ExitStatus::Success);
    EXPECT_NE(declined.output.find("Cancelled"), std::string::npos);
    EXPECT_NE(shown.find("some_name.txt"), std::string::npos);
    EXPECT_TRUE(fs::exists(tempTestDir / "Some Name.txt"));

    RunResult accepted = Run({"snake", Dir(), "-I"}, [](const std::string &)
                             { return true; });
    EXPECT_EQ(accepted.status, ExitStatus::Success);
    EXPECT_TRUE(fs::exists(tempTestDir / "some_name.txt"));
}

TEST(CommandRunnerUtils, JoinTokensQuotesSpaces)
{
    EXPECT_EQ(CommandRunner::JoinTokens({"CHANGE", "a b", "INTO", "", "."}), "CHANGE \"a b\" INTO \"\" .");
}

// --- Settings ---
TEST_F(SmartMoveFilesystemTest, Settings_DefaultsWithoutFile)
{
    Settings settings = Settings::Load(tempTestDir);
    EXPECT_EQ(settings.maxHistoryEntries, Settings::DefaultMaxHistoryEntries);
    EXPECT_EQ(settings.historyRoot, tempTestDir);
    EXPECT_EQ(settings.scanThreads, 1);
    EXPECT_FALSE(settings.includeHidden);
    EXPECT_TRUE(settings.groups.empty());
    EXPECT_TRUE(settings.warningLog.empty());
}

TEST_F(SmartMoveFilesystemTest, Settings_ReadsAndClampsValues)
{
    CreateDummyFile(Settings::ConfigFilePath(tempTestDir),
                    "[History]\n"
                    "MaxEntries=0\n"
                    "StoreDir=store\n"
                    "[Scan]\n"
                    "Threads=99\n"
                    "IncludeHidden=1\n"
                    "[Groups]\n"
                    "logs=EXT:log TYPE:file\n"
                    "broken=COLOR:red\n");

    Settings settings = Settings::Load(tempTestDir);
    EXPECT_EQ(settings.maxHistoryEntries, 1u);
    EXPECT_EQ(settings.warningLog.size(), 1u);
    EXPECT_EQ(settings.historyRoot, tempTestDir / "store");
    EXPECT_EQ(settings.scanThreads, FileScanner::MaxThreads);
    EXPECT_TRUE(settings.includeHidden);
    ASSERT_EQ(settings.groups.size(), 2u);
    EXPECT_EQ(settings.groups[0].first, "broken");

    SemanticGroupRegistry registry;
    settings.RegisterGroups(registry);
    EXPECT_TRUE(registry.Resolve("logs").has_value());
    EXPECT_FALSE(registry.Resolve("broken").has_value());
    EXPECT_EQ(settings.warningLog.size(), 2u);
}

TEST(SettingsTest, SuiteRunsWithAPrivateHome)
{
    EXPECT_EQ(Settings::DefaultConfigRoot(), fs::temp_directory_path() / "SmartMoveGTests_Home");
}

TEST_F(SmartMoveFilesystemTest, Settings_HomeVariableWins)
{
    wxString previous;
    const bool hadPrevious = wxGetEnv("SMARTMOVE_HOME", &previous);

    ASSERT_TRUE(wxSetEnv("SMARTMOVE_HOME", wxString(tempTestDir.wstring())));
    EXPECT_EQ(Settings::DefaultConfigRoot(), tempTestDir);
    wxUnsetEnv("SMARTMOVE_HOME");
    EXPECT_FALSE(Settings::DefaultConfigRoot().empty());

    if (hadPrevious)
    {
        wxSetEnv("SMARTMOVE_HOME", previous);
    }
}
