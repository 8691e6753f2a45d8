#include "gtest/gtest.h"
#include "TestFixtures.h"
#include "../../src/Logic/ExecutionEngine.h"
#include "../../src/Logic/HistoryStore.h"
#include <memory>
#include <set>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

class ExecutionEngineTest : public SmartMoveFilesystemTest
{
protected:
    std::unique_ptr<HistoryStore> history;

    void SetUp() override
    {
        SmartMoveFilesystemTest::SetUp();
        history = std::make_unique<HistoryStore>(historyDir, 50);
        ASSERT_TRUE(history->Load());
    }

    PlannedOperation Op(OperationKind kind, const fs::path &source, const fs::path &destination = fs::path(),
                        PlanState state = PlanState::Ready, bool isDirectory = false) const
    {
        PlannedOperation op;
        op.kind = kind;
        op.source = tempTestDir / source;
        if (!destination.empty())
        {
            op.destination = tempTestDir / destination;
        }
        op.state = state;
        op.isDirectory = isDirectory;
        return op;
    }

    ExecutionReport Run(const std::vector<PlannedOperation> &plan, bool preview = false)
    {
        FlagSet flags;
        flags.preview = preview;
        ExecutionEngine engine(*history);
        return engine.Execute(plan, flags, "test batch");
    }

    UndoResult UndoLatest()
    {
        ExecutionEngine engine(*history);
        return engine.Undo();
    }
};

TEST_F(ExecutionEngineTest, RenameAndUndoRestoresTree)
{
    CreateDummyFile(tempTestDir / "My File.txt", "one");
    CreateDummyFile(tempTestDir / "Sub Dir" / "Inner File.md", "two");
    const auto before = SnapshotTree(tempTestDir);

    ExecutionReport report = Run({Op(OperationKind::Rename, "Sub Dir/Inner File.md", "Sub Dir/inner_file.md"),
                                  Op(OperationKind::Rename, "Sub Dir", "sub_dir", PlanState::Ready, true),
                                  Op(OperationKind::Rename, "My File.txt", "my_file.txt")});

    ASSERT_TRUE(report.success);
    EXPECT_EQ(report.appliedCount, 3u);
    ASSERT_TRUE(report.historySequence.has_value());
    EXPECT_EQ(ReadFile(tempTestDir / "sub_dir" / "inner_file.md"), "two");
    EXPECT_EQ(ReadFile(tempTestDir / "my_file.txt"), "one");

    UndoResult undone = UndoLatest();
    ASSERT_TRUE(undone.overallSuccess) << undone.errorMessage;
    EXPECT_EQ(undone.successfulUndos.size(), 3u);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
}

TEST_F(ExecutionEngineTest, MoveIntoNewFolderAndUndo)
{
    CreateDummyFile(tempTestDir / "a.txt", "a");
    CreateDummyFile(tempTestDir / "b.txt", "b");
    const auto before = SnapshotTree(tempTestDir);

    ExecutionReport report = Run({Op(OperationKind::CreateDir, "archive", fs::path(), PlanState::Ready, true),
                                  Op(OperationKind::Move, "a.txt", "archive/a.txt"),
                                  Op(OperationKind::Move, "b.txt", "archive/b.txt")});
    ASSERT_TRUE(report.success);
    EXPECT_TRUE(fs::is_directory(tempTestDir / "archive"));
    EXPECT_EQ(ReadFile(tempTestDir / "archive" / "b.txt"), "b");
    EXPECT_FALSE(fs::exists(tempTestDir / "a.txt"));

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
}

TEST_F(ExecutionEngineTest, CopyAndUndo)
{
    CreateDummyFile(tempTestDir / "tree" / "leaf.txt", "leaf");
    CreateDummyFile(tempTestDir / "note.txt", "note");
    const auto before = SnapshotTree(tempTestDir);

    ExecutionReport report = Run({Op(OperationKind::Copy, "tree", "tree_copy", PlanState::Ready, true),
                                  Op(OperationKind::Copy, "note.txt", "note_copy.txt")});
    ASSERT_TRUE(report.success);
    EXPECT_EQ(ReadFile(tempTestDir / "tree_copy" / "leaf.txt"), "leaf");
    EXPECT_EQ(ReadFile(tempTestDir / "note.txt"), "note");
    EXPECT_EQ(ReadFile(tempTestDir / "note_copy.txt"), "note");

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
}

TEST_F(ExecutionEngineTest, RemoveIsBackedUpAndRestored)
{
    CreateDummyFile(tempTestDir / "old.log", "log data");
    CreateDummyFile(tempTestDir / "cache" / "deep" / "c.tmp", "cached");
    const auto before = SnapshotTree(tempTestDir);

    ExecutionReport report = Run({Op(OperationKind::Remove, "old.log"),
                                  Op(OperationKind::Remove, "cache", fs::path(), PlanState::Ready, true)});
    ASSERT_TRUE(report.success);
    EXPECT_TRUE(SnapshotTree(tempTestDir).empty());

    std::optional<HistoryEntry> entry = history->LatestUndoable();
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->operations.size(), 2u);
    ASSERT_TRUE(entry->operations[0].backup.has_value());
    EXPECT_TRUE(fs::exists(entry->operations[0].backup->backupPath));

    UndoResult undone = UndoLatest();
    ASSERT_TRUE(undone.overallSuccess);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
    // Backups of a fully undone batch are released
    EXPECT_FALSE(fs::exists(history->BackupDirectory(*report.historySequence)));
}

TEST_F(ExecutionEngineTest, CreateAndUndo)
{
    ExecutionReport report = Run({Op(OperationKind::CreateDir, "a/b/c", fs::path(), PlanState::Ready, true),
                                  Op(OperationKind::CreateFile, "notes/todo.txt")});
    ASSERT_TRUE(report.success);
    EXPECT_TRUE(fs::is_directory(tempTestDir / "a" / "b" / "c"));
    EXPECT_TRUE(fs::is_regular_file(tempTestDir / "notes" / "todo.txt"));
    EXPECT_EQ(fs::file_size(tempTestDir / "notes" / "todo.txt"), 0u);

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_FALSE(fs::exists(tempTestDir / "a" / "b" / "c"));
    EXPECT_FALSE(fs::exists(tempTestDir / "notes" / "todo.txt"));
}

TEST_F(ExecutionEngineTest, OverwriteRestoresReplacedFile)
{
    CreateDummyFile(tempTestDir / "IMG_1234.jpg", "new picture");
    CreateDummyFile(tempTestDir / "1234.jpg", "old picture");
    const auto before = SnapshotTree(tempTestDir);

    ExecutionReport report = Run({Op(OperationKind::Rename, "IMG_1234.jpg", "1234.jpg", PlanState::OverwriteAllowed)});
    ASSERT_TRUE(report.success);
    EXPECT_FALSE(fs::exists(tempTestDir / "IMG_1234.jpg"));
    EXPECT_EQ(ReadFile(tempTestDir / "1234.jpg"), "new picture");

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
}

TEST_F(ExecutionEngineTest, FolderReplacesFileAndUndo)
{
    CreateDummyFile(tempTestDir / "drafts" / "one.md", "one");
    CreateDummyFile(tempTestDir / "notes", "a plain file");
    const auto before = SnapshotTree(tempTestDir);

    ExecutionReport report = Run({Op(OperationKind::Move, "drafts", "notes", PlanState::OverwriteAllowed, true)});
    ASSERT_TRUE(report.success);
    EXPECT_EQ(ReadFile(tempTestDir / "notes" / "one.md"), "one");
    EXPECT_FALSE(fs::exists(tempTestDir / "drafts"));

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
}

#ifndef _WIN32
// Names directly inside 'folder'; a FIFO must never be opened for reading
static std::set<std::string> ListNames(const fs::path &folder)
{
    std::set<std::string> names;
    for (const auto &entry : fs::directory_iterator(folder))
    {
        names.insert(entry.path().filename().string());
    }
    return names;
}

TEST_F(ExecutionEngineTest, FailedOverwriteKeepsDestination)
{
    CreateDummyFile(tempTestDir / "dest.txt", "PRECIOUS");
    ASSERT_EQ(::mkfifo((tempTestDir / "pipe").c_str(), 0600), 0);

    ExecutionReport report = Run({Op(OperationKind::Copy, "pipe", "dest.txt", PlanState::OverwriteAllowed)});

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failedCount, 1u);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].outcome, OperationOutcome::Failed);
    EXPECT_FALSE(report.historySequence.has_value());

    EXPECT_EQ(ReadFile(tempTestDir / "dest.txt"), "PRECIOUS");
    EXPECT_EQ(ListNames(tempTestDir), (std::set<std::string>{".history", "dest.txt", "pipe"}));
    EXPECT_FALSE(fs::exists(history->BackupDirectory(1)));
}

TEST_F(ExecutionEngineTest, FailedOverwriteAfterAppliedOperationLeavesHistoryConsistent)
{
    CreateDummyFile(tempTestDir / "a.txt", "a");
    CreateDummyFile(tempTestDir / "dest.txt", "PRECIOUS");
    ASSERT_EQ(::mkfifo((tempTestDir / "pipe").c_str(), 0600), 0);

    ExecutionReport report = Run({Op(OperationKind::Rename, "a.txt", "a2.txt"),
                                  Op(OperationKind::Copy, "pipe", "dest.txt", PlanState::OverwriteAllowed)});

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.appliedCount, 1u);
    EXPECT_EQ(report.failedCount, 1u);
    EXPECT_EQ(ReadFile(tempTestDir / "dest.txt"), "PRECIOUS");
    ASSERT_TRUE(report.historySequence.has_value());

    // The failed entry's backup is not left behind outside the history
    const fs::path backups = history->BackupDirectory(*report.historySequence);
    EXPECT_TRUE(!fs::exists(backups) || fs::is_empty(backups));

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_EQ(ReadFile(tempTestDir / "a.txt"), "a");
    EXPECT_EQ(ReadFile(tempTestDir / "dest.txt"), "PRECIOUS");
}
#endif

TEST_F(ExecutionEngineTest, StaleBackupFolderIsNotReused)
{
    CreateDummyFile(history->BackupDirectory(1) / "1_1_victim.txt", "left by an interrupted run");
    CreateDummyFile(tempTestDir / "victim.txt", "current");

    ExecutionReport report = Run({Op(OperationKind::Remove, "victim.txt")});
    ASSERT_TRUE(report.success) << (report.errorLog.empty() ? "" : report.errorLog[0]);
    ASSERT_TRUE(report.historySequence.has_value());
    EXPECT_EQ(*report.historySequence, 2u);
    EXPECT_EQ(ReadFile(history->BackupDirectory(1) / "1_1_victim.txt"), "left by an interrupted run");

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_EQ(ReadFile(tempTestDir / "victim.txt"), "current");
}

TEST_F(ExecutionEngineTest, PreviewChangesNothing)
{
    CreateDummyFile(tempTestDir / "a.txt", "a");
    CreateDummyFile(tempTestDir / "b.txt", "b");
    const auto before = SnapshotTree(tempTestDir);

    ExecutionReport report = Run({Op(OperationKind::Rename, "a.txt", "A.txt"),
                                  Op(OperationKind::Remove, "b.txt"),
                                  Op(OperationKind::CreateDir, "new", fs::path(), PlanState::Ready, true)},
                                 true);
    ASSERT_TRUE(report.success);
    EXPECT_TRUE(report.preview);
    EXPECT_EQ(report.appliedCount, 0u);
    for (const auto &result : report.results)
    {
        EXPECT_EQ(result.outcome, OperationOutcome::Previewed);
    }
    EXPECT_FALSE(report.historySequence.has_value());
    EXPECT_EQ(SnapshotTree(tempTestDir), before);
    EXPECT_FALSE(fs::exists(historyDir));
    EXPECT_TRUE(history->Entries().empty());
}

TEST_F(ExecutionEngineTest, ConflictsAndNoOpsAreNotApplied)
{
    CreateDummyFile(tempTestDir / "a.txt");
    CreateDummyFile(tempTestDir / "b.txt");
    CreateDummyFile(tempTestDir / "c.txt");

    PlannedOperation conflict = Op(OperationKind::Rename, "a.txt", "b.txt", PlanState::Conflict);
    conflict.reason = "destination exists (use -f to overwrite)";
    PlannedOperation noop = Op(OperationKind::Rename, "c.txt", "c.txt", PlanState::NoOp);

    ExecutionReport report = Run({conflict, noop});
    ASSERT_TRUE(report.success);
    EXPECT_EQ(report.conflictCount, 1u);
    EXPECT_EQ(report.unchangedCount, 1u);
    EXPECT_EQ(report.appliedCount, 0u);
    EXPECT_EQ(report.results[0].outcome, OperationOutcome::Excluded);
    EXPECT_EQ(report.results[1].outcome, OperationOutcome::Unchanged);
    EXPECT_FALSE(report.historySequence.has_value());
    EXPECT_TRUE(fs::exists(tempTestDir / "a.txt"));
}

TEST_F(ExecutionEngineTest, ChangedFilesystemIsSkipped)
{
    CreateDummyFile(tempTestDir / "a.txt");
    CreateDummyFile(tempTestDir / "b.txt");

    std::vector<PlannedOperation> plan = {Op(OperationKind::Rename, "a.txt", "x.txt"),
                                          Op(OperationKind::Rename, "b.txt", "y.txt"),
                                          Op(OperationKind::CreateDir, "made", fs::path(), PlanState::Ready, true)};

    // Changes after planning
    fs::remove(tempTestDir / "a.txt");
    fs::create_directories(tempTestDir / "made");

    ExecutionReport report = Run(plan);
    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.skippedCount, 2u);
    EXPECT_EQ(report.appliedCount, 1u);
    EXPECT_EQ(report.results[0].outcome, OperationOutcome::Skipped);
    EXPECT_EQ(report.results[1].outcome, OperationOutcome::Applied);
    EXPECT_EQ(report.warningLog.size(), 2u);
    EXPECT_TRUE(fs::exists(tempTestDir / "y.txt"));
}

TEST_F(ExecutionEngineTest, FailureStopsTheBatch)
{
    CreateDummyFile(tempTestDir / "a.txt", "a");
    CreateDummyFile(tempTestDir / "b.txt", "b");
    CreateDummyFile(tempTestDir / "c.txt", "c");

    ExecutionReport report = Run({Op(OperationKind::Rename, "a.txt", "a2.txt"),
                                  Op(OperationKind::Move, "b.txt", "missing_folder/b.txt"),
                                  Op(OperationKind::Rename, "c.txt", "c2.txt")});

    EXPECT_FALSE(report.success);
    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(report.failedCount, 1u);
    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.results[0].outcome, OperationOutcome::Applied);
    EXPECT_EQ(report.results[1].outcome, OperationOutcome::Failed);
    EXPECT_EQ(report.results[2].outcome, OperationOutcome::NotAttempted);
    EXPECT_EQ(report.errorLog.size(), 1u);
    EXPECT_TRUE(fs::exists(tempTestDir / "c.txt"));

    // What was applied is still recorded and can be undone
    ASSERT_TRUE(report.historySequence.has_value());
    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_EQ(ReadFile(tempTestDir / "a.txt"), "a");
}

TEST_F(ExecutionEngineTest, UndoWalksBackThroughBatches)
{
    CreateDummyFile(tempTestDir / "a.txt", "a");

    ASSERT_TRUE(Run({Op(OperationKind::Rename, "a.txt", "b.txt")}).success);
    ASSERT_TRUE(Run({Op(OperationKind::Rename, "b.txt", "c.txt")}).success);
    EXPECT_EQ(history->Entries().size(), 2u);

    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_TRUE(fs::exists(tempTestDir / "b.txt"));
    ASSERT_TRUE(UndoLatest().overallSuccess);
    EXPECT_TRUE(fs::exists(tempTestDir / "a.txt"));

    UndoResult nothing = UndoLatest();
    EXPECT_TRUE(nothing.historyError);
    EXPECT_FALSE(nothing.overallSuccess);
}

TEST_F(ExecutionEngineTest, UndoReportsOccupiedOriginal)
{
    CreateDummyFile(tempTestDir / "a.txt", "a");
    ASSERT_TRUE(Run({Op(OperationKind::Rename, "a.txt", "b.txt")}).success);
    CreateDummyFile(tempTestDir / "a.txt", "someone else");

    UndoResult undone = UndoLatest();
    EXPECT_FALSE(undone.overallSuccess);
    EXPECT_FALSE(undone.historyError);
    ASSERT_EQ(undone.failedUndos.size(), 1u);
    EXPECT_EQ(ReadFile(tempTestDir / "a.txt"), "someone else");
    EXPECT_TRUE(fs::exists(tempTestDir / "b.txt"));

    // The batch is marked undone anyway
    EXPECT_FALSE(history->LatestUndoable().has_value());
}

TEST_F(ExecutionEngineTest, UnavailableHistoryStillExecutes)
{
    fs::create_directories(historyDir);
    {
        std::ofstream out(historyDir / "history.log");
        out << "garbage\n";
    }
    ASSERT_FALSE(history->Load());

    CreateDummyFile(tempTestDir / "a.txt");
    ExecutionReport report = Run({Op(OperationKind::Rename, "a.txt", "b.txt")});
    EXPECT_TRUE(report.success);
    EXPECT_FALSE(report.historySequence.has_value());
    EXPECT_EQ(report.warningLog.size(), 1u);
    EXPECT_TRUE(fs::exists(tempTestDir / "b.txt"));

    UndoResult undone = UndoLatest();
    EXPECT_TRUE(undone.historyError);
}

TEST(ExecutionEngineUtils, Describe)
{
    PlannedOperation op;
    op.kind = OperationKind::Move;
    op.source = "a.txt";
    op.destination = fs::path("dest/a.txt");
    EXPECT_NE(ExecutionEngine::Describe(op).find("a.txt -> dest/a.txt"), std::string::npos);
}
