#ifndef EXECUTIONENGINE_H
#define EXECUTIONENGINE_H

#include "SmartMoveTypes.h"
#include "HistoryStore.h"

#include <string>
#include <system_error>
#include <vector>

// Applies planned operations and reverses recorded batches
class ExecutionEngine
{
public:
	explicit ExecutionEngine(HistoryStore &history);

	// Preview produces the report without touching the filesystem
	ExecutionReport Execute(const std::vector<PlannedOperation> &plan, const FlagSet &flags, const std::string &label);

	// Reverses the most recent batch that is not undone yet
	UndoResult Undo();

	static std::string Describe(const PlannedOperation &op);

	// Filesystem primitives shared by execution and undo
	static void MovePath(const fs::path &source, const fs::path &destination, std::error_code &ec);
	static void CopyPath(const fs::path &source, const fs::path &destination, std::error_code &ec);
	static bool PathExists(const fs::path &path);

private:
	static bool Revalidate(const PlannedOperation &op, std::string &reason);
	static bool Mutate(const PlannedOperation &op, std::error_code &ec);
	static void ReplaceDestination(const PlannedOperation &op, std::error_code &ec);
	static fs::path StagingPath(const fs::path &destination);
	bool RecoverDestroyed(const PlannedOperation &op, const BackupRecord &backup, std::string &message);
	static bool Reverse(const AppliedOperation &op, HistoryStore &history, std::string &errorMessage);
	static fs::path Absolute(const fs::path &path);

	HistoryStore &m_history;
};

#endif // EXECUTIONENGINE_H
