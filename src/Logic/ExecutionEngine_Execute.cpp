#include "ExecutionEngine.h"
#include "TextUtils.h"

#include <wx/log.h>

#include <fstream>
#include <system_error>

// Checks that the filesystem still matches what the planner saw
bool ExecutionEngine::Revalidate(const PlannedOperation &op, std::string &reason)
{
	std::error_code ec;

	if (op.kind == OperationKind::CreateDir || op.kind == OperationKind::CreateFile)
	{
		if (PathExists(op.source))
		{
			reason = op.source.string() + " appeared since planning";
			return false;
		}
		return true;
	}

	fs::file_status source = fs::symlink_status(op.source, ec);
	if (!fs::exists(source))
	{
		reason = "source " + op.source.string() + " disappeared" + (ec && ec != std::errc::no_such_file_or_directory ? " (" + ec.message() + ")" : "");
		return false;
	}
	if (op.isDirectory != fs::is_directory(source))
	{
		reason = "source " + op.source.string() + " changed type";
		return false;
	}

	if (!op.destination)
	{
		return true;
	}

	fs::file_status target = fs::symlink_status(*op.destination, ec);
	if (op.state == PlanState::OverwriteAllowed)
	{
		if (fs::is_directory(target))
		{
			reason = "destination " + op.destination->string() + " is now a folder";
			return false;
		}
		return true;
	}
	if (fs::exists(target))
	{
		reason = "destination " + op.destination->string() + " appeared since planning";
		return false;
	}
	return true;
}

// A free sibling of 'destination' to stage replacement content in
fs::path ExecutionEngine::StagingPath(const fs::path &destination)
{
	const fs::path parent = destination.has_parent_path() ? destination.parent_path() : fs::path(".");
	const std::string base = "." + destination.filename().string() + ".smv-staged";
	fs::path candidate = parent / base;
	for (int n = 1; PathExists(candidate); ++n)
	{
		candidate = parent / (base + std::to_string(n));
	}
	return candidate;
}

// Stages the new content beside the destination, then swaps it in;
// the destination is left untouched when staging fails
void ExecutionEngine::ReplaceDestination(const PlannedOperation &op, std::error_code &ec)
{
	const fs::path &destination = *op.destination;
	const fs::path staged = StagingPath(destination);

	if (op.kind == OperationKind::Copy)
	{
		CopyPath(op.source, staged, ec);
	}
	else
	{
		MovePath(op.source, staged, ec);
	}
	if (ec)
	{
		std::error_code cleanupEc;
		fs::remove_all(staged, cleanupEc);
		return;
	}

	// rename() replaces a file in one step but cannot put a folder over one
	if (op.isDirectory)
	{
		fs::remove(destination, ec);
	}
	if (!ec)
	{
		fs::rename(staged, destination, ec);
	}
	if (ec)
	{
		std::error_code rollbackEc;
		if (op.kind == OperationKind::Copy)
		{
			fs::remove_all(staged, rollbackEc);
		}
		else
		{
			MovePath(staged, op.source, rollbackEc);
		}
	}
}

// Performs one operation; an overwritten destination is already backed up
bool ExecutionEngine::Mutate(const PlannedOperation &op, std::error_code &ec)
{
	if (op.destination && op.state == PlanState::OverwriteAllowed)
	{
		ReplaceDestination(op, ec);
		return !ec;
	}

	switch (op.kind)
	{
	case OperationKind::Rename:
	case OperationKind::Move:
		MovePath(op.source, *op.destination, ec);
		break;
	case OperationKind::Copy:
		CopyPath(op.source, *op.destination, ec);
		break;
	case OperationKind::Remove:
		fs::remove_all(op.source, ec);
		break;
	case OperationKind::CreateDir:
		fs::create_directories(op.source, ec);
		break;
	case OperationKind::CreateFile:
	{
		if (op.source.has_parent_path())
		{
			fs::create_directories(op.source.parent_path(), ec);
		}
		if (!ec)
		{
			std::ofstream out(op.source, std::ios::binary);
			if (!out)
			{
				ec = std::make_error_code(std::errc::io_error);
			}
		}
		break;
	}
	}
	return !ec;
}

// After a failed mutation, puts back whatever the backup holds if the original is gone.
// Returns false when the backup has to stay because the original may be damaged.
bool ExecutionEngine::RecoverDestroyed(const PlannedOperation &op, const BackupRecord &backup, std::string &message)
{
	std::error_code ec;
	if (!PathExists(backup.originalPath))
	{
		std::string restoreError;
		if (!m_history.RestoreBackup(backup, restoreError))
		{
			message = restoreError + "; its backup is kept at " + backup.backupPath.string();
			return false;
		}
		message = "restored " + backup.originalPath.string() + " from its backup";
	}
	else if (op.kind == OperationKind::Remove)
	{
		message = backup.originalPath.string() + " may be partly removed; its backup is kept at " + backup.backupPath.string();
		return false;
	}

	fs::remove_all(backup.backupPath, ec);
	if (ec)
	{
		message += (message.empty() ? "" : "; ") + std::string("could not delete backup ") + backup.backupPath.string() + ": " + ec.message();
	}
	return true;
}

// Executes the plan in order, stopping at the first I/O failure
ExecutionReport ExecutionEngine::Execute(const std::vector<PlannedOperation> &plan, const FlagSet &flags, const std::string &label)
{
	ExecutionReport report;
	report.preview = flags.preview;

	const bool recordHistory = !flags.preview && m_history.IsAvailable();
	if (!flags.preview && !m_history.IsAvailable())
	{
		report.warningLog.push_back("History is unavailable (" + m_history.LastError() + "); this batch cannot be undone.");
	}

	HistoryEntry entry;
	if (recordHistory)
	{
		entry.sequenceId = m_history.ReserveSequence();
		entry.timestamp = TextUtils::CurrentTimestamp();
		entry.label = label;
	}

	std::size_t index = 0;
	bool backupKept = false;
	for (const auto &op : plan)
	{
		OperationResult result;
		result.operation = op;
		++index;

		if (report.aborted)
		{
			result.outcome = OperationOutcome::NotAttempted;
			report.results.push_back(result);
			continue;
		}

		if (op.state == PlanState::Conflict)
		{
			result.outcome = OperationOutcome::Excluded;
			result.message = op.reason;
			++report.conflictCount;
			report.results.push_back(result);
			continue;
		}
		if (op.state == PlanState::NoOp)
		{
			result.outcome = OperationOutcome::Unchanged;
			result.message = op.reason;
			++report.unchangedCount;
			report.results.push_back(result);
			continue;
		}
		if (flags.preview)
		{
			result.outcome = OperationOutcome::Previewed;
			result.message = op.state == PlanState::OverwriteAllowed ? "would overwrite " + op.destination->string() : "";
			report.results.push_back(result);
			continue;
		}

		std::string reason;
		if (!Revalidate(op, reason))
		{
			result.outcome = OperationOutcome::Skipped;
			result.message = reason;
			++report.skippedCount;
			report.warningLog.push_back("Skipped " + Describe(op) + ": " + reason);
			report.results.push_back(result);
			continue;
		}

		AppliedOperation applied;
		applied.kind = op.kind;
		applied.source = Absolute(op.source);
		if (op.destination)
		{
			applied.destination = Absolute(*op.destination);
		}
		applied.isDirectory = op.isDirectory;

		std::string failure;
		try
		{
			// Back up whatever this operation destroys
			if (recordHistory)
			{
				std::optional<fs::path> destroyed;
				if (op.kind == OperationKind::Remove)
				{
					destroyed = op.source;
				}
				else if (op.destination && op.state == PlanState::OverwriteAllowed)
				{
					destroyed = *op.destination;
				}

				if (destroyed)
				{
					BackupResult backup = m_history.CreateBackup(entry.sequenceId, index, *destroyed);
					if (backup.success)
					{
						applied.backup = backup.record;
					}
					else
					{
						failure = backup.errorMessage;
					}
				}
			}

			std::error_code ec;
			if (failure.empty() && !Mutate(op, ec))
			{
				failure = ec.message();
			}
		}
		catch (const fs::filesystem_error &ex)
		{
			failure = ex.what();
		}
		catch (const std::exception &ex)
		{
			failure = ex.what();
		}

		if (failure.empty())
		{
			result.outcome = OperationOutcome::Applied;
			++report.appliedCount;
			if (recordHistory)
			{
				entry.operations.push_back(applied);
			}
			wxLogVerbose("Applied %s", Describe(op).c_str());
		}
		else
		{
			result.outcome = OperationOutcome::Failed;
			result.message = failure;
			++report.failedCount;
			report.aborted = true;
			report.errorLog.push_back("Failed " + Describe(op) + ": " + failure);

			if (applied.backup)
			{
				std::string recovery;
				if (!RecoverDestroyed(op, *applied.backup, recovery))
				{
					backupKept = true;
				}
				if (!recovery.empty())
				{
					report.warningLog.push_back(recovery);
				}
			}
		}
		report.results.push_back(result);
	}

	if (recordHistory)
	{
		if (entry.operations.empty() && !backupKept)
		{
			// Backups taken before a failed first mutation are unreachable
			DeleteResult deleted = m_history.DeleteBackups(entry.sequenceId);
			if (!deleted.success)
			{
				report.warningLog.push_back(deleted.errorMessage);
			}
		}
		else
		{
			HistoryAppendResult appended = m_history.Append(entry);
			if (appended.success)
			{
				report.historySequence = entry.sequenceId;
				if (!appended.errorMessage.empty())
				{
					report.warningLog.push_back(appended.errorMessage);
				}
			}
			else
			{
				report.warningLog.push_back("Could not record batch in history: " + appended.errorMessage);
			}
		}
	}

	report.success = report.failedCount == 0;
	return report;
}
