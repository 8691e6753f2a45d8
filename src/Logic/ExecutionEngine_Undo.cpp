#include "ExecutionEngine.h"
#include "ReportSerializer.h"

#include <wx/log.h>

#include <algorithm>
#include <stdexcept>

// Applies the inverse of one recorded operation
bool ExecutionEngine::Reverse(const AppliedOperation &op, HistoryStore &history, std::string &errorMessage)
{
	std::error_code ec;

	switch (op.kind)
	{
	case OperationKind::Rename:
	case OperationKind::Move:
	{
		if (!op.destination || !PathExists(*op.destination))
		{
			errorMessage = "moved entry is gone";
			return false;
		}
		if (PathExists(op.source))
		{
			errorMessage = "original location " + op.source.string() + " is occupied";
			return false;
		}
		if (op.source.has_parent_path())
		{
			fs::create_directories(op.source.parent_path(), ec);
			if (ec)
			{
				errorMessage = ec.message();
				return false;
			}
		}
		MovePath(*op.destination, op.source, ec);
		if (ec)
		{
			errorMessage = ec.message();
			return false;
		}
		break;
	}
	case OperationKind::Copy:
		if (!op.destination)
		{
			errorMessage = "copy without destination";
			return false;
		}
		fs::remove_all(*op.destination, ec);
		if (ec)
		{
			errorMessage = ec.message();
			return false;
		}
		break;
	case OperationKind::Remove:
		if (!op.backup)
		{
			errorMessage = "no backup was taken";
			return false;
		}
		return history.RestoreBackup(*op.backup, errorMessage);
	case OperationKind::CreateDir:
	{
		if (!PathExists(op.source))
		{
			break;
		}
		bool bEmpty = fs::is_empty(op.source, ec);
		if (ec)
		{
			errorMessage = ec.message();
			return false;
		}
		if (!bEmpty)
		{
			errorMessage = "folder " + op.source.string() + " is no longer empty";
			return false;
		}
		fs::remove(op.source, ec);
		if (ec)
		{
			errorMessage = ec.message();
			return false;
		}
		break;
	}
	case OperationKind::CreateFile:
		fs::remove(op.source, ec);
		if (ec)
		{
			errorMessage = ec.message();
			return false;
		}
		break;
	}

	// An overwritten destination comes back once the entry that replaced it is gone
	if (op.backup && op.kind != OperationKind::Remove)
	{
		return history.RestoreBackup(*op.backup, errorMessage);
	}
	return true;
}

UndoResult ExecutionEngine::Undo()
{
	UndoResult result;

	if (!m_history.IsAvailable())
	{
		result.historyError = true;
		result.errorMessage = "History is unavailable: " + m_history.LastError();
		return result;
	}

	std::optional<HistoryEntry> entry = m_history.LatestUndoable();
	if (!entry)
	{
		result.historyError = true;
		result.errorMessage = "Nothing to undo.";
		return result;
	}
	result.sequenceId = entry->sequenceId;

	std::vector<AppliedOperation> operations = entry->operations;
	std::reverse(operations.begin(), operations.end());

	bool anyFailure = false;
	for (const auto &op : operations)
	{
		const std::string name = ReportSerializer::OperationKindName(op.kind) + " " + op.source.string() +
								 (op.destination ? " -> " + op.destination->string() : "");
		try
		{
			std::string error;
			if (Reverse(op, m_history, error))
			{
				result.successfulUndos.push_back({name, "reverted"});
				wxLogVerbose("Reverted %s", name.c_str());
			}
			else
			{
				result.failedUndos.push_back({name, error});
				anyFailure = true;
			}
		}
		catch (const fs::filesystem_error &ex)
		{
			result.failedUndos.push_back({name, "Filesystem error: " + std::string(ex.what())});
			anyFailure = true;
		}
		catch (const std::exception &ex)
		{
			result.failedUndos.push_back({name, ex.what()});
			anyFailure = true;
		}
	}

	std::string markError;
	if (!m_history.MarkUndone(entry->sequenceId, markError))
	{
		result.historyError = true;
		result.errorMessage = markError;
		anyFailure = true;
	}

	if (!anyFailure)
	{
		DeleteResult deleted = m_history.DeleteBackups(entry->sequenceId);
		if (!deleted.success)
		{
			wxLogWarning("Could not delete backups of batch #%s: %s", std::to_string(entry->sequenceId).c_str(), deleted.errorMessage.c_str());
		}
	}

	result.overallSuccess = !anyFailure;
	return result;
}
