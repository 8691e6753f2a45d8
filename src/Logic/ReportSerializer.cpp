#include "ReportSerializer.h"

#include <sstream>

// Builds the printable report of an execution or preview
OutputDocument ReportSerializer::FromExecution(const ExecutionReport &report, const std::string &command, const fs::path &path)
{
	OutputDocument document;
	document.command = command;
	document.path = path.string();
	document.preview = report.preview;

	for (const auto &result : report.results)
	{
		const PlannedOperation &op = result.operation;
		OutputRow row;
		row.action = OperationKindName(op.kind);
		row.source = op.source.string();
		row.destination = op.destination ? op.destination->string() : std::string();
		row.status = OutcomeName(result.outcome);
		row.detail = result.message.empty() ? op.reason : result.message;
		if (result.outcome == OperationOutcome::Previewed && op.state == PlanState::OverwriteAllowed)
		{
			row.detail = "overwrites existing destination";
		}
		document.rows.push_back(row);

		if (result.outcome == OperationOutcome::Applied || result.outcome == OperationOutcome::Unchanged)
		{
			// Removed entries no longer exist, the tool gets nothing for them
			if (op.kind == OperationKind::Remove)
			{
				continue;
			}
			document.files.push_back(op.destination ? op.destination->string() : op.source.string());
		}
	}

	document.counts = {
		{"applied", report.appliedCount},
		{"unchanged", report.unchangedCount},
		{"conflicts", report.conflictCount},
		{"skipped", report.skippedCount},
		{"failed", report.failedCount},
	};
	document.summary = Summarize(report);
	return document;
}

OutputDocument ReportSerializer::FromUndo(const UndoResult &result)
{
	OutputDocument document;
	document.command = "undo";
	for (const auto &undone : result.successfulUndos)
	{
		document.rows.push_back({"undo", undone.first, "", "restored", undone.second});
	}
	for (const auto &failed : result.failedUndos)
	{
		document.rows.push_back({"undo", failed.first, "", "failed", failed.second});
	}
	document.counts = {
		{"restored", result.successfulUndos.size()},
		{"failed", result.failedUndos.size()},
	};

	if (result.historyError)
	{
		document.summary = result.errorMessage;
	}
	else if (result.overallSuccess)
	{
		document.summary = "Undid batch #" + std::to_string(result.sequenceId.value_or(0)) + ".";
	}
	else
	{
		document.summary = "Undo of batch #" + std::to_string(result.sequenceId.value_or(0)) + " was incomplete: " +
						   std::to_string(result.failedUndos.size()) + " operation(s) could not be reversed; their backups were kept.";
	}
	return document;
}

OutputDocument ReportSerializer::FromHistory(const std::vector<HistoryEntry> &entries)
{
	OutputDocument document;
	document.command = "history";
	size_t live = 0;
	for (const auto &entry : entries)
	{
		OutputRow row;
		row.action = "batch";
		row.source = "#" + std::to_string(entry.sequenceId);
		row.destination = entry.label;
		row.status = entry.undone ? "undone" : "live";
		row.detail = entry.timestamp + ", " + std::to_string(entry.operations.size()) + " operation(s)";
		document.rows.push_back(row);
		if (!entry.undone)
		{
			++live;
		}
	}
	document.counts = {
		{"entries", entries.size()},
		{"undoable", live},
	};
	document.summary = entries.empty() ? "History is empty." : std::to_string(entries.size()) + " history entries.";
	return document;
}

std::string ReportSerializer::Serialize(const OutputDocument &document, OutputFormat format)
{
	switch (format)
	{
	case OutputFormat::Json:
		return ToJson(document);
	case OutputFormat::Yaml:
		return ToYaml(document);
	case OutputFormat::Csv:
		return ToCsv(document);
	case OutputFormat::Text:
	default:
		return ToText(document);
	}
}

// Human readable report, the default output
std::string ReportSerializer::ToText(const OutputDocument &document)
{
	std::ostringstream out;
	if (!document.command.empty())
	{
		out << (document.preview ? "Preview of " : "") << document.command;
		if (!document.path.empty())
		{
			out << " " << document.path;
		}
		out << "\n";
	}
	for (const auto &row : document.rows)
	{
		out << "  [" << row.status << "] " << row.action << " " << row.source;
		if (!row.destination.empty())
		{
			out << " -> " << row.destination;
		}
		if (!row.detail.empty())
		{
			out << " (" << row.detail << ")";
		}
		out << "\n";
	}
	if (!document.summary.empty())
	{
		out << document.summary << "\n";
	}
	return out.str();
}

std::string ReportSerializer::ToCsv(const OutputDocument &document)
{
	std::ostringstream out;
	out << "action,source,destination,status,detail\r\n";
	for (const auto &row : document.rows)
	{
		out << EscapeCsvField(row.action) << ',' << EscapeCsvField(row.source) << ',' << EscapeCsvField(row.destination) << ','
			<< EscapeCsvField(row.status) << ',' << EscapeCsvField(row.detail) << "\r\n";
	}
	return out.str();
}

// RFC 4180: quote fields containing separators, quotes or line breaks, doubling inner quotes
std::string ReportSerializer::EscapeCsvField(const std::string &field)
{
	if (field.find_first_of(",\"\r\n") == std::string::npos)
	{
		return field;
	}
	std::string quoted = "\"";
	for (char c : field)
	{
		if (c == '"')
		{
			quoted += '"';
		}
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

// One line telling "nothing happened" apart from a partial batch
std::string ReportSerializer::Summarize(const ExecutionReport &report)
{
	const std::string counts = std::to_string(report.conflictCount) + " conflict(s), " +
							   std::to_string(report.unchangedCount) + " unchanged";
	if (report.preview)
	{
		size_t planned = 0;
		for (const auto &result : report.results)
		{
			if (result.outcome == OperationOutcome::Previewed)
			{
				++planned;
			}
		}
		return "Preview: " + std::to_string(planned) + " operation(s) planned, " + counts + ". Nothing was changed.";
	}
	if (report.aborted)
	{
		size_t notAttempted = 0;
		for (const auto &result : report.results)
		{
			if (result.outcome == OperationOutcome::NotAttempted)
			{
				++notAttempted;
			}
		}
		return "Partial batch: " + std::to_string(report.appliedCount) + " applied before a failure, " +
			   std::to_string(notAttempted) + " not attempted, " + counts + ".";
	}
	if (report.appliedCount == 0)
	{
		return "Nothing was changed (" + counts + ", " + std::to_string(report.skippedCount) + " skipped).";
	}
	std::string summary = std::to_string(report.appliedCount) + " operation(s) applied, " + counts + ", " +
						  std::to_string(report.skippedCount) + " skipped.";
	if (report.historySequence)
	{
		summary += " Recorded as batch #" + std::to_string(*report.historySequence) + ".";
	}
	return summary;
}

std::string ReportSerializer::OperationKindName(OperationKind kind)
{
	switch (kind)
	{
	case OperationKind::Rename:
		return "rename";
	case OperationKind::Move:
		return "move";
	case OperationKind::Copy:
		return "copy";
	case OperationKind::Remove:
		return "remove";
	case OperationKind::CreateDir:
		return "mkdir";
	case OperationKind::CreateFile:
		return "touch";
	}
	return "unknown";
}

std::string ReportSerializer::OutcomeName(OperationOutcome outcome)
{
	switch (outcome)
	{
	case OperationOutcome::Applied:
		return "applied";
	case OperationOutcome::Previewed:
		return "preview";
	case OperationOutcome::Unchanged:
		return "unchanged";
	case OperationOutcome::Excluded:
		return "conflict";
	case OperationOutcome::Skipped:
		return "skipped";
	case OperationOutcome::Failed:
		return "failed";
	case OperationOutcome::NotAttempted:
		return "not-attempted";
	}
	return "unknown";
}
