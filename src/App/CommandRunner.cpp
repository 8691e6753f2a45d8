#include "CommandRunner.h"
#include "ExecutionEngine.h"
#include "FileScanner.h"
#include "GrammarParser.h"
#include "HistoryStore.h"
#include "NameTransformer.h"
#include "OperationPlanner.h"
#include "RouteDispatcher.h"

#include <wx/log.h>

namespace
{
	void Warn(RunResult &result, const std::string &message)
	{
		result.warningLog.push_back(message);
		wxLogWarning("%s", message.c_str());
	}

	void Fail(RunResult &result, ExitStatus status, const std::string &message)
	{
		result.status = status;
		result.errorLog.push_back(message);
	}

	bool HasApplicableOperations(const PlanResult &plan)
	{
		for (const auto &op : plan.operations)
		{
			if (op.state == PlanState::Ready || op.state == PlanState::OverwriteAllowed)
			{
				return true;
			}
		}
		return false;
	}
}

CommandRunner::CommandRunner(const Settings &settings, ToolDelegate *delegate, ConfirmCallback confirm)
	: m_settings(settings),
	  m_delegate(delegate),
	  m_confirm(confirm)
{
	m_settings.RegisterGroups(m_registry);
}

std::string CommandRunner::JoinTokens(const std::vector<std::string> &tokens)
{
	std::string joined;
	for (const auto &token : tokens)
	{
		if (!joined.empty())
		{
			joined += ' ';
		}
		// Keep the label readable when a token was quoted on the shell
		if (token.empty() || token.find(' ') != std::string::npos)
		{
			joined += "\"" + token + "\"";
		}
		else
		{
			joined += token;
		}
	}
	return joined;
}

RunResult CommandRunner::Run(const std::string &raw)
{
	GrammarParser parser(m_registry);
	ParseResult parsed = parser.Parse(raw);
	if (!parsed.success)
	{
		RunResult result;
		Fail(result, ExitStatus::InvalidCommand, "Parse error (" + GrammarParser::ErrorKindName(parsed.error.kind) + "): " + parsed.error.message);
		return result;
	}
	return RunParsed(parsed.command, raw);
}

RunResult CommandRunner::Run(const std::vector<std::string> &tokens)
{
	GrammarParser parser(m_registry);
	ParseResult parsed = parser.Parse(tokens);
	if (!parsed.success)
	{
		RunResult result;
		Fail(result, ExitStatus::InvalidCommand, "Parse error (" + GrammarParser::ErrorKindName(parsed.error.kind) + "): " + parsed.error.message);
		return result;
	}
	return RunParsed(parsed.command, JoinTokens(tokens));
}

// With no filters, mv, cp and rm act on PATH itself; otherwise on the matches below it
std::vector<FileMetadata> CommandRunner::SelectCandidates(const ParsedCommand &parsed, const FileSnapshot &snapshot, const FilterPredicate &predicate)
{
	std::vector<FileMetadata> candidates;
	const CommandKind kind = parsed.command.kind;
	const bool operandIsPath = (kind == CommandKind::Move || kind == CommandKind::Copy || kind == CommandKind::Remove) &&
							   parsed.filters.empty();

	if (operandIsPath)
	{
		if (snapshot.rootInfo)
		{
			candidates.push_back(*snapshot.rootInfo);
		}
		return candidates;
	}

	for (const auto &entry : snapshot.entries)
	{
		if (predicate(entry))
		{
			candidates.push_back(entry);
		}
	}
	return candidates;
}

RunResult CommandRunner::RunParsed(const ParsedCommand &parsed, const std::string &label)
{
	RunResult result;
	const Command &command = parsed.command;
	const FlagSet &flags = parsed.flags;

	wxLogVerbose("Command '%s' on '%s'", GrammarParser::CommandName(command).c_str(), parsed.path.string().c_str());

	if (flags.tui)
	{
		Fail(result, ExitStatus::GeneralError, "The terminal browser (-T) is not available in this build.");
		return result;
	}
	if (command.kind == CommandKind::Undo)
	{
		return RunUndo(parsed);
	}
	if (command.kind == CommandKind::History)
	{
		return RunHistory(parsed);
	}

	FilterCompileResult compiled = FilterEvaluator::Compile(parsed.filters, flags.ignoreCase, &m_registry);
	if (!compiled.success)
	{
		Fail(result, ExitStatus::InvalidCommand, "Invalid filter: " + compiled.errorMessage);
		return result;
	}

	std::unique_ptr<NameTransform> transform;
	if (NameTransformer::IsNamingCommand(command.kind))
	{
		TransformBuildResult built = NameTransformer::Build(command, flags.ignoreCase);
		if (!built.success)
		{
			Fail(result, ExitStatus::InvalidCommand, built.errorMessage);
			return result;
		}
		transform = std::move(built.transform);
	}

	ScanOptions options;
	options.root = parsed.path;
	options.recursive = flags.recursive || command.kind == CommandKind::Flatten;
	options.includeHidden = flags.includeHidden || m_settings.includeHidden;
	options.threads = m_settings.scanThreads;
	if ((command.kind == CommandKind::Move || command.kind == CommandKind::Copy || command.kind == CommandKind::Remove) && parsed.filters.empty())
	{
		options.recursive = false;
	}

	FileSnapshot snapshot = FileScanner::Scan(options);
	for (const auto &warning : snapshot.warningLog)
	{
		Warn(result, warning);
	}
	if (!snapshot.success)
	{
		Fail(result, ExitStatus::FileOperationFailed, "Cannot scan " + parsed.path.string() + ": " + snapshot.errorMessage);
		return result;
	}
	const bool creates = command.kind == CommandKind::CreateDir || command.kind == CommandKind::CreateFile;
	if (!snapshot.rootInfo && !creates)
	{
		Fail(result, ExitStatus::FileOperationFailed, "Path " + parsed.path.string() + " does not exist.");
		return result;
	}
	if (command.kind == CommandKind::Move || command.kind == CommandKind::Copy)
	{
		FileScanner::ProbeDestination(snapshot, command.destination);
	}

	std::vector<FileMetadata> candidates = SelectCandidates(parsed, snapshot, compiled.predicate);
	wxLogVerbose("%d of %d entries selected", static_cast<int>(candidates.size()), static_cast<int>(snapshot.entries.size()));

	PlanningContext context;
	context.root = snapshot.root;
	context.snapshot = &snapshot;
	context.transform = transform.get();

	PlanResult plan = OperationPlanner::Plan(candidates, command, flags, context);
	for (const auto &warning : plan.warningLog)
	{
		Warn(result, warning);
	}
	if (!plan.success)
	{
		Fail(result, ExitStatus::GeneralError, plan.errorMessage);
		return result;
	}
	for (const auto &op : plan.operations)
	{
		if (op.state == PlanState::Conflict)
		{
			Warn(result, "Conflict: " + ExecutionEngine::Describe(op) + ": " + op.reason);
		}
	}

	HistoryStore history(m_settings.historyRoot, m_settings.maxHistoryEntries);
	if (!flags.preview && !history.Load())
	{
		Warn(result, history.LastError());
	}
	ExecutionEngine engine(history);

	if (flags.interactive && !flags.preview && HasApplicableOperations(plan))
	{
		FlagSet previewFlags = flags;
		previewFlags.preview = true;
		ExecutionReport preview = engine.Execute(plan.operations, previewFlags, label);
		const std::string previewText = ReportSerializer::ToText(ReportSerializer::FromExecution(preview, label, parsed.path));
		if (!m_confirm || !m_confirm(previewText))
		{
			result.output = "Cancelled. Nothing was changed.\n";
			return result;
		}
	}

	ExecutionReport report = engine.Execute(plan.operations, flags, label);
	for (const auto &warning : report.warningLog)
	{
		Warn(result, warning);
	}
	for (const auto &error : report.errorLog)
	{
		Fail(result, ExitStatus::FileOperationFailed, error);
	}
	if (report.historySequence)
	{
		wxLogVerbose("Recorded batch #%s", std::to_string(*report.historySequence).c_str());
	}

	Route(parsed, ReportSerializer::FromExecution(report, label, parsed.path), result);
	return result;
}

RunResult CommandRunner::RunUndo(const ParsedCommand &parsed)
{
	RunResult result;

	HistoryStore history(m_settings.historyRoot, m_settings.maxHistoryEntries);
	if (!history.Load())
	{
		Fail(result, ExitStatus::GeneralError, history.LastError());
		return result;
	}

	if (parsed.flags.preview)
	{
		std::optional<HistoryEntry> latest = history.LatestUndoable();
		if (!latest)
		{
			Fail(result, ExitStatus::GeneralError, "Nothing to undo.");
			return result;
		}
		OutputDocument document = ReportSerializer::FromHistory({*latest});
		document.command = "undo";
		document.preview = true;
		document.summary = "Preview: batch #" + std::to_string(latest->sequenceId) + " would be undone. Nothing was changed.";
		Route(parsed, document, result);
		return result;
	}

	ExecutionEngine engine(history);
	UndoResult undone = engine.Undo();
	if (undone.historyError)
	{
		Fail(result, ExitStatus::GeneralError, undone.errorMessage);
	}
	else if (!undone.overallSuccess)
	{
		for (const auto &failed : undone.failedUndos)
		{
			Fail(result, ExitStatus::FileOperationFailed, "Could not undo " + failed.first + ": " + failed.second);
		}
	}

	Route(parsed, ReportSerializer::FromUndo(undone), result);
	return result;
}

RunResult CommandRunner::RunHistory(const ParsedCommand &parsed)
{
	RunResult result;

	HistoryStore history(m_settings.historyRoot, m_settings.maxHistoryEntries);
	if (!history.Load())
	{
		Fail(result, ExitStatus::GeneralError, history.LastError());
		return result;
	}

	Route(parsed, ReportSerializer::FromHistory(history.Entries()), result);
	return result;
}

// Formats the report, then writes it and hands the files to delegated tools
void CommandRunner::Route(const ParsedCommand &parsed, const OutputDocument &document, RunResult &result)
{
	std::vector<RouteEffect> effects = RouteDispatcher::Resolve(parsed.routes);
	DispatchResult dispatched = RouteDispatcher::Dispatch(effects, document, parsed.path, parsed.flags.preview, m_delegate);

	result.output += dispatched.printedOutput;
	for (const auto &info : dispatched.infoLog)
	{
		wxLogMessage("%s", info.c_str());
	}
	for (const auto &error : dispatched.errorLog)
	{
		result.errorLog.push_back(error);
	}

	if (result.status == ExitStatus::Success && !dispatched.success)
	{
		result.status = dispatched.delegationFailed ? ExitStatus::GeneralError : ExitStatus::FileOperationFailed;
	}
}
