#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include "SmartMoveTypes.h"
#include "Settings.h"
#include "FilterEvaluator.h"
#include "ReportSerializer.h"
#include "SemanticGroups.h"
#include "ToolDelegate.h"

#include <functional>
#include <string>
#include <vector>

// Process exit statuses
enum class ExitStatus
{
	Success = 0,
	GeneralError = 1,
	InvalidCommand = 2, // parse errors and bad filter or regex literals
	FileOperationFailed = 3
};

struct RunResult
{
	ExitStatus status = ExitStatus::Success;
	std::string output; // goes to stdout
	std::vector<std::string> errorLog;
	std::vector<std::string> warningLog;
};

// Shows the preview text and returns true to apply it
using ConfirmCallback = std::function<bool(const std::string &previewText)>;

// Drives one invocation: parse, scan, plan, execute, then route the report
class CommandRunner
{
public:
	CommandRunner(const Settings &settings, ToolDelegate *delegate, ConfirmCallback confirm = nullptr);

	RunResult Run(const std::vector<std::string> &tokens);
	RunResult Run(const std::string &raw);

	const SemanticGroupRegistry &Registry() const { return m_registry; }

	// Entries of the snapshot the command acts on
	static std::vector<FileMetadata> SelectCandidates(const ParsedCommand &parsed, const FileSnapshot &snapshot, const FilterPredicate &predicate);
	static std::string JoinTokens(const std::vector<std::string> &tokens);

private:
	RunResult RunParsed(const ParsedCommand &parsed, const std::string &label);
	RunResult RunUndo(const ParsedCommand &parsed);
	RunResult RunHistory(const ParsedCommand &parsed);
	void Route(const ParsedCommand &parsed, const OutputDocument &document, RunResult &result);

	Settings m_settings;
	SemanticGroupRegistry m_registry;
	ToolDelegate *m_delegate;
	ConfirmCallback m_confirm;
};

#endif // COMMANDRUNNER_H
