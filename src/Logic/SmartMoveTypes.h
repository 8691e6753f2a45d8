#ifndef SMARTMOVETYPES_H
#define SMARTMOVETYPES_H

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

enum class CommandKind
{
	CaseTransform,
	Clean,
	Split,
	Change,
	Regex,
	StripPrefix,
	Move,
	Copy,
	Remove,
	CreateDir,
	CreateFile,
	Group,
	Flatten,
	Undo,
	History
};

enum class CaseStyle
{
	Snake,
	Kebab,
	Title,
	Camel,
	Pascal,
	Lower,
	Upper,
	Sentence,
	Studly,
	Start
};

struct Command
{
	CommandKind kind = CommandKind::CaseTransform;
	CaseStyle style = CaseStyle::Snake; // CaseTransform and Split
	std::string oldText;				// CHANGE find text, REGEX pattern, STRIP prefix
	std::string newText;				// CHANGE and REGEX replacement
	bool isRemoval = false;				// CHANGE with an empty replacement, reporting only
	fs::path destination;				// Move and Copy
};

// ---------------------------------------------------------------------------
// Filters, routes and flags
// ---------------------------------------------------------------------------

enum class FilterKeyword
{
	Name,
	Type,
	Ext,
	Size,
	Depth,
	Modified,
	Accessed,
	For
};

enum class FilterComparator
{
	Equals,
	Greater,
	Less
};

struct FilterClause
{
	FilterKeyword keyword = FilterKeyword::Name;
	FilterComparator comparator = FilterComparator::Equals;
	std::string value;
};

enum class RouteKind
{
	To,
	Into,
	Format
};

enum class OutputFormat
{
	Text,
	Json,
	Csv,
	Yaml
};

struct RouteClause
{
	RouteKind kind = RouteKind::Into;
	std::string tool;			   // To
	std::vector<std::string> args; // To, in the order given
	fs::path path;				   // Into
	OutputFormat format = OutputFormat::Text;
};

struct FlagSet
{
	bool recursive = false;		// -r
	bool preview = false;		// -p
	bool force = false;			// -f
	bool interactive = false;	// -I
	bool tui = false;			// -T
	bool undo = false;			// -u
	bool includeHidden = false; // -a
	bool ignoreCase = false;	// -i
	bool verbose = false;		// -v
};

struct ParsedCommand
{
	Command command;
	fs::path path = ".";
	bool pathDefaulted = true;
	std::vector<FilterClause> filters;
	std::vector<RouteClause> routes;
	FlagSet flags;
};

enum class ParseErrorKind
{
	None,
	UnknownCommand,
	MalformedFilter,
	MalformedRoute,
	UnknownFlag,
	MissingOperand,
	UnterminatedQuote,
	UnexpectedToken
};

struct ParseError
{
	ParseErrorKind kind = ParseErrorKind::None;
	std::string keyword; // MalformedFilter
	std::string raw;	 // offending token
	char flag = '\0';	 // UnknownFlag
	std::string message;
};

struct ParseResult
{
	ParsedCommand command;
	ParseError error;
	bool success = false;
};

// ---------------------------------------------------------------------------
// File metadata snapshot
// ---------------------------------------------------------------------------

enum class FileType
{
	File,
	Folder,
	Symlink,
	Other
};

struct FileMetadata
{
	fs::path path;
	std::string name;
	FileType type = FileType::File;
	std::uintmax_t size = 0;
	int depth = 0; // relative to the scanned root, direct children are 1
	std::time_t modifiedTime = 0;
	std::time_t accessedTime = 0;
};

struct FileSnapshot
{
	fs::path root;
	std::optional<FileMetadata> rootInfo;
	std::vector<FileMetadata> entries;			// visible entries below the root, sorted by path
	std::map<fs::path, FileType> occupiedPaths; // every path seen, hidden entries included
	std::optional<FileMetadata> destinationInfo;
	std::vector<std::string> warningLog;
	bool success = false;
	std::string errorMessage;
};

// ---------------------------------------------------------------------------
// Planning and execution
// ---------------------------------------------------------------------------

enum class OperationKind
{
	Rename,
	Move,
	Copy,
	Remove,
	CreateDir,
	CreateFile
};

enum class PlanState
{
	Ready,
	NoOp,
	Conflict,
	OverwriteAllowed
};

struct PlannedOperation
{
	fs::path source;
	std::optional<fs::path> destination;
	OperationKind kind = OperationKind::Rename;
	PlanState state = PlanState::Ready;
	bool isDirectory = false;
	std::string reason; // why the operation is a Conflict or NoOp
};

struct PlanResult
{
	std::vector<PlannedOperation> operations;
	std::vector<std::string> infoLog;
	std::vector<std::string> warningLog;
	bool success = false;
	std::string errorMessage;
};

enum class OperationOutcome
{
	Applied,
	Previewed,
	Unchanged,	 // NoOp
	Excluded,	 // Conflict
	Skipped,	 // re-validation mismatch
	Failed,		 // I/O error, stops the batch
	NotAttempted // after a failure
};

struct OperationResult
{
	PlannedOperation operation;
	OperationOutcome outcome = OperationOutcome::NotAttempted;
	std::string message;
};

struct ExecutionReport
{
	bool preview = false;
	std::vector<OperationResult> results;
	std::size_t appliedCount = 0;
	std::size_t unchangedCount = 0;
	std::size_t conflictCount = 0;
	std::size_t skippedCount = 0;
	std::size_t failedCount = 0;
	bool aborted = false;
	std::optional<std::uint64_t> historySequence;
	std::vector<std::string> warningLog;
	std::vector<std::string> errorLog;
	bool success = false;
};

// ---------------------------------------------------------------------------
// History and backups
// ---------------------------------------------------------------------------

struct BackupRecord
{
	fs::path originalPath;
	fs::path backupPath;
};

struct AppliedOperation
{
	OperationKind kind = OperationKind::Rename;
	fs::path source;
	std::optional<fs::path> destination;
	bool isDirectory = false;
	std::optional<BackupRecord> backup;
};

struct HistoryEntry
{
	std::uint64_t sequenceId = 0;
	std::string timestamp;
	std::string label;
	std::vector<AppliedOperation> operations;
	bool undone = false;
};

struct BackupResult
{
	BackupRecord record;
	bool success = false;
	std::string errorMessage;
};

struct DeleteResult
{
	bool success = false;
	std::string errorMessage;
};

struct UndoResult
{
	std::optional<std::uint64_t> sequenceId;
	std::vector<std::pair<std::string, std::string>> successfulUndos;
	std::vector<std::pair<std::string, std::string>> failedUndos;
	bool historyError = false; // log unavailable or nothing to undo
	std::string errorMessage;
	bool overallSuccess = false;
};

#endif // SMARTMOVETYPES_H
