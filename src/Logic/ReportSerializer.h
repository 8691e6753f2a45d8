#ifndef REPORTSERIALIZER_H
#define REPORTSERIALIZER_H

#include "SmartMoveTypes.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

struct OutputRow
{
	std::string action;
	std::string source;
	std::string destination;
	std::string status;
	std::string detail;
};

// Serializer-neutral view of what a command would print
struct OutputDocument
{
	std::string command;
	std::string path;
	bool preview = false;
	std::vector<OutputRow> rows;
	std::vector<std::string> files; // operated paths, handed to delegated tools
	std::vector<std::pair<std::string, std::size_t>> counts;
	std::string summary;
};

class ReportSerializer
{
public:
	static OutputDocument FromExecution(const ExecutionReport &report, const std::string &command, const fs::path &path);
	static OutputDocument FromUndo(const UndoResult &result);
	static OutputDocument FromHistory(const std::vector<HistoryEntry> &entries);

	static std::string Serialize(const OutputDocument &document, OutputFormat format);
	static std::string ToText(const OutputDocument &document);
	static std::string ToJson(const OutputDocument &document);
	static std::string ToYaml(const OutputDocument &document);
	static std::string ToCsv(const OutputDocument &document);

	static std::string EscapeCsvField(const std::string &field);
	static std::string Summarize(const ExecutionReport &report);
	static std::string OperationKindName(OperationKind kind);
	static std::string OutcomeName(OperationOutcome outcome);
};

#endif // REPORTSERIALIZER_H
