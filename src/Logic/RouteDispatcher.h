#ifndef ROUTEDISPATCHER_H
#define ROUTEDISPATCHER_H

#include "SmartMoveTypes.h"
#include "ReportSerializer.h"
#include "ToolDelegate.h"

#include <string>
#include <vector>

enum class EffectKind
{
	Delegate,
	WriteOutput,
	SelectFormat
};

struct RouteEffect
{
	EffectKind kind = EffectKind::SelectFormat;
	DelegateInvocation invocation; // Delegate, coreArgs filled at dispatch time
	fs::path outputPath;		   // WriteOutput
	OutputFormat format = OutputFormat::Text;
};

struct DispatchResult
{
	std::string printedOutput; // for stdout when no WriteOutput effect exists
	std::vector<fs::path> writtenFiles;
	std::vector<DelegationResult> delegations;
	std::vector<std::string> infoLog;
	std::vector<std::string> errorLog;
	bool delegationFailed = false;
	bool success = false;
};

class RouteDispatcher
{
public:
	static std::vector<RouteEffect> Resolve(const std::vector<RouteClause> &routes);
	static OutputFormat SelectedFormat(const std::vector<RouteEffect> &effects);

	// Preview skips WriteOutput and Delegate effects, reporting them instead
	static DispatchResult Dispatch(const std::vector<RouteEffect> &effects, const OutputDocument &document,
								   const fs::path &rootPath, bool preview, ToolDelegate *delegate);

private:
	static bool WriteOutputFile(const fs::path &path, const std::string &content, std::string &errorMessage);
};

#endif // ROUTEDISPATCHER_H
