#include "RouteDispatcher.h"

#include <wx/log.h>

#include <fstream>
#include <system_error>

// Maps route clauses to effect descriptors in the order given
std::vector<RouteEffect> RouteDispatcher::Resolve(const std::vector<RouteClause> &routes)
{
	std::vector<RouteEffect> effects;
	for (const auto &route : routes)
	{
		RouteEffect effect;
		switch (route.kind)
		{
		case RouteKind::To:
			effect.kind = EffectKind::Delegate;
			effect.invocation.tool = route.tool;
			effect.invocation.userArgs = route.args;
			break;
		case RouteKind::Into:
			effect.kind = EffectKind::WriteOutput;
			effect.outputPath = route.path;
			break;
		case RouteKind::Format:
			effect.kind = EffectKind::SelectFormat;
			effect.format = route.format;
			break;
		}
		effects.push_back(effect);
	}
	return effects;
}

// The last FORMAT wins; text when none is given
OutputFormat RouteDispatcher::SelectedFormat(const std::vector<RouteEffect> &effects)
{
	OutputFormat format = OutputFormat::Text;
	for (const auto &effect : effects)
	{
		if (effect.kind == EffectKind::SelectFormat)
		{
			format = effect.format;
		}
	}
	return format;
}

DispatchResult RouteDispatcher::Dispatch(const std::vector<RouteEffect> &effects, const OutputDocument &document,
										 const fs::path &rootPath, bool preview, ToolDelegate *delegate)
{
	DispatchResult result;
	const std::string rendered = ReportSerializer::Serialize(document, SelectedFormat(effects));
	bool wroteReport = false;

	for (const auto &effect : effects)
	{
		if (effect.kind != EffectKind::WriteOutput)
		{
			continue;
		}
		if (preview)
		{
			result.infoLog.push_back("Preview: report would be written to " + effect.outputPath.string() + ".");
			continue;
		}
		std::string errorMessage;
		if (WriteOutputFile(effect.outputPath, rendered, errorMessage))
		{
			result.writtenFiles.push_back(effect.outputPath);
			result.infoLog.push_back("Report written to " + effect.outputPath.string() + ".");
			wroteReport = true;
		}
		else
		{
			result.errorLog.push_back(errorMessage);
		}
	}

	if (!wroteReport)
	{
		result.printedOutput = rendered;
	}

	for (const auto &effect : effects)
	{
		if (effect.kind != EffectKind::Delegate)
		{
			continue;
		}

		DelegateInvocation invocation = effect.invocation;
		invocation.coreArgs.push_back(rootPath.string());
		invocation.coreArgs.insert(invocation.coreArgs.end(), document.files.begin(), document.files.end());

		if (preview)
		{
			result.infoLog.push_back("Preview: '" + invocation.tool + "' would be run on " +
									 std::to_string(document.files.size()) + " file(s).");
			continue;
		}
		if (!delegate)
		{
			result.errorLog.push_back("No delegate is available to run '" + invocation.tool + "'.");
			result.delegationFailed = true;
			continue;
		}

		wxLogVerbose("Delegating %d file(s) to '%s'", static_cast<int>(document.files.size()), invocation.tool.c_str());
		DelegationResult delegation = delegate->Delegate(invocation);
		for (const auto &line : delegation.outputLines)
		{
			result.printedOutput += line + "\n";
		}
		if (!delegation.success)
		{
			result.delegationFailed = true;
			std::string message = "Delegation to '" + invocation.tool + "' failed";
			if (!delegation.errorMessage.empty())
			{
				message += ": " + delegation.errorMessage;
			}
			else if (delegation.launched)
			{
				message += " with exit code " + std::to_string(delegation.exitCode);
			}
			result.errorLog.push_back(message);
			// Tool diagnostics are surfaced as they were produced
			result.errorLog.insert(result.errorLog.end(), delegation.errorLines.begin(), delegation.errorLines.end());
		}
		result.delegations.push_back(std::move(delegation));
	}

	result.success = result.errorLog.empty();
	return result;
}

bool RouteDispatcher::WriteOutputFile(const fs::path &path, const std::string &content, std::string &errorMessage)
{
	std::error_code ec;
	if (path.has_parent_path() && !fs::exists(path.parent_path(), ec))
	{
		errorMessage = "Cannot write report: folder " + path.parent_path().string() + " does not exist.";
		return false;
	}

	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out)
	{
		errorMessage = "Cannot open " + path.string() + " for writing.";
		return false;
	}
	out << content;
	out.close();
	if (!out)
	{
		errorMessage = "Failed writing report to " + path.string() + ".";
		return false;
	}
	return true;
}
