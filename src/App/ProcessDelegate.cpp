#include "ProcessDelegate.h"

#include <wx/arrstr.h>
#include <wx/log.h>
#include <wx/utils.h>

// Double quotes every argument, escaping quotes and backslashes
std::string ProcessDelegate::QuoteArgument(const std::string &argument)
{
	std::string quoted = "\"";
	for (char c : argument)
	{
		if (c == '"' || c == '\\')
		{
			quoted += '\\';
		}
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

// tool, then the core arguments, then the user arguments in order
std::string ProcessDelegate::BuildCommandLine(const DelegateInvocation &invocation)
{
	std::string commandLine = QuoteArgument(invocation.tool);
	for (const auto &arg : invocation.coreArgs)
	{
		commandLine += " " + QuoteArgument(arg);
	}
	for (const auto &arg : invocation.userArgs)
	{
		commandLine += " " + QuoteArgument(arg);
	}
	return commandLine;
}

DelegationResult ProcessDelegate::Delegate(const DelegateInvocation &invocation)
{
	DelegationResult result;

	if (invocation.tool.empty())
	{
		result.errorMessage = "No tool name given.";
		return result;
	}

	const std::string commandLine = BuildCommandLine(invocation);
	wxLogVerbose("Running %s", commandLine.c_str());

	wxArrayString output, errors;
	long exitCode = wxExecute(wxString::FromUTF8(commandLine.c_str()), output, errors, wxEXEC_SYNC | wxEXEC_NODISABLE);

	for (const auto &line : output)
	{
		result.outputLines.push_back(line.ToStdString());
	}
	for (const auto &line : errors)
	{
		result.errorLines.push_back(line.ToStdString());
	}

	if (exitCode == -1)
	{
		result.errorMessage = "Could not run '" + invocation.tool + "'.";
		return result;
	}

	result.launched = true;
	result.exitCode = static_cast<int>(exitCode);
	if (result.exitCode != 0)
	{
		result.errorMessage = "'" + invocation.tool + "' exited with status " + std::to_string(result.exitCode) + ".";
		return result;
	}

	result.success = true;
	return result;
}
