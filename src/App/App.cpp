#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif
#include "App.h"
#include "CommandRunner.h"
#include "GrammarParser.h"
#include "ProcessDelegate.h"
#include "Settings.h"

#include <wx/log.h>

#include <iostream>

wxIMPLEMENT_APP_CONSOLE(App);

bool App::OnInit()
{
	SetAppName("smartmove");

	// The base OnInit would reject the command grammar's flags as unknown options
	delete wxLog::SetActiveTarget(new wxLogStderr());
	wxLog::DisableTimestamp();
	return true;
}

std::string App::Usage()
{
	return "Usage: smv <COMMAND> [PATH] [FILTER]... [ROUTE]... [FLAG]...\n"
		   "\n"
		   "Commands:\n"
		   "  snake kebab title camel pascal lower upper sentence studly start clean\n"
		   "  split <style>                 split case humps, then apply <style>\n"
		   "  CHANGE \"old\" INTO \"new\"       replace every occurrence\n"
		   "  REGEX \"pattern\" INTO \"rep\"    ECMAScript substitution ($1, $&)\n"
		   "  STRIP \"prefix\"                remove a leading prefix\n"
		   "  mv <PATH> [INTO] <DEST>       move (also: move)\n"
		   "  cp <PATH> [INTO] <DEST>       copy (also: copy)\n"
		   "  rm mkdir touch group flatten undo history\n"
		   "\n"
		   "Filters:  NAME: TYPE: EXT: FOR:  SIZE DEPTH MODIFIED ACCESSED with : > <\n"
		   "Routes:   TO:tool[:arg,...]  INTO:path  FORMAT:json|csv|yaml|text\n"
		   "Flags:    -r recursive  -p preview  -f force  -I confirm  -T browser\n"
		   "          -u undo  -a hidden  -i ignore case  -v verbose\n"
		   "\n"
		   "Examples:\n"
		   "  smv snake . EXT:md -p\n"
		   "  smv CHANGE \"IMG_\" INTO \"\" photos EXT:jpg\n"
		   "  smv mv notes INTO archive/ FOR:notes -r\n";
}

bool App::WantsVerbose(const std::vector<std::string> &tokens)
{
	for (const auto &token : tokens)
	{
		if (GrammarParser::IsFlagToken(token) && token.find('v') != std::string::npos)
		{
			return true;
		}
	}
	return false;
}

// Prints the preview and reads a yes/no answer from stdin
bool App::ConfirmOnConsole(const std::string &previewText)
{
	std::cout << previewText << "Apply these changes? [y/N] " << std::flush;
	std::string answer;
	if (!std::getline(std::cin, answer))
	{
		return false;
	}
	return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

int App::OnRun()
{
	std::vector<std::string> tokens;
	for (int i = 1; i < argc; ++i)
	{
		tokens.push_back(wxString(argv[i]).ToStdString());
	}

	if (tokens.empty())
	{
		std::cerr << Usage();
		return static_cast<int>(ExitStatus::GeneralError);
	}
	if (tokens.size() == 1 && (tokens[0] == "--help" || tokens[0] == "-h"))
	{
		std::cout << Usage();
		return static_cast<int>(ExitStatus::Success);
	}

	wxLog::SetVerbose(WantsVerbose(tokens));

	Settings settings = Settings::Load(Settings::DefaultConfigRoot());
	for (const auto &warning : settings.warningLog)
	{
		wxLogWarning("%s", warning.c_str());
	}

	ProcessDelegate delegate;
	CommandRunner runner(settings, &delegate, &App::ConfirmOnConsole);
	RunResult result = runner.Run(tokens);

	std::cout << result.output << std::flush;
	for (const auto &error : result.errorLog)
	{
		wxLogError("%s", error.c_str());
	}
	wxLog::FlushActive();

	return static_cast<int>(result.status);
}
