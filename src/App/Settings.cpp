#include "Settings.h"
#include "FileScanner.h"
#include "GrammarParser.h"

#include <wx/config.h>
#include <wx/fileconf.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>
#include <wx/utils.h>

#include <algorithm>

fs::path Settings::DefaultConfigRoot()
{
	wxString home;
	if (wxGetEnv("SMARTMOVE_HOME", &home) && !home.IsEmpty())
	{
		return fs::path(home.ToStdWstring());
	}

	wxString dataDir = wxStandardPaths::Get().GetUserDataDir();
	if (dataDir.IsEmpty())
	{
		// Fallback to current working directory if no user data folder is known
		return fs::current_path() / ".smartmove";
	}
	return fs::path(dataDir.ToStdWstring());
}

fs::path Settings::ConfigFilePath(const fs::path &configRoot)
{
	return configRoot / "smartmove.ini";
}

// A missing file yields the defaults
Settings Settings::Load(const fs::path &configRoot)
{
	wxFileConfig cfg(wxEmptyString, wxEmptyString,
					 wxString(ConfigFilePath(configRoot).wstring()), wxEmptyString,
					 wxCONFIG_USE_LOCAL_FILE);
	return Read(cfg, configRoot);
}

Settings Settings::Read(wxConfigBase &cfg, const fs::path &configRoot)
{
	Settings settings;
	settings.configRoot = configRoot;
	settings.historyRoot = configRoot;

	long maxEntries = cfg.ReadLong("/History/MaxEntries", (long)DefaultMaxHistoryEntries);
	if (maxEntries < 1)
	{
		settings.warningLog.push_back("/History/MaxEntries must be at least 1, using 1.");
		maxEntries = 1;
	}
	settings.maxHistoryEntries = static_cast<std::size_t>(maxEntries);

	wxString storeDir = cfg.Read("/History/StoreDir", wxEmptyString);
	if (!storeDir.IsEmpty())
	{
		fs::path store(storeDir.ToStdWstring());
		settings.historyRoot = store.is_absolute() ? store : configRoot / store;
	}

	long threads = cfg.ReadLong("/Scan/Threads", 1);
	settings.scanThreads = static_cast<int>(std::clamp(threads, 1L, (long)FileScanner::MaxThreads));
	settings.includeHidden = cfg.ReadBool("/Scan/IncludeHidden", false);

	wxString oldPath = cfg.GetPath();
	if (cfg.HasGroup("/Groups"))
	{
		cfg.SetPath("/Groups");

		long index;
		wxString name;
		bool continueSearch = cfg.GetFirstEntry(name, index);
		while (continueSearch)
		{
			settings.groups.push_back({name.ToStdString(), cfg.Read(name, wxEmptyString).ToStdString()});
			continueSearch = cfg.GetNextEntry(name, index);
		}
	}
	cfg.SetPath(oldPath);

	std::sort(settings.groups.begin(), settings.groups.end());
	return settings;
}

void Settings::RegisterGroups(SemanticGroupRegistry &registry)
{
	for (const auto &group : groups)
	{
		std::vector<FilterClause> clauses;
		std::string error;
		if (!GrammarParser::ParseGroupDefinition(group.second, clauses, error) ||
			!registry.RegisterUserGroup(group.first, clauses, error))
		{
			warningLog.push_back("Ignoring group '" + group.first + "': " + error);
			wxLogWarning("Ignoring group '%s': %s", group.first.c_str(), error.c_str());
		}
	}
}
