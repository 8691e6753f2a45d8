#ifndef SETTINGS_H
#define SETTINGS_H

#include "SmartMoveTypes.h"
#include "SemanticGroups.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

class wxConfigBase;

// Values read once from <config root>/smartmove.ini
struct Settings
{
	static constexpr std::size_t DefaultMaxHistoryEntries = 50;

	fs::path configRoot;
	fs::path historyRoot;
	std::size_t maxHistoryEntries = DefaultMaxHistoryEntries;
	int scanThreads = 1;
	bool includeHidden = false;
	std::vector<std::pair<std::string, std::string>> groups; // name, clause text
	std::vector<std::string> warningLog;

	// SMARTMOVE_HOME, otherwise the per-user data folder
	static fs::path DefaultConfigRoot();
	static fs::path ConfigFilePath(const fs::path &configRoot);

	static Settings Load(const fs::path &configRoot);
	static Settings Read(wxConfigBase &cfg, const fs::path &configRoot);

	// Registers every configured group, collecting rejected ones in warningLog
	void RegisterGroups(SemanticGroupRegistry &registry);
};

#endif // SETTINGS_H
