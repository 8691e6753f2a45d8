#ifndef TEXTUTILS_H
#define TEXTUTILS_H

#include <ctime>
#include <string>
#include <utility>
#include <vector>

std::string ToLower(std::string s);
std::string ToUpper(std::string s);

class TextUtils
{
public:
	static bool iequals(const std::string &a, const std::string &b);
	static bool StartsWith(const std::string &text, const std::string &prefix);
	static bool EndsWith(const std::string &text, const std::string &suffix);
	static std::string Trim(const std::string &text);
	static std::vector<std::string> Split(const std::string &text, char delimiter, bool dropEmpty);

	static std::string ConvertWildcardToRegex(const std::string &pattern);
	static bool HasWildcard(const std::string &pattern);

	// Splits "name.ext" into {"name", ".ext"}; dotfiles and folders have no extension
	static std::pair<std::string, std::string> SplitExtension(const std::string &fileName, bool isDirectory);

	static std::string CurrentTimestamp();
	static std::string FormatLocalTime(std::time_t time, const char *format);
	static int LocalDayKey(std::time_t time);
};

#endif // TEXTUTILS_H
