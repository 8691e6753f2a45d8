#include "FilterEvaluator.h"
#include "TextUtils.h"

#include <algorithm>
#include <limits>
#include <map>
#include <regex>
#include <stdexcept>

namespace
{
	template <typename T>
	bool Compare(const T &actual, const T &expected, FilterComparator comparator)
	{
		switch (comparator)
		{
		case FilterComparator::Greater:
			return actual > expected;
		case FilterComparator::Less:
			return actual < expected;
		case FilterComparator::Equals:
		default:
			return actual == expected;
		}
	}

	bool IsLeapYear(int year)
	{
		return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
	}
}

// Evaluates every compiled clause against 'entry'
bool FilterPredicate::operator()(const FileMetadata &entry) const
{
	return std::all_of(m_clauses.begin(), m_clauses.end(), [this, &entry](const CompiledClause &clause)
					   { return MatchesClause(clause, entry); });
}

bool FilterPredicate::MatchesClause(const CompiledClause &clause, const FileMetadata &entry) const
{
	switch (clause.keyword)
	{
	case FilterKeyword::Name:
		return MatchesName(clause, entry.name);
	case FilterKeyword::Ext:
		return MatchesExtension(clause, entry.name);
	case FilterKeyword::Type:
		return entry.type == clause.type;
	case FilterKeyword::Size:
		return Compare<std::uintmax_t>(entry.size, clause.number, clause.comparator);
	case FilterKeyword::Depth:
		return Compare<std::uintmax_t>(static_cast<std::uintmax_t>(std::max(entry.depth, 0)), clause.number, clause.comparator);
	case FilterKeyword::Modified:
		return Compare(TextUtils::LocalDayKey(entry.modifiedTime), clause.dayKey, clause.comparator);
	case FilterKeyword::Accessed:
		return Compare(TextUtils::LocalDayKey(entry.accessedTime), clause.dayKey, clause.comparator);
	case FilterKeyword::For:
		// Expanded during compilation, never stored
		return false;
	}
	return false;
}

// Any alternative matching is enough
bool FilterPredicate::MatchesName(const CompiledClause &clause, const std::string &name) const
{
	for (const auto &glob : clause.globs)
	{
		if (std::regex_match(name, glob))
		{
			return true;
		}
	}
	const std::string subject = m_ignoreCase ? ToLower(name) : name;
	for (const auto &alternative : clause.alternatives)
	{
		if (subject.find(alternative) != std::string::npos)
		{
			return true;
		}
	}
	return false;
}

bool FilterPredicate::MatchesExtension(const CompiledClause &clause, const std::string &name) const
{
	for (const auto &ext : clause.alternatives)
	{
		if (TextUtils::EndsWith(name, "." + ext))
		{
			return true;
		}
	}
	return false;
}

// Compiles clauses into a predicate; any invalid literal fails the whole compilation
FilterCompileResult FilterEvaluator::Compile(const std::vector<FilterClause> &clauses, bool ignoreCase, const SemanticGroupRegistry *registry)
{
	FilterCompileResult result;
	result.predicate.m_ignoreCase = ignoreCase;

	const SemanticGroupRegistry builtIns;
	const SemanticGroupRegistry &groups = registry ? *registry : builtIns;

	std::vector<FilterClause> expanded;
	for (const auto &clause : clauses)
	{
		if (clause.keyword != FilterKeyword::For)
		{
			expanded.push_back(clause);
			continue;
		}
		auto group = groups.Resolve(clause.value);
		if (!group)
		{
			result.errorMessage = "Unknown semantic group '" + clause.value + "'.";
			return result;
		}
		expanded.insert(expanded.end(), group->begin(), group->end());
	}

	for (const auto &clause : expanded)
	{
		CompiledClause compiled;
		if (!CompileClause(clause, ignoreCase, compiled, result.errorMessage))
		{
			return result;
		}
		result.predicate.m_clauses.push_back(std::move(compiled));
	}

	result.success = true;
	return result;
}

bool FilterEvaluator::CompileClause(const FilterClause &clause, bool ignoreCase, CompiledClause &compiled, std::string &errorMessage)
{
	compiled.keyword = clause.keyword;
	compiled.comparator = clause.comparator;

	switch (clause.keyword)
	{
	case FilterKeyword::Name:
		for (const auto &alternative : TextUtils::Split(clause.value, ',', true))
		{
			if (TextUtils::HasWildcard(alternative))
			{
				std::regex::flag_type flags = std::regex::ECMAScript;
				if (ignoreCase)
				{
					flags |= std::regex::icase;
				}
				try
				{
					compiled.globs.emplace_back(TextUtils::ConvertWildcardToRegex(alternative), flags);
				}
				catch (const std::regex_error &ex)
				{
					errorMessage = "Invalid NAME pattern '" + alternative + "': " + ex.what();
					return false;
				}
			}
			else
			{
				compiled.alternatives.push_back(ignoreCase ? ToLower(alternative) : alternative);
			}
		}
		if (compiled.globs.empty() && compiled.alternatives.empty())
		{
			errorMessage = "NAME filter has no value.";
			return false;
		}
		return true;

	case FilterKeyword::Ext:
		for (const auto &alternative : TextUtils::Split(clause.value, ',', true))
		{
			std::string ext = alternative;
			while (!ext.empty() && ext.front() == '.')
			{
				ext.erase(0, 1);
			}
			if (!ext.empty())
			{
				compiled.alternatives.push_back(ext);
			}
		}
		if (compiled.alternatives.empty())
		{
			errorMessage = "EXT filter has no value.";
			return false;
		}
		return true;

	case FilterKeyword::Type:
	{
		auto type = ParseTypeLiteral(clause.value);
		if (!type)
		{
			errorMessage = "Invalid TYPE '" + clause.value + "' (expected file, folder, symlink or other).";
			return false;
		}
		compiled.type = *type;
		return true;
	}

	case FilterKeyword::Size:
	{
		auto size = ParseSizeLiteral(clause.value);
		if (!size)
		{
			errorMessage = "Invalid SIZE '" + clause.value + "' (expected an integer with optional B, KB, MB, GB or TB).";
			return false;
		}
		compiled.number = *size;
		return true;
	}

	case FilterKeyword::Depth:
	{
		static const std::regex depthRegex(R"(^\d{1,9}$)");
		if (!std::regex_match(clause.value, depthRegex))
		{
			errorMessage = "Invalid DEPTH '" + clause.value + "' (expected a non-negative integer).";
			return false;
		}
		compiled.number = std::stoull(clause.value);
		return true;
	}

	case FilterKeyword::Modified:
	case FilterKeyword::Accessed:
	{
		auto day = ParseDateLiteral(clause.value);
		if (!day)
		{
			errorMessage = "Invalid date '" + clause.value + "' (expected YYYY-MM-DD).";
			return false;
		}
		compiled.dayKey = *day;
		return true;
	}

	case FilterKeyword::For:
		errorMessage = "FOR group '" + clause.value + "' was not expanded.";
		return false;
	}

	errorMessage = "Unsupported filter keyword.";
	return false;
}

// Integer plus optional unit, 1024-based: "500", "500KB", "2 MB"
std::optional<std::uintmax_t> FilterEvaluator::ParseSizeLiteral(const std::string &text)
{
	static const std::regex sizeRegex(R"(^(\d+)\s*([A-Za-z]*)$)");
	static const std::map<std::string, std::uintmax_t> units = {
		{"", 1ULL},
		{"B", 1ULL},
		{"KB", 1024ULL},
		{"MB", 1024ULL * 1024},
		{"GB", 1024ULL * 1024 * 1024},
		{"TB", 1024ULL * 1024 * 1024 * 1024},
	};

	std::smatch match;
	const std::string trimmed = TextUtils::Trim(text);
	if (!std::regex_match(trimmed, match, sizeRegex))
	{
		return std::nullopt;
	}
	auto unit = units.find(ToUpper(match[2].str()));
	if (unit == units.end())
	{
		return std::nullopt;
	}

	std::uintmax_t amount = 0;
	try
	{
		amount = std::stoull(match[1].str());
	}
	catch (const std::out_of_range &)
	{
		return std::nullopt;
	}
	if (amount > std::numeric_limits<std::uintmax_t>::max() / unit->second)
	{
		return std::nullopt;
	}
	return amount * unit->second;
}

// "YYYY-MM-DD" to YYYYMMDD, rejecting impossible calendar dates
std::optional<int> FilterEvaluator::ParseDateLiteral(const std::string &text)
{
	static const std::regex dateRegex(R"(^(\d{4})-(\d{2})-(\d{2})$)");
	std::smatch match;
	if (!std::regex_match(text, match, dateRegex))
	{
		return std::nullopt;
	}
	const int year = std::stoi(match[1].str());
	const int month = std::stoi(match[2].str());
	const int day = std::stoi(match[3].str());
	if (month < 1 || month > 12 || day < 1)
	{
		return std::nullopt;
	}
	static const int daysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	int maxDay = daysInMonth[month - 1];
	if (month == 2 && IsLeapYear(year))
	{
		maxDay = 29;
	}
	if (day > maxDay)
	{
		return std::nullopt;
	}
	return year * 10000 + month * 100 + day;
}

std::optional<FileType> FilterEvaluator::ParseTypeLiteral(const std::string &text)
{
	static const std::map<std::string, FileType> types = {
		{"file", FileType::File},
		{"folder", FileType::Folder},
		{"dir", FileType::Folder},
		{"directory", FileType::Folder},
		{"symlink", FileType::Symlink},
		{"link", FileType::Symlink},
		{"other", FileType::Other},
	};
	auto found = types.find(ToLower(text));
	if (found == types.end())
	{
		return std::nullopt;
	}
	return found->second;
}

std::string FilterEvaluator::TypeName(FileType type)
{
	switch (type)
	{
	case FileType::File:
		return "file";
	case FileType::Folder:
		return "folder";
	case FileType::Symlink:
		return "symlink";
	case FileType::Other:
		return "other";
	}
	return "other";
}
