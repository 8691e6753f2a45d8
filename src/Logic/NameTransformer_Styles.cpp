#include "NameTransformer.h"
#include "TextUtils.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

// Plain styles only look for case humps in names without explicit separators
std::vector<std::string> NameTransformer::Tokenize(const std::string &baseName, const BoundaryDetector &detector, bool forceSplit)
{
	std::vector<std::string> words = BoundaryDetector::SplitOnSeparators(baseName);
	if (!forceSplit && words.size() > 1)
	{
		return words;
	}

	std::vector<std::string> split;
	for (const auto &word : words)
	{
		std::vector<std::string> parts = detector.SplitWord(word);
		split.insert(split.end(), parts.begin(), parts.end());
	}
	return split;
}

// First letter upper, the rest lower
std::string NameTransformer::Capitalize(const std::string &word)
{
	std::string result = ToLower(word);
	if (!result.empty())
	{
		result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
	}
	return result;
}

std::string NameTransformer::FormatWords(const std::vector<std::string> &words, CaseStyle style)
{
	std::string result;
	switch (style)
	{
	case CaseStyle::Snake:
	case CaseStyle::Kebab:
	{
		const char separator = style == CaseStyle::Snake ? '_' : '-';
		for (size_t i = 0; i < words.size(); ++i)
		{
			if (i > 0)
			{
				result += separator;
			}
			result += ToLower(words[i]);
		}
		break;
	}
	case CaseStyle::Title:
	case CaseStyle::Start:
	case CaseStyle::Sentence:
		for (size_t i = 0; i < words.size(); ++i)
		{
			if (i > 0)
			{
				result += ' ';
			}
			const bool capitalize = style != CaseStyle::Sentence || i == 0;
			result += capitalize ? Capitalize(words[i]) : ToLower(words[i]);
		}
		break;
	case CaseStyle::Camel:
	case CaseStyle::Pascal:
		for (size_t i = 0; i < words.size(); ++i)
		{
			const bool lowerFirst = style == CaseStyle::Camel && i == 0;
			result += lowerFirst ? ToLower(words[i]) : Capitalize(words[i]);
		}
		break;
	case CaseStyle::Studly:
	{
		// Alternates over letters only, starting lowercase
		size_t letterIndex = 0;
		for (const auto &word : words)
		{
			for (char c : word)
			{
				const unsigned char uc = static_cast<unsigned char>(c);
				if (std::isalpha(uc))
				{
					result += static_cast<char>(letterIndex % 2 == 0 ? std::tolower(uc) : std::toupper(uc));
					++letterIndex;
				}
				else
				{
					result += c;
				}
			}
		}
		break;
	}
	case CaseStyle::Lower:
	case CaseStyle::Upper:
		for (const auto &word : words)
		{
			result += word;
		}
		result = style == CaseStyle::Lower ? ToLower(result) : ToUpper(result);
		break;
	}
	return result;
}

std::string NameTransformer::ApplyCaseStyle(const std::string &baseName, CaseStyle style, bool forceSplit, const BoundaryDetector &detector)
{
	// Plain lower/upper fold the name as it is
	if (!forceSplit && (style == CaseStyle::Lower || style == CaseStyle::Upper))
	{
		return style == CaseStyle::Lower ? ToLower(baseName) : ToUpper(baseName);
	}
	return FormatWords(Tokenize(baseName, detector, forceSplit), style);
}

// Keeps alnum, space, '_', '.', '-' and non-ASCII bytes; collapses spaces; trims spaces, dots and dashes
std::string NameTransformer::Clean(const std::string &baseName)
{
	std::string kept;
	kept.reserve(baseName.size());
	for (char c : baseName)
	{
		const unsigned char uc = static_cast<unsigned char>(c);
		if (std::isalnum(uc) || c == ' ' || c == '_' || c == '.' || c == '-' || uc >= 0x80)
		{
			if (c == ' ' && !kept.empty() && kept.back() == ' ')
			{
				continue;
			}
			kept += c;
		}
	}

	const auto isTrimmed = [](char c)
	{ return c == ' ' || c == '.' || c == '-'; };
	size_t begin = 0;
	while (begin < kept.size() && isTrimmed(kept[begin]))
	{
		++begin;
	}
	size_t end = kept.size();
	while (end > begin && isTrimmed(kept[end - 1]))
	{
		--end;
	}
	return kept.substr(begin, end - begin);
}

// Replaces all occurrences of 'find' with 'replace' in 'subject', respecting
// 'caseSensitive' flag
std::string NameTransformer::PerformFindReplace(std::string subject, const std::string &find, const std::string &replace, bool caseSensitive)
{
	if (find.empty() || subject.empty())
	{
		return subject;
	}

	size_t pos = 0;
	while (pos < subject.length())
	{
		size_t found_pos;
		if (caseSensitive)
		{
			found_pos = subject.find(find, pos);
		}
		else
		{
			auto it = std::search(subject.begin() + pos, subject.end(), find.begin(), find.end(),
								  [](unsigned char c1, unsigned char c2)
								  { return std::tolower(c1) == std::tolower(c2); });
			found_pos = (it == subject.end()) ? std::string::npos : static_cast<size_t>(it - subject.begin());
		}

		if (found_pos == std::string::npos)
		{
			break;
		}

		subject.replace(found_pos, find.length(), replace);
		// Continue after the replacement so it is never matched again
		pos = found_pos + replace.length();
	}
	return subject;
}

std::string NameTransformer::StripPrefix(const std::string &baseName, const std::string &prefix, bool caseSensitive)
{
	if (prefix.empty() || baseName.size() < prefix.size())
	{
		return baseName;
	}
	const std::string head = baseName.substr(0, prefix.size());
	const bool matches = caseSensitive ? head == prefix : TextUtils::iequals(head, prefix);
	return matches ? baseName.substr(prefix.size()) : baseName;
}
