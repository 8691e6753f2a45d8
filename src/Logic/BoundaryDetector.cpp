#include "BoundaryDetector.h"

#include <cctype>

namespace
{
	bool IsUpper(char c)
	{
		return std::isupper(static_cast<unsigned char>(c)) != 0;
	}

	bool IsLower(char c)
	{
		return std::islower(static_cast<unsigned char>(c)) != 0;
	}
}

bool BoundaryDetector::IsSeparator(char c)
{
	return c == '_' || c == '-' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string> BoundaryDetector::SplitOnSeparators(const std::string &text)
{
	std::vector<std::string> words;
	std::string current;
	for (char c : text)
	{
		if (IsSeparator(c))
		{
			if (!current.empty())
			{
				words.push_back(current);
				current.clear();
			}
			continue;
		}
		current += c;
	}
	if (!current.empty())
	{
		words.push_back(current);
	}
	return words;
}

std::vector<std::string> BoundaryDetector::SplitWord(const std::string &word) const
{
	std::vector<std::string> parts;
	std::string current;
	for (size_t i = 0; i < word.size(); ++i)
	{
		if (i > 0 && !current.empty() && IsBoundary(word, i))
		{
			parts.push_back(current);
			current.clear();
		}
		current += word[i];
	}
	if (!current.empty())
	{
		parts.push_back(current);
	}
	return parts;
}

// lower|Upper, and UPPER-run|Upper+lower ("XMLDocument" -> "XML", "Document")
bool BoundaryDetector::IsBoundary(const std::string &word, size_t index) const
{
	const char previous = word[index - 1];
	const char current = word[index];
	if (!IsUpper(current))
	{
		return false;
	}
	if (IsLower(previous))
	{
		return true;
	}
	if (index + 1 < word.size() && IsLower(word[index + 1]))
	{
		// The uppercase run before 'current' must be at least two letters long
		size_t runLength = 0;
		for (size_t j = index; j > 0 && IsUpper(word[j - 1]); --j)
		{
			++runLength;
		}
		return runLength >= 2;
	}
	return false;
}

bool DigitAwareBoundaryDetector::IsBoundary(const std::string &word, size_t index) const
{
	if (std::isdigit(static_cast<unsigned char>(word[index - 1])) && IsUpper(word[index]))
	{
		return true;
	}
	return BoundaryDetector::IsBoundary(word, index);
}
