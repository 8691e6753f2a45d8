#include "GrammarParser.h"

#include <cctype>
#include <string>
#include <vector>

// Splits a raw command line on whitespace, honouring quotes
// Double quotes allow \" and \\ escapes; single quotes are taken literally
// Quoted and unquoted parts touching each other form one token (NAME:"my file")
TokenizeResult GrammarParser::Tokenize(const std::string &raw)
{
	TokenizeResult result;
	std::string current;
	bool inToken = false; // tracks "" so that empty quoted operands survive
	size_t i = 0;

	while (i < raw.size())
	{
		const char c = raw[i];

		if (std::isspace(static_cast<unsigned char>(c)))
		{
			if (inToken)
			{
				result.tokens.push_back(current);
				current.clear();
				inToken = false;
			}
			++i;
			continue;
		}

		if (c == '"')
		{
			inToken = true;
			++i;
			bool closed = false;
			while (i < raw.size())
			{
				const char q = raw[i];
				if (q == '\\' && i + 1 < raw.size() && (raw[i + 1] == '"' || raw[i + 1] == '\\'))
				{
					current += raw[i + 1];
					i += 2;
					continue;
				}
				if (q == '"')
				{
					closed = true;
					++i;
					break;
				}
				current += q;
				++i;
			}
			if (!closed)
			{
				result.errorMessage = "Unterminated double quote in command.";
				return result;
			}
			continue;
		}

		if (c == '\'')
		{
			inToken = true;
			const size_t close = raw.find('\'', i + 1);
			if (close == std::string::npos)
			{
				result.errorMessage = "Unterminated single quote in command.";
				return result;
			}
			current += raw.substr(i + 1, close - i - 1);
			i = close + 1;
			continue;
		}

		current += c;
		inToken = true;
		++i;
	}

	if (inToken)
	{
		result.tokens.push_back(current);
	}
	result.success = true;
	return result;
}
