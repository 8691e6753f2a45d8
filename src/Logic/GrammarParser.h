#ifndef GRAMMARPARSER_H
#define GRAMMARPARSER_H

#include "SmartMoveTypes.h"
#include "SemanticGroups.h"

#include <optional>
#include <string>
#include <vector>

struct TokenizeResult
{
	std::vector<std::string> tokens;
	bool success = false;
	std::string errorMessage;
};

// Parses <COMMAND> <PATH> [FILTER]* [ROUTE]* [FLAG]* into a ParsedCommand
class GrammarParser
{
public:
	explicit GrammarParser(const SemanticGroupRegistry &registry);

	ParseResult Parse(const std::string &raw) const;
	ParseResult Parse(const std::vector<std::string> &tokens) const;

	static TokenizeResult Tokenize(const std::string &raw);

	static bool IsFlagToken(const std::string &token);
	static bool IsRouteToken(const std::string &token);
	static bool IsFilterToken(const std::string &token);

	static bool ParseFilterToken(const std::string &token, FilterClause &clause, ParseError &error);
	static bool ParseRouteToken(const std::string &token, RouteClause &clause, ParseError &error);
	static bool ParseFlagToken(const std::string &token, FlagSet &flags, ParseError &error);

	// Parses a configured group body such as "EXT:log TYPE:file"
	static bool ParseGroupDefinition(const std::string &text, std::vector<FilterClause> &clauses, std::string &errorMessage);

	static std::optional<CaseStyle> ParseCaseStyle(const std::string &word);
	static std::string CaseStyleName(CaseStyle style);
	static std::string CommandName(const Command &command);
	static std::string ErrorKindName(ParseErrorKind kind);

private:
	bool ParseCommandWord(const std::vector<std::string> &tokens, size_t &pos, ParsedCommand &parsed, ParseError &error) const;
	bool ParseClauses(const std::vector<std::string> &tokens, size_t pos, ParsedCommand &parsed, ParseError &error) const;
	bool ExpandGroup(const FilterClause &clause, const std::string &raw, std::vector<FilterClause> &out, ParseError &error) const;

	const SemanticGroupRegistry &m_registry;
};

#endif // GRAMMARPARSER_H
