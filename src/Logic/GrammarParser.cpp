#include "GrammarParser.h"
#include "TextUtils.h"

#include <cctype>
#include <map>
#include <string>
#include <vector>

namespace
{
	void Fail(ParseError &error, ParseErrorKind kind, const std::string &raw, const std::string &message)
	{
		error.kind = kind;
		error.raw = raw;
		error.message = message;
	}

	// Tokens that end the PATH position
	bool IsClauseToken(const std::string &token)
	{
		return GrammarParser::IsFlagToken(token) || GrammarParser::IsRouteToken(token) || GrammarParser::IsFilterToken(token);
	}

	const std::map<std::string, CommandKind> &CommandWords()
	{
		static const std::map<std::string, CommandKind> words = {
			{"clean", CommandKind::Clean},
			{"split", CommandKind::Split},
			{"change", CommandKind::Change},
			{"regex", CommandKind::Regex},
			{"strip", CommandKind::StripPrefix},
			{"mv", CommandKind::Move},
			{"move", CommandKind::Move},
			{"cp", CommandKind::Copy},
			{"copy", CommandKind::Copy},
			{"rm", CommandKind::Remove},
			{"remove", CommandKind::Remove},
			{"mkdir", CommandKind::CreateDir},
			{"touch", CommandKind::CreateFile},
			{"group", CommandKind::Group},
			{"flatten", CommandKind::Flatten},
			{"undo", CommandKind::Undo},
			{"history", CommandKind::History},
		};
		return words;
	}

	const std::map<std::string, FilterKeyword> &FilterKeywords()
	{
		static const std::map<std::string, FilterKeyword> keywords = {
			{"NAME", FilterKeyword::Name},
			{"TYPE", FilterKeyword::Type},
			{"EXT", FilterKeyword::Ext},
			{"SIZE", FilterKeyword::Size},
			{"DEPTH", FilterKeyword::Depth},
			{"MODIFIED", FilterKeyword::Modified},
			{"ACCESSED", FilterKeyword::Accessed},
			{"FOR", FilterKeyword::For},
		};
		return keywords;
	}

	// EXT values are stored without their leading dot
	std::string NormalizeExtensionList(const std::string &value)
	{
		std::string normalized;
		for (const auto &part : TextUtils::Split(value, ',', true))
		{
			std::string ext = part;
			while (!ext.empty() && ext.front() == '.')
			{
				ext.erase(0, 1);
			}
			if (ext.empty())
			{
				continue;
			}
			if (!normalized.empty())
			{
				normalized += ',';
			}
			normalized += ext;
		}
		return normalized;
	}
}

GrammarParser::GrammarParser(const SemanticGroupRegistry &registry)
	: m_registry(registry)
{
}

// Tokenizes a raw command line and parses it
ParseResult GrammarParser::Parse(const std::string &raw) const
{
	TokenizeResult tokenized = Tokenize(raw);
	if (!tokenized.success)
	{
		ParseResult result;
		Fail(result.error, ParseErrorKind::UnterminatedQuote, raw, tokenized.errorMessage);
		return result;
	}
	return Parse(tokenized.tokens);
}

// Parses an already split argument vector in a single left-to-right pass
ParseResult GrammarParser::Parse(const std::vector<std::string> &tokens) const
{
	ParseResult result;
	ParsedCommand &parsed = result.command;
	ParseError &error = result.error;

	if (tokens.empty())
	{
		Fail(error, ParseErrorKind::UnknownCommand, "", "No command given.");
		return result;
	}

	// An invocation made only of flags is meaningful only as "-u"
	if (IsFlagToken(tokens.front()))
	{
		for (const auto &token : tokens)
		{
			if (!IsFlagToken(token))
			{
				Fail(error, ParseErrorKind::UnexpectedToken, token, "Unexpected token '" + token + "' after flags.");
				return result;
			}
			if (!ParseFlagToken(token, parsed.flags, error))
			{
				return result;
			}
		}
		if (!parsed.flags.undo)
		{
			Fail(error, ParseErrorKind::UnknownCommand, tokens.front(), "No command given, only flags.");
			return result;
		}
		parsed.command.kind = CommandKind::Undo;
		result.success = true;
		return result;
	}

	size_t pos = 0;
	if (!ParseCommandWord(tokens, pos, parsed, error))
	{
		return result;
	}

	const CommandKind kind = parsed.command.kind;
	const bool takesPath = kind != CommandKind::Undo && kind != CommandKind::History;

	if (takesPath && pos < tokens.size() && !IsClauseToken(tokens[pos]))
	{
		if (tokens[pos].empty())
		{
			Fail(error, ParseErrorKind::MissingOperand, tokens[pos], "PATH must not be empty.");
			return result;
		}
		parsed.path = fs::path(tokens[pos]);
		parsed.pathDefaulted = false;
		++pos;
	}

	const bool needsExplicitPath = kind == CommandKind::Move || kind == CommandKind::Copy ||
								   kind == CommandKind::CreateDir || kind == CommandKind::CreateFile;
	if (needsExplicitPath && parsed.pathDefaulted)
	{
		Fail(error, ParseErrorKind::MissingOperand, "", "'" + CommandName(parsed.command) + "' requires a PATH.");
		return result;
	}

	if (kind == CommandKind::Move || kind == CommandKind::Copy)
	{
		// "INTO" is optional; a lone trailing "into" is taken as the destination itself
		if (pos + 1 < tokens.size() && TextUtils::iequals(tokens[pos], "INTO") && !IsClauseToken(tokens[pos + 1]))
		{
			++pos;
		}
		if (pos >= tokens.size() || IsClauseToken(tokens[pos]) || tokens[pos].empty())
		{
			Fail(error, ParseErrorKind::MissingOperand, pos < tokens.size() ? tokens[pos] : "",
				 "'" + CommandName(parsed.command) + "' requires a destination.");
			return result;
		}
		parsed.command.destination = fs::path(tokens[pos]);
		++pos;
	}

	if (!ParseClauses(tokens, pos, parsed, error))
	{
		return result;
	}

	result.success = true;
	return result;
}

// Reads the command word and its operands, leaving 'pos' at the PATH position
bool GrammarParser::ParseCommandWord(const std::vector<std::string> &tokens, size_t &pos, ParsedCommand &parsed, ParseError &error) const
{
	const std::string word = ToLower(tokens[pos]);
	Command &command = parsed.command;

	if (auto style = ParseCaseStyle(word))
	{
		command.kind = CommandKind::CaseTransform;
		command.style = *style;
		++pos;
		return true;
	}

	auto found = CommandWords().find(word);
	if (found == CommandWords().end())
	{
		Fail(error, ParseErrorKind::UnknownCommand, tokens[pos], "Unknown command '" + tokens[pos] + "'.");
		return false;
	}
	command.kind = found->second;
	++pos;

	switch (command.kind)
	{
	case CommandKind::Split:
	{
		if (pos >= tokens.size())
		{
			Fail(error, ParseErrorKind::MissingOperand, "", "'split' requires a case style.");
			return false;
		}
		auto style = ParseCaseStyle(ToLower(tokens[pos]));
		if (!style)
		{
			Fail(error, ParseErrorKind::MissingOperand, tokens[pos], "'" + tokens[pos] + "' is not a case style for 'split'.");
			return false;
		}
		command.style = *style;
		++pos;
		return true;
	}
	case CommandKind::Change:
	case CommandKind::Regex:
	{
		const std::string name = command.kind == CommandKind::Change ? "CHANGE" : "REGEX";
		if (pos >= tokens.size() || tokens[pos].empty())
		{
			Fail(error, ParseErrorKind::MissingOperand, "", name + " requires a non-empty search operand.");
			return false;
		}
		command.oldText = tokens[pos++];
		if (pos >= tokens.size() || !TextUtils::iequals(tokens[pos], "INTO"))
		{
			Fail(error, ParseErrorKind::MissingOperand, pos < tokens.size() ? tokens[pos] : "",
				 name + " \"" + command.oldText + "\" must be followed by INTO.");
			return false;
		}
		++pos;
		if (pos >= tokens.size())
		{
			Fail(error, ParseErrorKind::MissingOperand, "", name + " requires a replacement operand after INTO.");
			return false;
		}
		command.newText = tokens[pos++];
		command.isRemoval = command.newText.empty();
		return true;
	}
	case CommandKind::StripPrefix:
		if (pos >= tokens.size() || tokens[pos].empty())
		{
			Fail(error, ParseErrorKind::MissingOperand, "", "STRIP requires a non-empty prefix operand.");
			return false;
		}
		command.oldText = tokens[pos++];
		return true;
	default:
		return true;
	}
}

// Filters, then routes, then flags; going back to an earlier group is an error
bool GrammarParser::ParseClauses(const std::vector<std::string> &tokens, size_t pos, ParsedCommand &parsed, ParseError &error) const
{
	enum class Phase
	{
		Filters,
		Routes,
		Flags
	};
	Phase phase = Phase::Filters;
	const bool acceptsFilters = parsed.command.kind != CommandKind::Undo && parsed.command.kind != CommandKind::History &&
								parsed.command.kind != CommandKind::CreateDir && parsed.command.kind != CommandKind::CreateFile;

	for (; pos < tokens.size(); ++pos)
	{
		const std::string &token = tokens[pos];

		if (IsFlagToken(token))
		{
			phase = Phase::Flags;
			if (!ParseFlagToken(token, parsed.flags, error))
			{
				return false;
			}
		}
		else if (IsRouteToken(token))
		{
			if (phase == Phase::Flags)
			{
				Fail(error, ParseErrorKind::UnexpectedToken, token, "Route '" + token + "' must come before flags.");
				return false;
			}
			phase = Phase::Routes;
			RouteClause route;
			if (!ParseRouteToken(token, route, error))
			{
				return false;
			}
			parsed.routes.push_back(route);
		}
		else if (IsFilterToken(token))
		{
			if (phase != Phase::Filters)
			{
				Fail(error, ParseErrorKind::UnexpectedToken, token, "Filter '" + token + "' must come before routes and flags.");
				return false;
			}
			if (!acceptsFilters)
			{
				Fail(error, ParseErrorKind::UnexpectedToken, token, "'" + CommandName(parsed.command) + "' does not take filters.");
				return false;
			}
			FilterClause clause;
			if (!ParseFilterToken(token, clause, error))
			{
				return false;
			}
			if (clause.keyword == FilterKeyword::For)
			{
				if (!ExpandGroup(clause, token, parsed.filters, error))
				{
					return false;
				}
			}
			else
			{
				parsed.filters.push_back(clause);
			}
		}
		else
		{
			Fail(error, ParseErrorKind::UnexpectedToken, token, "Unexpected token '" + token + "'.");
			return false;
		}
	}
	return true;
}

// Replaces FOR:<name> with the group's clauses
bool GrammarParser::ExpandGroup(const FilterClause &clause, const std::string &raw, std::vector<FilterClause> &out, ParseError &error) const
{
	auto group = m_registry.Resolve(clause.value);
	if (!group)
	{
		Fail(error, ParseErrorKind::MalformedFilter, raw, "Unknown semantic group '" + clause.value + "'.");
		error.keyword = "FOR";
		return false;
	}
	out.insert(out.end(), group->begin(), group->end());
	return true;
}

bool GrammarParser::IsFlagToken(const std::string &token)
{
	return token.size() >= 2 && token[0] == '-';
}

bool GrammarParser::IsRouteToken(const std::string &token)
{
	return TextUtils::StartsWith(token, "TO:") || TextUtils::StartsWith(token, "INTO:") || TextUtils::StartsWith(token, "FORMAT:");
}

// KEYWORD followed by ':', '>' or '<', keyword in capitals
bool GrammarParser::IsFilterToken(const std::string &token)
{
	size_t i = 0;
	while (i < token.size() && std::isupper(static_cast<unsigned char>(token[i])))
	{
		++i;
	}
	return i >= 2 && i < token.size() && (token[i] == ':' || token[i] == '>' || token[i] == '<');
}

bool GrammarParser::ParseFilterToken(const std::string &token, FilterClause &clause, ParseError &error)
{
	size_t i = 0;
	while (i < token.size() && std::isupper(static_cast<unsigned char>(token[i])))
	{
		++i;
	}
	const std::string keywordText = token.substr(0, i);
	if (i == 0 || i >= token.size())
	{
		Fail(error, ParseErrorKind::MalformedFilter, token, "'" + token + "' is not a filter.");
		error.keyword = keywordText;
		return false;
	}

	auto keyword = FilterKeywords().find(keywordText);
	if (keyword == FilterKeywords().end())
	{
		Fail(error, ParseErrorKind::MalformedFilter, token, "Unknown filter keyword '" + keywordText + "'.");
		error.keyword = keywordText;
		return false;
	}
	clause.keyword = keyword->second;

	switch (token[i])
	{
	case ':':
		clause.comparator = FilterComparator::Equals;
		break;
	case '>':
		clause.comparator = FilterComparator::Greater;
		break;
	case '<':
		clause.comparator = FilterComparator::Less;
		break;
	default:
		Fail(error, ParseErrorKind::MalformedFilter, token, "Filter '" + token + "' has no comparator.");
		error.keyword = keywordText;
		return false;
	}

	const bool equalityOnly = clause.keyword == FilterKeyword::Name || clause.keyword == FilterKeyword::Type ||
							  clause.keyword == FilterKeyword::Ext || clause.keyword == FilterKeyword::For;
	if (equalityOnly && clause.comparator != FilterComparator::Equals)
	{
		Fail(error, ParseErrorKind::MalformedFilter, token, keywordText + " only supports ':'.");
		error.keyword = keywordText;
		return false;
	}

	clause.value = token.substr(i + 1);
	if (clause.keyword == FilterKeyword::Ext)
	{
		clause.value = NormalizeExtensionList(clause.value);
	}
	if (clause.value.empty())
	{
		Fail(error, ParseErrorKind::MalformedFilter, token, "Filter '" + token + "' has no value.");
		error.keyword = keywordText;
		return false;
	}
	return true;
}

bool GrammarParser::ParseRouteToken(const std::string &token, RouteClause &clause, ParseError &error)
{
	if (TextUtils::StartsWith(token, "TO:"))
	{
		// TO:tool[:arg1,arg2,...]
		const std::string rest = token.substr(3);
		const size_t colon = rest.find(':');
		clause.kind = RouteKind::To;
		clause.tool = TextUtils::Trim(rest.substr(0, colon));
		if (colon != std::string::npos)
		{
			clause.args = TextUtils::Split(rest.substr(colon + 1), ',', true);
		}
		if (clause.tool.empty())
		{
			Fail(error, ParseErrorKind::MalformedRoute, token, "Route '" + token + "' names no tool.");
			return false;
		}
		return true;
	}

	if (TextUtils::StartsWith(token, "INTO:"))
	{
		clause.kind = RouteKind::Into;
		const std::string path = token.substr(5);
		if (path.empty())
		{
			Fail(error, ParseErrorKind::MalformedRoute, token, "Route '" + token + "' names no output file.");
			return false;
		}
		clause.path = fs::path(path);
		return true;
	}

	if (TextUtils::StartsWith(token, "FORMAT:"))
	{
		static const std::map<std::string, OutputFormat> formats = {
			{"json", OutputFormat::Json},
			{"csv", OutputFormat::Csv},
			{"yaml", OutputFormat::Yaml},
			{"yml", OutputFormat::Yaml},
			{"text", OutputFormat::Text},
			{"txt", OutputFormat::Text},
		};
		clause.kind = RouteKind::Format;
		auto format = formats.find(ToLower(token.substr(7)));
		if (format == formats.end())
		{
			Fail(error, ParseErrorKind::MalformedRoute, token, "Unknown output format in '" + token + "'.");
			return false;
		}
		clause.format = format->second;
		return true;
	}

	Fail(error, ParseErrorKind::MalformedRoute, token, "'" + token + "' is not a route.");
	return false;
}

// Stackable short flags: "-rpf" sets r, p and f
bool GrammarParser::ParseFlagToken(const std::string &token, FlagSet &flags, ParseError &error)
{
	for (size_t i = 1; i < token.size(); ++i)
	{
		switch (token[i])
		{
		case 'r':
			flags.recursive = true;
			break;
		case 'p':
			flags.preview = true;
			break;
		case 'f':
			flags.force = true;
			break;
		case 'I':
			flags.interactive = true;
			break;
		case 'T':
			flags.tui = true;
			break;
		case 'u':
			flags.undo = true;
			break;
		case 'a':
			flags.includeHidden = true;
			break;
		case 'i':
			flags.ignoreCase = true;
			break;
		case 'v':
			flags.verbose = true;
			break;
		default:
			Fail(error, ParseErrorKind::UnknownFlag, token, std::string("Unknown flag '") + token[i] + "'.");
			error.flag = token[i];
			return false;
		}
	}
	return true;
}

bool GrammarParser::ParseGroupDefinition(const std::string &text, std::vector<FilterClause> &clauses, std::string &errorMessage)
{
	TokenizeResult tokenized = Tokenize(text);
	if (!tokenized.success)
	{
		errorMessage = tokenized.errorMessage;
		return false;
	}
	for (const auto &token : tokenized.tokens)
	{
		FilterClause clause;
		ParseError error;
		if (!IsFilterToken(token))
		{
			errorMessage = "'" + token + "' is not a filter clause.";
			return false;
		}
		if (!ParseFilterToken(token, clause, error))
		{
			errorMessage = error.message;
			return false;
		}
		clauses.push_back(clause);
	}
	if (clauses.empty())
	{
		errorMessage = "No filter clauses given.";
		return false;
	}
	return true;
}

std::optional<CaseStyle> GrammarParser::ParseCaseStyle(const std::string &word)
{
	static const std::map<std::string, CaseStyle> styles = {
		{"snake", CaseStyle::Snake},
		{"kebab", CaseStyle::Kebab},
		{"title", CaseStyle::Title},
		{"camel", CaseStyle::Camel},
		{"pascal", CaseStyle::Pascal},
		{"lower", CaseStyle::Lower},
		{"upper", CaseStyle::Upper},
		{"sentence", CaseStyle::Sentence},
		{"studly", CaseStyle::Studly},
		{"start", CaseStyle::Start},
	};
	auto found = styles.find(ToLower(word));
	if (found == styles.end())
	{
		return std::nullopt;
	}
	return found->second;
}

std::string GrammarParser::CaseStyleName(CaseStyle style)
{
	switch (style)
	{
	case CaseStyle::Snake:
		return "snake";
	case CaseStyle::Kebab:
		return "kebab";
	case CaseStyle::Title:
		return "title";
	case CaseStyle::Camel:
		return "camel";
	case CaseStyle::Pascal:
		return "pascal";
	case CaseStyle::Lower:
		return "lower";
	case CaseStyle::Upper:
		return "upper";
	case CaseStyle::Sentence:
		return "sentence";
	case CaseStyle::Studly:
		return "studly";
	case CaseStyle::Start:
		return "start";
	}
	return "unknown";
}

std::string GrammarParser::CommandName(const Command &command)
{
	switch (command.kind)
	{
	case CommandKind::CaseTransform:
		return CaseStyleName(command.style);
	case CommandKind::Clean:
		return "clean";
	case CommandKind::Split:
		return "split " + CaseStyleName(command.style);
	case CommandKind::Change:
		return command.isRemoval ? "change (removal)" : "change";
	case CommandKind::Regex:
		return "regex";
	case CommandKind::StripPrefix:
		return "strip";
	case CommandKind::Move:
		return "mv";
	case CommandKind::Copy:
		return "cp";
	case CommandKind::Remove:
		return "rm";
	case CommandKind::CreateDir:
		return "mkdir";
	case CommandKind::CreateFile:
		return "touch";
	case CommandKind::Group:
		return "group";
	case CommandKind::Flatten:
		return "flatten";
	case CommandKind::Undo:
		return "undo";
	case CommandKind::History:
		return "history";
	}
	return "unknown";
}

std::string GrammarParser::ErrorKindName(ParseErrorKind kind)
{
	switch (kind)
	{
	case ParseErrorKind::None:
		return "None";
	case ParseErrorKind::UnknownCommand:
		return "UnknownCommand";
	case ParseErrorKind::MalformedFilter:
		return "MalformedFilter";
	case ParseErrorKind::MalformedRoute:
		return "MalformedRoute";
	case ParseErrorKind::UnknownFlag:
		return "UnknownFlag";
	case ParseErrorKind::MissingOperand:
		return "MissingOperand";
	case ParseErrorKind::UnterminatedQuote:
		return "UnterminatedQuote";
	case ParseErrorKind::UnexpectedToken:
		return "UnexpectedToken";
	}
	return "Unknown";
}
