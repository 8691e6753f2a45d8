#ifndef FILTEREVALUATOR_H
#define FILTEREVALUATOR_H

#include "SmartMoveTypes.h"
#include "SemanticGroups.h"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

struct CompiledClause
{
	FilterKeyword keyword = FilterKeyword::Name;
	FilterComparator comparator = FilterComparator::Equals;
	std::vector<std::string> alternatives; // NAME substrings and EXT suffixes
	std::vector<std::regex> globs;		   // NAME alternatives containing * or ?
	FileType type = FileType::File;
	std::uintmax_t number = 0; // SIZE in bytes, DEPTH
	int dayKey = 0;			   // MODIFIED and ACCESSED as YYYYMMDD
};

// All clauses AND-combined; an empty predicate accepts everything
class FilterPredicate
{
public:
	bool operator()(const FileMetadata &entry) const;
	size_t ClauseCount() const { return m_clauses.size(); }

private:
	friend class FilterEvaluator;

	bool MatchesClause(const CompiledClause &clause, const FileMetadata &entry) const;
	bool MatchesName(const CompiledClause &clause, const std::string &name) const;
	bool MatchesExtension(const CompiledClause &clause, const std::string &name) const;

	std::vector<CompiledClause> m_clauses;
	bool m_ignoreCase = false;
};

struct FilterCompileResult
{
	FilterPredicate predicate;
	bool success = false;
	std::string errorMessage;
};

class FilterEvaluator
{
public:
	// FOR clauses still present are expanded against 'registry', or the built-ins when null
	static FilterCompileResult Compile(const std::vector<FilterClause> &clauses, bool ignoreCase, const SemanticGroupRegistry *registry = nullptr);

	static std::optional<std::uintmax_t> ParseSizeLiteral(const std::string &text);
	static std::optional<int> ParseDateLiteral(const std::string &text);
	static std::optional<FileType> ParseTypeLiteral(const std::string &text);
	static std::string TypeName(FileType type);

private:
	static bool CompileClause(const FilterClause &clause, bool ignoreCase, CompiledClause &compiled, std::string &errorMessage);
};

#endif // FILTEREVALUATOR_H
