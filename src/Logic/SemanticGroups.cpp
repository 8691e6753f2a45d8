#include "SemanticGroups.h"
#include "TextUtils.h"

#include <algorithm>

namespace
{
	FilterClause Clause(FilterKeyword keyword, const std::string &value)
	{
		FilterClause clause;
		clause.keyword = keyword;
		clause.comparator = FilterComparator::Equals;
		clause.value = value;
		return clause;
	}
}

SemanticGroupRegistry::SemanticGroupRegistry() = default;

// Built-in groups, keyed by lowercase name
const std::map<std::string, std::vector<FilterClause>> &SemanticGroupRegistry::BuiltInGroups()
{
	static const std::map<std::string, std::vector<FilterClause>> groups = {
		{"notes", {Clause(FilterKeyword::Ext, "md"), Clause(FilterKeyword::Type, "file")}},
		{"media", {Clause(FilterKeyword::Ext, "jpg,png,gif,webm,mp4,jpeg,webp,svg"), Clause(FilterKeyword::Type, "file")}},
		{"scripts", {Clause(FilterKeyword::Ext, "sh,py,rb,pl,rs,js,ts,bash,zsh"), Clause(FilterKeyword::Type, "file")}},
		{"projects", {Clause(FilterKeyword::Type, "folder"), Clause(FilterKeyword::Name, "src,build,docs,target,dist,bin")}},
		{"configs", {Clause(FilterKeyword::Ext, "conf,ini,yaml,yml,toml,json,config,cfg"), Clause(FilterKeyword::Type, "file")}},
	};
	return groups;
}

bool SemanticGroupRegistry::IsBuiltIn(const std::string &name)
{
	return BuiltInGroups().count(ToLower(name)) > 0;
}

// Adds a group loaded from configuration
bool SemanticGroupRegistry::RegisterUserGroup(const std::string &name, const std::vector<FilterClause> &clauses, std::string &errorMessage)
{
	const std::string key = ToLower(TextUtils::Trim(name));
	if (key.empty())
	{
		errorMessage = "Group name is empty.";
		return false;
	}
	if (IsBuiltIn(key))
	{
		errorMessage = "Group '" + key + "' is built in and cannot be redefined.";
		return false;
	}
	if (clauses.empty())
	{
		errorMessage = "Group '" + key + "' has no filter clauses.";
		return false;
	}
	// Groups expand exactly once, so a group may not refer to another group
	auto nested = std::find_if(clauses.begin(), clauses.end(), [](const FilterClause &clause)
							   { return clause.keyword == FilterKeyword::For; });
	if (nested != clauses.end())
	{
		errorMessage = "Group '" + key + "' may not contain FOR clauses.";
		return false;
	}

	m_userGroups[key] = clauses;
	return true;
}

// Looks up a group, built-ins first
std::optional<std::vector<FilterClause>> SemanticGroupRegistry::Resolve(const std::string &name) const
{
	const std::string key = ToLower(name);
	auto builtIn = BuiltInGroups().find(key);
	if (builtIn != BuiltInGroups().end())
	{
		return builtIn->second;
	}
	auto user = m_userGroups.find(key);
	if (user != m_userGroups.end())
	{
		return user->second;
	}
	return std::nullopt;
}
