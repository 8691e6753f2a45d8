#ifndef SEMANTICGROUPS_H
#define SEMANTICGROUPS_H

#include "SmartMoveTypes.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

// Named bundles of filter clauses used by FOR:<name>
class SemanticGroupRegistry
{
public:
	SemanticGroupRegistry();

	static bool IsBuiltIn(const std::string &name);

	// User groups layer on top of the built-ins and can never shadow them
	bool RegisterUserGroup(const std::string &name, const std::vector<FilterClause> &clauses, std::string &errorMessage);

	std::optional<std::vector<FilterClause>> Resolve(const std::string &name) const;

private:
	static const std::map<std::string, std::vector<FilterClause>> &BuiltInGroups();

	std::map<std::string, std::vector<FilterClause>> m_userGroups;
};

#endif // SEMANTICGROUPS_H
