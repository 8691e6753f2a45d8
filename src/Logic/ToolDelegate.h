#ifndef TOOLDELEGATE_H
#define TOOLDELEGATE_H

#include <string>
#include <vector>

struct DelegateInvocation
{
	std::string tool;
	std::vector<std::string> coreArgs; // PATH followed by the operated files
	std::vector<std::string> userArgs; // TO:tool:a,b in the order given
};

struct DelegationResult
{
	bool launched = false;
	int exitCode = -1;
	std::vector<std::string> outputLines;
	std::vector<std::string> errorLines;
	bool success = false;
	std::string errorMessage;
};

// Capability used to hand a file set to an external named tool
class ToolDelegate
{
public:
	virtual ~ToolDelegate() = default;
	virtual DelegationResult Delegate(const DelegateInvocation &invocation) = 0;
};

#endif // TOOLDELEGATE_H
