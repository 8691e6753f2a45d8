#ifndef PROCESSDELEGATE_H
#define PROCESSDELEGATE_H

#include "ToolDelegate.h"

#include <string>
#include <vector>

// Runs the named tool as a blocking subprocess and captures its output
class ProcessDelegate : public ToolDelegate
{
public:
	DelegationResult Delegate(const DelegateInvocation &invocation) override;

	static std::string BuildCommandLine(const DelegateInvocation &invocation);
	static std::string QuoteArgument(const std::string &argument);
};

#endif // PROCESSDELEGATE_H
