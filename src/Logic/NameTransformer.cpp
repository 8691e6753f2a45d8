#include "NameTransformer.h"
#include "GrammarParser.h"
#include "TextUtils.h"

#include <utility>

CaseStyleTransform::CaseStyleTransform(CaseStyle style, bool forceSplit, std::shared_ptr<const BoundaryDetector> detector)
	: m_style(style), m_forceSplit(forceSplit), m_detector(std::move(detector))
{
}

std::string CaseStyleTransform::Apply(const std::string &baseName) const
{
	return NameTransformer::ApplyCaseStyle(baseName, m_style, m_forceSplit, *m_detector);
}

std::string CaseStyleTransform::Describe() const
{
	return (m_forceSplit ? "split " : "") + GrammarParser::CaseStyleName(m_style);
}

std::string CleanTransform::Apply(const std::string &baseName) const
{
	return NameTransformer::Clean(baseName);
}

ReplaceTransform::ReplaceTransform(std::string find, std::string replace, bool caseSensitive)
	: m_find(std::move(find)), m_replace(std::move(replace)), m_caseSensitive(caseSensitive)
{
}

std::string ReplaceTransform::Apply(const std::string &baseName) const
{
	return NameTransformer::PerformFindReplace(baseName, m_find, m_replace, m_caseSensitive);
}

std::string ReplaceTransform::Describe() const
{
	if (m_replace.empty())
	{
		return "remove \"" + m_find + "\"";
	}
	return "change \"" + m_find + "\" into \"" + m_replace + "\"";
}

RegexTransform::RegexTransform(std::regex pattern, std::string patternText, std::string replacement)
	: m_pattern(std::move(pattern)), m_patternText(std::move(patternText)), m_replacement(std::move(replacement))
{
}

std::string RegexTransform::Apply(const std::string &baseName) const
{
	return std::regex_replace(baseName, m_pattern, m_replacement);
}

std::string RegexTransform::Describe() const
{
	return "regex \"" + m_patternText + "\" into \"" + m_replacement + "\"";
}

StripPrefixTransform::StripPrefixTransform(std::string prefix, bool caseSensitive)
	: m_prefix(std::move(prefix)), m_caseSensitive(caseSensitive)
{
}

std::string StripPrefixTransform::Apply(const std::string &baseName) const
{
	return NameTransformer::StripPrefix(baseName, m_prefix, m_caseSensitive);
}

std::string StripPrefixTransform::Describe() const
{
	return "strip \"" + m_prefix + "\"";
}

bool NameTransformer::IsNamingCommand(CommandKind kind)
{
	switch (kind)
	{
	case CommandKind::CaseTransform:
	case CommandKind::Clean:
	case CommandKind::Split:
	case CommandKind::Change:
	case CommandKind::Regex:
	case CommandKind::StripPrefix:
		return true;
	default:
		return false;
	}
}

TransformBuildResult NameTransformer::Build(const Command &command, bool ignoreCase, std::shared_ptr<const BoundaryDetector> detector)
{
	TransformBuildResult result;
	if (!detector)
	{
		detector = std::make_shared<BoundaryDetector>();
	}

	switch (command.kind)
	{
	case CommandKind::CaseTransform:
		result.transform = std::make_unique<CaseStyleTransform>(command.style, false, detector);
		break;
	case CommandKind::Split:
		result.transform = std::make_unique<CaseStyleTransform>(command.style, true, detector);
		break;
	case CommandKind::Clean:
		result.transform = std::make_unique<CleanTransform>();
		break;
	case CommandKind::Change:
		result.transform = std::make_unique<ReplaceTransform>(command.oldText, command.newText, !ignoreCase);
		break;
	case CommandKind::StripPrefix:
		result.transform = std::make_unique<StripPrefixTransform>(command.oldText, !ignoreCase);
		break;
	case CommandKind::Regex:
	{
		std::regex::flag_type flags = std::regex::ECMAScript;
		if (ignoreCase)
		{
			flags |= std::regex::icase;
		}
		try
		{
			std::regex pattern(command.oldText, flags);
			result.transform = std::make_unique<RegexTransform>(std::move(pattern), command.oldText, command.newText);
		}
		catch (const std::regex_error &ex)
		{
			result.errorMessage = "Invalid regular expression '" + command.oldText + "': " + ex.what();
			return result;
		}
		break;
	}
	default:
		result.errorMessage = "'" + GrammarParser::CommandName(command) + "' is not a naming command.";
		return result;
	}

	result.success = true;
	return result;
}

// A leading dot stays in front, the extension (files only) stays at the end
std::string NameTransformer::ApplyToFileName(const NameTransform &transform, const std::string &fileName, bool isDirectory)
{
	const auto parts = TextUtils::SplitExtension(fileName, isDirectory);
	std::string base = parts.first;
	const std::string &extension = parts.second;

	std::string hiddenPrefix;
	if (base.size() > 1 && base.front() == '.')
	{
		hiddenPrefix = ".";
		base.erase(0, 1);
	}

	const std::string transformed = transform.Apply(base);
	if (transformed.empty())
	{
		return std::string();
	}
	return hiddenPrefix + transformed + extension;
}
