#ifndef NAMETRANSFORMER_H
#define NAMETRANSFORMER_H

#include "SmartMoveTypes.h"
#include "BoundaryDetector.h"

#include <memory>
#include <regex>
#include <string>
#include <vector>

// A pure transformation of a base name (extension already stripped)
class NameTransform
{
public:
	virtual ~NameTransform() = default;
	virtual std::string Apply(const std::string &baseName) const = 0;
	virtual std::string Describe() const = 0;
};

class CaseStyleTransform : public NameTransform
{
public:
	CaseStyleTransform(CaseStyle style, bool forceSplit, std::shared_ptr<const BoundaryDetector> detector);
	std::string Apply(const std::string &baseName) const override;
	std::string Describe() const override;

private:
	CaseStyle m_style;
	bool m_forceSplit;
	std::shared_ptr<const BoundaryDetector> m_detector;
};

class CleanTransform : public NameTransform
{
public:
	std::string Apply(const std::string &baseName) const override;
	std::string Describe() const override { return "clean"; }
};

class ReplaceTransform : public NameTransform
{
public:
	ReplaceTransform(std::string find, std::string replace, bool caseSensitive);
	std::string Apply(const std::string &baseName) const override;
	std::string Describe() const override;

private:
	std::string m_find;
	std::string m_replace;
	bool m_caseSensitive;
};

class RegexTransform : public NameTransform
{
public:
	RegexTransform(std::regex pattern, std::string patternText, std::string replacement);
	std::string Apply(const std::string &baseName) const override;
	std::string Describe() const override;

private:
	std::regex m_pattern;
	std::string m_patternText;
	std::string m_replacement;
};

class StripPrefixTransform : public NameTransform
{
public:
	StripPrefixTransform(std::string prefix, bool caseSensitive);
	std::string Apply(const std::string &baseName) const override;
	std::string Describe() const override;

private:
	std::string m_prefix;
	bool m_caseSensitive;
};

struct TransformBuildResult
{
	std::unique_ptr<NameTransform> transform;
	bool success = false;
	std::string errorMessage;
};

class NameTransformer
{
public:
	// Builds the transform for a naming command; fails on invalid regex patterns
	static TransformBuildResult Build(const Command &command, bool ignoreCase, std::shared_ptr<const BoundaryDetector> detector = nullptr);
	static bool IsNamingCommand(CommandKind kind);

	// Applies 'transform' to the base name and re-appends the extension verbatim
	// Returns an empty string when the transformed base name is empty
	static std::string ApplyToFileName(const NameTransform &transform, const std::string &fileName, bool isDirectory);

	static std::vector<std::string> Tokenize(const std::string &baseName, const BoundaryDetector &detector, bool forceSplit);
	static std::string FormatWords(const std::vector<std::string> &words, CaseStyle style);
	static std::string ApplyCaseStyle(const std::string &baseName, CaseStyle style, bool forceSplit, const BoundaryDetector &detector);
	static std::string Capitalize(const std::string &word);
	static std::string Clean(const std::string &baseName);
	static std::string PerformFindReplace(std::string subject, const std::string &find, const std::string &replace, bool caseSensitive);
	static std::string StripPrefix(const std::string &baseName, const std::string &prefix, bool caseSensitive);
};

#endif // NAMETRANSFORMER_H
