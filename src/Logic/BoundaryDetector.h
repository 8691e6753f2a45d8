#ifndef BOUNDARYDETECTOR_H
#define BOUNDARYDETECTOR_H

#include <string>
#include <vector>

// Strategy that splits a single separator-free word at its case humps
class BoundaryDetector
{
public:
	virtual ~BoundaryDetector() = default;

	virtual std::vector<std::string> SplitWord(const std::string &word) const;

	// Splits on whitespace, '_' and '-', dropping empty pieces
	static std::vector<std::string> SplitOnSeparators(const std::string &text);
	static bool IsSeparator(char c);

protected:
	// True when a word boundary sits between word[index - 1] and word[index]
	virtual bool IsBoundary(const std::string &word, size_t index) const;
};

// Also splits between a digit and a following uppercase letter ("Track2Mix")
class DigitAwareBoundaryDetector : public BoundaryDetector
{
protected:
	bool IsBoundary(const std::string &word, size_t index) const override;
};

#endif // BOUNDARYDETECTOR_H
