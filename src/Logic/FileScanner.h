#ifndef FILESCANNER_H
#define FILESCANNER_H

#include "SmartMoveTypes.h"

#include <wx/thread.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

struct ScanOptions
{
	fs::path root = ".";
	bool recursive = false;
	bool includeHidden = false;
	int threads = 1;   // 1 scans inline
};

// Read-only walk of one or more top-level folders
class ScanWorker : public wxThread
{
public:
	ScanWorker(const std::vector<fs::path> &folders, const ScanOptions &options);

	const std::vector<FileMetadata> &Entries() const { return m_entries; }
	const std::map<fs::path, FileType> &Occupied() const { return m_occupied; }
	const std::vector<std::string> &Warnings() const { return m_warnings; }

protected:
	virtual ExitCode Entry() override;

private:
	std::vector<fs::path> m_folders;
	ScanOptions m_options;
	std::vector<FileMetadata> m_entries;
	std::map<fs::path, FileType> m_occupied;
	std::vector<std::string> m_warnings;
};

class FileScanner
{
public:
	static constexpr int MaxThreads = 8;

	// Takes the metadata snapshot below options.root
	static FileSnapshot Scan(const ScanOptions &options);

	// Records the destination of a move or copy and, for folders, its children
	static void ProbeDestination(FileSnapshot &snapshot, const fs::path &destination);

	static std::optional<FileMetadata> Describe(const fs::path &path, int depth, std::string &errorMessage);
	static bool IsHidden(const std::string &name);

	static void WalkDirectory(const fs::path &directory, int depth, const ScanOptions &options,
							  std::vector<FileMetadata> &entries, std::map<fs::path, FileType> &occupied,
							  std::vector<std::string> &warnings);

private:
	static void ListChildren(const fs::path &directory, std::map<fs::path, FileType> &occupied, std::vector<std::string> &warnings);
};

#endif // FILESCANNER_H
