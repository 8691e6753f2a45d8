#include "FileScanner.h"

#include <wx/datetime.h>
#include <wx/filename.h>
#include <wx/log.h>

#include <algorithm>
#include <memory>
#include <system_error>

bool FileScanner::IsHidden(const std::string &name)
{
	return name.size() > 1 && name.front() == '.' && name != "..";
}

// Reads type, size and times of a single path without following symlinks
std::optional<FileMetadata> FileScanner::Describe(const fs::path &path, int depth, std::string &errorMessage)
{
	std::error_code ec;
	const fs::file_status status = fs::symlink_status(path, ec);
	if (ec || !fs::exists(status))
	{
		errorMessage = "Cannot read " + path.string() + (ec ? ": " + ec.message() : ": not found");
		return std::nullopt;
	}

	FileMetadata meta;
	meta.path = path;
	meta.name = path.filename().string();
	meta.depth = depth;

	if (fs::is_symlink(status))
	{
		meta.type = FileType::Symlink;
	}
	else if (fs::is_directory(status))
	{
		meta.type = FileType::Folder;
	}
	else if (fs::is_regular_file(status))
	{
		meta.type = FileType::File;
		const auto size = fs::file_size(path, ec);
		meta.size = ec ? 0 : size;
	}
	else
	{
		meta.type = FileType::Other;
	}

	// Dangling links have no times to read
	std::error_code targetEc;
	if (meta.type != FileType::Symlink || fs::exists(path, targetEc))
	{
		wxLogNull noLog;
		wxFileName fileName(wxString(path.wstring()));
		wxDateTime accessed, modified;
		if (fileName.GetTimes(&accessed, &modified, nullptr))
		{
			meta.accessedTime = accessed.GetTicks();
			meta.modifiedTime = modified.GetTicks();
		}
	}
	return meta;
}

void FileScanner::WalkDirectory(const fs::path &directory, int depth, const ScanOptions &options,
								std::vector<FileMetadata> &entries, std::map<fs::path, FileType> &occupied,
								std::vector<std::string> &warnings)
{
	std::error_code ec;
	fs::directory_iterator it(directory, ec);
	if (ec)
	{
		warnings.push_back("Cannot read folder " + directory.string() + ": " + ec.message());
		return;
	}

	for (; it != fs::directory_iterator(); it.increment(ec))
	{
		if (ec)
		{
			warnings.push_back("Stopped reading folder " + directory.string() + ": " + ec.message());
			break;
		}

		const fs::path path = (directory / it->path().filename()).lexically_normal();
		std::string errorMessage;
		auto meta = FileScanner::Describe(path, depth, errorMessage);
		if (!meta)
		{
			warnings.push_back(errorMessage);
			continue;
		}

		// Hidden entries still occupy their names
		occupied[path] = meta->type;
		if (!options.includeHidden && IsHidden(meta->name))
		{
			continue;
		}
		entries.push_back(*meta);

		if (meta->type == FileType::Folder && options.recursive)
		{
			WalkDirectory(path, depth + 1, options, entries, occupied, warnings);
		}
	}
}

void FileScanner::ListChildren(const fs::path &directory, std::map<fs::path, FileType> &occupied, std::vector<std::string> &warnings)
{
	ScanOptions listing;
	listing.includeHidden = true;
	std::vector<FileMetadata> ignored;
	WalkDirectory(directory, 1, listing, ignored, occupied, warnings);
}

FileSnapshot FileScanner::Scan(const ScanOptions &options)
{
	FileSnapshot snapshot;
	snapshot.root = options.root.lexically_normal();
	if (!snapshot.root.has_filename() && snapshot.root.has_relative_path())
	{
		snapshot.root = snapshot.root.parent_path();
	}
	if (snapshot.root.empty())
	{
		snapshot.root = ".";
	}

	std::error_code ec;
	const fs::file_status rootLinkStatus = fs::symlink_status(snapshot.root, ec);
	if (!fs::exists(rootLinkStatus))
	{
		// Nothing there yet, which is fine for mkdir and touch
		snapshot.success = true;
		return snapshot;
	}

	std::string errorMessage;
	snapshot.rootInfo = Describe(snapshot.root, 0, errorMessage);
	if (!snapshot.rootInfo)
	{
		snapshot.errorMessage = errorMessage;
		return snapshot;
	}
	snapshot.occupiedPaths[snapshot.root] = snapshot.rootInfo->type;

	// A link to a folder is scanned like the folder itself
	const bool rootIsDirectory = fs::is_directory(snapshot.root, ec) && !ec;
	if (!rootIsDirectory)
	{
		// A single named entry; its siblings decide rename conflicts
		snapshot.entries.push_back(*snapshot.rootInfo);
		const fs::path parent = snapshot.root.has_parent_path() ? snapshot.root.parent_path() : fs::path(".");
		ListChildren(parent, snapshot.occupiedPaths, snapshot.warningLog);
		snapshot.success = true;
		return snapshot;
	}

	const int threads = std::max(1, std::min(options.threads, MaxThreads));
	if (!options.recursive || threads == 1)
	{
		WalkDirectory(snapshot.root, 1, options, snapshot.entries, snapshot.occupiedPaths, snapshot.warningLog);
	}
	else
	{
		// Top level inline, each visible sub-folder handed to a worker
		ScanOptions shallow = options;
		shallow.recursive = false;
		WalkDirectory(snapshot.root, 1, shallow, snapshot.entries, snapshot.occupiedPaths, snapshot.warningLog);

		std::vector<fs::path> folders;
		for (const auto &entry : snapshot.entries)
		{
			if (entry.type == FileType::Folder)
			{
				folders.push_back(entry.path);
			}
		}

		const size_t workerCount = std::min(folders.size(), static_cast<size_t>(threads));
		std::vector<std::vector<fs::path>> assignments(workerCount);
		for (size_t i = 0; i < folders.size(); ++i)
		{
			assignments[i % workerCount].push_back(folders[i]);
		}

		std::vector<std::unique_ptr<ScanWorker>> workers;
		for (const auto &assignment : assignments)
		{
			auto worker = std::make_unique<ScanWorker>(assignment, options);
			if (worker->Run() != wxTHREAD_NO_ERROR)
			{
				wxLogVerbose("Scan worker could not start, scanning %d folder(s) inline", static_cast<int>(assignment.size()));
				for (const auto &folder : assignment)
				{
					WalkDirectory(folder, 2, options, snapshot.entries, snapshot.occupiedPaths, snapshot.warningLog);
				}
				continue;
			}
			workers.push_back(std::move(worker));
		}

		for (auto &worker : workers)
		{
			worker->Wait();
			snapshot.entries.insert(snapshot.entries.end(), worker->Entries().begin(), worker->Entries().end());
			snapshot.occupiedPaths.insert(worker->Occupied().begin(), worker->Occupied().end());
			snapshot.warningLog.insert(snapshot.warningLog.end(), worker->Warnings().begin(), worker->Warnings().end());
		}
	}

	std::sort(snapshot.entries.begin(), snapshot.entries.end(), [](const FileMetadata &a, const FileMetadata &b)
			  { return a.path < b.path; });
	snapshot.success = true;
	return snapshot;
}

void FileScanner::ProbeDestination(FileSnapshot &snapshot, const fs::path &destination)
{
	fs::path target = destination.lexically_normal();
	if (!target.has_filename() && target.has_relative_path())
	{
		target = target.parent_path();
	}

	std::string errorMessage;
	snapshot.destinationInfo = Describe(target, 0, errorMessage);
	if (!snapshot.destinationInfo)
	{
		return;
	}
	snapshot.occupiedPaths[target] = snapshot.destinationInfo->type;

	std::error_code ec;
	if (fs::is_directory(target, ec) && !ec)
	{
		ListChildren(target, snapshot.occupiedPaths, snapshot.warningLog);
	}
}
