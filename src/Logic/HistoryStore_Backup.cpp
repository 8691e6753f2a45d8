#include "HistoryStore.h"

#include <stdexcept>
#include <string>
#include <system_error>

// Recursively copies a directory, recreating symlinks instead of following them
// Throws std::runtime_error on failure
void HistoryStore::CopyDirectory(const fs::path &source, const fs::path &destination)
{
	std::error_code ec;
	if (!fs::create_directory(destination, ec) || ec)
	{
		throw std::runtime_error("Failed to create directory '" + destination.string() + "'" + (ec ? " (" + ec.message() + ")" : " (already exists)"));
	}

	fs::directory_iterator it(source, ec);
	if (ec)
	{
		throw std::runtime_error("Cannot list '" + source.string() + "': " + ec.message());
	}
	for (; it != fs::directory_iterator(); it.increment(ec))
	{
		CopyEntry(it->path(), destination / it->path().filename());
	}
	if (ec)
	{
		throw std::runtime_error("Error while listing '" + source.string() + "': " + ec.message());
	}
}

// Copies one entry of any supported type to a path that must not exist yet
void HistoryStore::CopyEntry(const fs::path &source, const fs::path &destination)
{
	std::error_code ec;
	fs::file_status status = fs::symlink_status(source, ec);
	if (ec)
	{
		throw std::runtime_error("Cannot inspect '" + source.string() + "': " + ec.message());
	}

	if (fs::is_symlink(status))
	{
		fs::copy_symlink(source, destination, ec);
	}
	else if (fs::is_directory(status))
	{
		CopyDirectory(source, destination);
	}
	else if (fs::is_regular_file(status))
	{
		fs::copy_file(source, destination, fs::copy_options::none, ec);
	}
	else
	{
		throw std::runtime_error("Unsupported file type at '" + source.string() + "'");
	}

	if (ec)
	{
		throw std::runtime_error("Failed to copy '" + source.string() + "' to '" + destination.string() + "': " + ec.message());
	}
}

// Saves a copy of 'original' before it is removed or overwritten
BackupResult HistoryStore::CreateBackup(std::uint64_t sequenceId, std::size_t index, const fs::path &original)
{
	BackupResult result;

	std::error_code ec;
	fs::path directory = BackupDirectory(sequenceId);
	fs::create_directories(directory, ec);
	if (ec)
	{
		result.errorMessage = "Cannot create backup folder '" + directory.string() + "': " + ec.message();
		return result;
	}

	fs::path absoluteOriginal = fs::absolute(original, ec);
	if (ec)
	{
		absoluteOriginal = original;
	}

	result.record.originalPath = absoluteOriginal.lexically_normal();
	result.record.backupPath = directory / (std::to_string(sequenceId) + "_" + std::to_string(index) + "_" + original.filename().string());

	try
	{
		CopyEntry(original, result.record.backupPath);
		result.success = true;
	}
	catch (const std::exception &ex)
	{
		result.errorMessage = "Backup failed: " + std::string(ex.what());

		// Leave no partial copy behind
		std::error_code removeEc;
		fs::remove_all(result.record.backupPath, removeEc);
		if (removeEc)
		{
			result.errorMessage += " | Additionally, failed to clean up partial backup: " + removeEc.message();
		}
	}

	return result;
}

// Copies a backup back to its original location, which must be free
bool HistoryStore::RestoreBackup(const BackupRecord &record, std::string &errorMessage)
{
	std::error_code ec;
	fs::file_status target = fs::symlink_status(record.originalPath, ec);
	if (fs::exists(target))
	{
		errorMessage = "Cannot restore '" + record.originalPath.string() + "': path is occupied";
		return false;
	}

	fs::file_status backup = fs::symlink_status(record.backupPath, ec);
	if (!fs::exists(backup))
	{
		errorMessage = "Backup '" + record.backupPath.string() + "' is missing";
		return false;
	}

	if (record.originalPath.has_parent_path())
	{
		fs::create_directories(record.originalPath.parent_path(), ec);
		if (ec)
		{
			errorMessage = "Cannot recreate '" + record.originalPath.parent_path().string() + "': " + ec.message();
			return false;
		}
	}

	try
	{
		CopyEntry(record.backupPath, record.originalPath);
	}
	catch (const std::exception &ex)
	{
		errorMessage = "Restore failed: " + std::string(ex.what());
		return false;
	}
	return true;
}

// Deletes the backup folder of one batch; a missing folder counts as deleted
DeleteResult HistoryStore::DeleteBackups(std::uint64_t sequenceId)
{
	DeleteResult result;
	fs::path directory = BackupDirectory(sequenceId);

	std::error_code ec;
	bool bExists = fs::exists(directory, ec);
	if (ec)
	{
		result.errorMessage = "Error checking backup folder '" + directory.string() + "': " + ec.message();
		return result;
	}
	if (!bExists)
	{
		result.success = true;
		return result;
	}

	fs::remove_all(directory, ec);
	if (ec)
	{
		result.errorMessage = "Error deleting backup folder '" + directory.string() + "': " + ec.message();
		return result;
	}

	result.success = true;
	return result;
}
