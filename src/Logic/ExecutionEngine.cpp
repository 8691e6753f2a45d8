#include "ExecutionEngine.h"
#include "ReportSerializer.h"

ExecutionEngine::ExecutionEngine(HistoryStore &history)
	: m_history(history)
{
}

std::string ExecutionEngine::Describe(const PlannedOperation &op)
{
	std::string text = ReportSerializer::OperationKindName(op.kind) + " " + op.source.string();
	if (op.destination)
	{
		text += " -> " + op.destination->string();
	}
	return text;
}

bool ExecutionEngine::PathExists(const fs::path &path)
{
	std::error_code ec;
	return fs::exists(fs::symlink_status(path, ec));
}

fs::path ExecutionEngine::Absolute(const fs::path &path)
{
	std::error_code ec;
	fs::path absolute = fs::absolute(path, ec);
	return ec ? path : absolute.lexically_normal();
}

// Renames in place, falling back to copy and delete across devices
void ExecutionEngine::MovePath(const fs::path &source, const fs::path &destination, std::error_code &ec)
{
	fs::rename(source, destination, ec);
	if (ec != std::errc::cross_device_link)
	{
		return;
	}

	ec.clear();
	CopyPath(source, destination, ec);
	if (ec)
	{
		std::error_code cleanupEc;
		fs::remove_all(destination, cleanupEc);
		return;
	}
	fs::remove_all(source, ec);
}

// Copies files, symlinks and whole folders; the destination must be free
void ExecutionEngine::CopyPath(const fs::path &source, const fs::path &destination, std::error_code &ec)
{
	fs::file_status status = fs::symlink_status(source, ec);
	if (ec)
	{
		return;
	}

	if (fs::is_symlink(status))
	{
		fs::copy_symlink(source, destination, ec);
	}
	else if (fs::is_directory(status))
	{
		fs::copy(source, destination, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
	}
	else
	{
		fs::copy_file(source, destination, fs::copy_options::none, ec);
	}
}
