#include "FileScanner.h"

#include <wx/log.h>

#include <stdexcept>

ScanWorker::ScanWorker(const std::vector<fs::path> &folders, const ScanOptions &options)
	: wxThread(wxTHREAD_JOINABLE),
	  m_folders(folders),
	  m_options(options)
{
}

// Walks the assigned folders; results are read by the owner after Wait()
wxThread::ExitCode ScanWorker::Entry()
{
	try
	{
		for (const auto &folder : m_folders)
		{
			if (TestDestroy())
			{
				break;
			}
			FileScanner::WalkDirectory(folder, 2, m_options, m_entries, m_occupied, m_warnings);
		}
	}
	catch (const std::exception &e)
	{
		m_warnings.push_back("Scan worker stopped: " + std::string(e.what()));
	}

	return (ExitCode)0;
}
