#ifndef HISTORYSTORE_H
#define HISTORYSTORE_H

#include "SmartMoveTypes.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct HistoryAppendResult
{
	std::vector<std::uint64_t> evictedSequences;
	bool success = false;
	std::string errorMessage;
};

// Append-only batch log plus backup files under one root folder:
//   <root>/history.log                      one JSON object per line
//   <root>/backups/<seq>/<seq>_<index>_<name>
class HistoryStore
{
public:
	HistoryStore(const fs::path &root, std::size_t maxEntries);

	// Reads the log; a corrupt log leaves the store unavailable
	bool Load();
	bool IsAvailable() const { return m_available; }
	const std::string &LastError() const { return m_lastError; }

	const fs::path &Root() const { return m_root; }
	fs::path LogPath() const;
	fs::path BackupRoot() const;
	fs::path BackupDirectory(std::uint64_t sequenceId) const;
	std::size_t MaxEntries() const { return m_maxEntries; }

	std::uint64_t ReserveSequence();
	HistoryAppendResult Append(const HistoryEntry &entry);
	bool MarkUndone(std::uint64_t sequenceId, std::string &errorMessage);

	std::optional<HistoryEntry> LatestUndoable() const;
	std::vector<HistoryEntry> Entries() const;

	BackupResult CreateBackup(std::uint64_t sequenceId, std::size_t index, const fs::path &original);
	bool RestoreBackup(const BackupRecord &record, std::string &errorMessage);
	DeleteResult DeleteBackups(std::uint64_t sequenceId);

	static std::string SerializeEntry(const HistoryEntry &entry);
	static std::string SerializeUndoMarker(std::uint64_t sequenceId);

private:
	bool AppendLine(const std::string &line, std::string &errorMessage);
	bool RewriteLog(std::string &errorMessage);
	std::vector<std::uint64_t> EvictOverflow();
	bool ParseLine(const std::string &line, std::size_t lineNumber, std::string &errorMessage);

	static void CopyDirectory(const fs::path &source, const fs::path &destination);
	static void CopyEntry(const fs::path &source, const fs::path &destination);

	fs::path m_root;
	std::size_t m_maxEntries;
	std::map<std::uint64_t, HistoryEntry> m_entries; // arena addressed by sequence id
	std::uint64_t m_nextSequence = 1;
	bool m_available = true;
	std::string m_lastError;
};

#endif // HISTORYSTORE_H
