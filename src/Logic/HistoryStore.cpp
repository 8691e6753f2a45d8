#include "HistoryStore.h"
#include "TextUtils.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <wx/log.h>

#include <fstream>
#include <stdexcept>

namespace
{
	const char *KindKey(OperationKind kind)
	{
		switch (kind)
		{
		case OperationKind::Rename:
			return "rename";
		case OperationKind::Move:
			return "move";
		case OperationKind::Copy:
			return "copy";
		case OperationKind::Remove:
			return "remove";
		case OperationKind::CreateDir:
			return "mkdir";
		case OperationKind::CreateFile:
			return "touch";
		}
		return "rename";
	}

	bool KindFromKey(const std::string &key, OperationKind &kind)
	{
		static const std::pair<const char *, OperationKind> kinds[] = {
			{"rename", OperationKind::Rename},
			{"move", OperationKind::Move},
			{"copy", OperationKind::Copy},
			{"remove", OperationKind::Remove},
			{"mkdir", OperationKind::CreateDir},
			{"touch", OperationKind::CreateFile}};
		for (const auto &candidate : kinds)
		{
			if (key == candidate.first)
			{
				kind = candidate.second;
				return true;
			}
		}
		return false;
	}

	template <typename Writer>
	void WriteString(Writer &writer, const std::string &value)
	{
		writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
	}

	// Fetches a required string member
	bool ReadString(const rapidjson::Value &object, const char *key, std::string &out)
	{
		auto it = object.FindMember(key);
		if (it == object.MemberEnd() || !it->value.IsString())
		{
			return false;
		}
		out.assign(it->value.GetString(), it->value.GetStringLength());
		return true;
	}
}

HistoryStore::HistoryStore(const fs::path &root, std::size_t maxEntries)
	: m_root(root),
	  m_maxEntries(maxEntries == 0 ? 1 : maxEntries)
{
}

fs::path HistoryStore::LogPath() const
{
	return m_root / "history.log";
}

fs::path HistoryStore::BackupRoot() const
{
	return m_root / "backups";
}

fs::path HistoryStore::BackupDirectory(std::uint64_t sequenceId) const
{
	return BackupRoot() / std::to_string(sequenceId);
}

// Reads every line of the log into the arena
bool HistoryStore::Load()
{
	m_entries.clear();
	m_nextSequence = 1;
	m_available = true;
	m_lastError.clear();

	std::error_code ec;
	bool bExists = fs::exists(LogPath(), ec);
	if (ec)
	{
		m_available = false;
		m_lastError = "Cannot access history log '" + LogPath().string() + "': " + ec.message();
		return false;
	}
	if (!bExists)
	{
		return true;
	}

	std::ifstream in(LogPath(), std::ios::binary);
	if (!in)
	{
		m_available = false;
		m_lastError = "Cannot open history log '" + LogPath().string() + "'";
		return false;
	}

	std::string line;
	std::size_t lineNumber = 0;
	while (std::getline(in, line))
	{
		++lineNumber;
		if (!line.empty() && line.back() == '\r')
		{
			line.pop_back();
		}
		if (TextUtils::Trim(line).empty())
		{
			continue;
		}

		std::string parseError;
		if (!ParseLine(line, lineNumber, parseError))
		{
			m_entries.clear();
			m_available = false;
			m_lastError = "History log '" + LogPath().string() + "' is corrupt: " + parseError;
			return false;
		}
	}

	// The configured limit may be lower than when the log was written
	if (m_entries.size() > m_maxEntries)
	{
		EvictOverflow();
		std::string rewriteError;
		if (!RewriteLog(rewriteError))
		{
			wxLogWarning("Could not compact history log: %s", rewriteError.c_str());
		}
	}

	return true;
}

// Skips numbers whose backup folder survived an interrupted run; it may hold
// the only copy of what that run destroyed
std::uint64_t HistoryStore::ReserveSequence()
{
	std::error_code ec;
	while (fs::exists(BackupDirectory(m_nextSequence), ec) && !ec)
	{
		wxLogWarning("Backup folder '%s' belongs to no recorded batch, leaving it in place.", BackupDirectory(m_nextSequence).string().c_str());
		++m_nextSequence;
	}
	return m_nextSequence++;
}

HistoryAppendResult HistoryStore::Append(const HistoryEntry &entry)
{
	HistoryAppendResult result;

	if (!m_available)
	{
		result.errorMessage = "History is unavailable: " + m_lastError;
		return result;
	}
	if (m_entries.count(entry.sequenceId) > 0)
	{
		result.errorMessage = "History already holds batch #" + std::to_string(entry.sequenceId);
		return result;
	}

	std::string error;
	if (!AppendLine(SerializeEntry(entry), error))
	{
		result.errorMessage = error;
		return result;
	}

	m_entries[entry.sequenceId] = entry;
	if (entry.sequenceId >= m_nextSequence)
	{
		m_nextSequence = entry.sequenceId + 1;
	}

	if (m_entries.size() > m_maxEntries)
	{
		result.evictedSequences = EvictOverflow();
		if (!RewriteLog(error))
		{
			// The new entry is already on disk; only compaction failed
			result.errorMessage = "Could not compact history log: " + error;
		}
	}

	result.success = true;
	return result;
}

bool HistoryStore::MarkUndone(std::uint64_t sequenceId, std::string &errorMessage)
{
	if (!m_available)
	{
		errorMessage = "History is unavailable: " + m_lastError;
		return false;
	}

	auto it = m_entries.find(sequenceId);
	if (it == m_entries.end())
	{
		errorMessage = "No batch #" + std::to_string(sequenceId) + " in history";
		return false;
	}
	if (it->second.undone)
	{
		errorMessage = "Batch #" + std::to_string(sequenceId) + " was already undone";
		return false;
	}

	if (!AppendLine(SerializeUndoMarker(sequenceId), errorMessage))
	{
		return false;
	}
	it->second.undone = true;
	return true;
}

std::optional<HistoryEntry> HistoryStore::LatestUndoable() const
{
	for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it)
	{
		if (!it->second.undone)
		{
			return it->second;
		}
	}
	return std::nullopt;
}

std::vector<HistoryEntry> HistoryStore::Entries() const
{
	std::vector<HistoryEntry> entries;
	entries.reserve(m_entries.size());
	for (const auto &pair : m_entries)
	{
		entries.push_back(pair.second);
	}
	return entries;
}

bool HistoryStore::AppendLine(const std::string &line, std::string &errorMessage)
{
	std::error_code ec;
	fs::create_directories(m_root, ec);
	if (ec)
	{
		errorMessage = "Cannot create history folder '" + m_root.string() + "': " + ec.message();
		return false;
	}

	std::ofstream out(LogPath(), std::ios::binary | std::ios::app);
	if (!out)
	{
		errorMessage = "Cannot open history log '" + LogPath().string() + "' for writing";
		return false;
	}
	out << line << '\n';
	out.flush();
	if (!out)
	{
		errorMessage = "Failed writing history log '" + LogPath().string() + "'";
		return false;
	}
	return true;
}

// Writes the arena to a temporary file and swaps it in
bool HistoryStore::RewriteLog(std::string &errorMessage)
{
	fs::path tempPath = LogPath();
	tempPath += ".tmp";

	{
		std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
		if (!out)
		{
			errorMessage = "Cannot open '" + tempPath.string() + "' for writing";
			return false;
		}
		for (const auto &pair : m_entries)
		{
			out << SerializeEntry(pair.second) << '\n';
			if (pair.second.undone)
			{
				out << SerializeUndoMarker(pair.first) << '\n';
			}
		}
		out.flush();
		if (!out)
		{
			errorMessage = "Failed writing '" + tempPath.string() + "'";
			return false;
		}
	}

	std::error_code ec;
	fs::rename(tempPath, LogPath(), ec);
	if (ec)
	{
		errorMessage = "Cannot replace history log: " + ec.message();
		std::error_code removeEc;
		fs::remove(tempPath, removeEc);
		return false;
	}
	return true;
}

// Drops the oldest entries beyond the limit together with their backups
std::vector<std::uint64_t> HistoryStore::EvictOverflow()
{
	std::vector<std::uint64_t> evicted;
	while (m_entries.size() > m_maxEntries)
	{
		std::uint64_t oldest = m_entries.begin()->first;
		m_entries.erase(m_entries.begin());

		DeleteResult deleted = DeleteBackups(oldest);
		if (!deleted.success)
		{
			wxLogWarning("Could not delete backups of batch #%s: %s", std::to_string(oldest).c_str(), deleted.errorMessage.c_str());
		}
		evicted.push_back(oldest);
	}
	return evicted;
}

std::string HistoryStore::SerializeEntry(const HistoryEntry &entry)
{
	rapidjson::StringBuffer buffer;
	rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

	writer.StartObject();
	writer.Key("type");
	writer.String("entry");
	writer.Key("seq");
	writer.Uint64(entry.sequenceId);
	writer.Key("timestamp");
	WriteString(writer, entry.timestamp);
	writer.Key("label");
	WriteString(writer, entry.label);

	writer.Key("operations");
	writer.StartArray();
	for (const auto &op : entry.operations)
	{
		writer.StartObject();
		writer.Key("kind");
		writer.String(KindKey(op.kind));
		writer.Key("source");
		WriteString(writer, op.source.string());
		writer.Key("destination");
		if (op.destination)
		{
			WriteString(writer, op.destination->string());
		}
		else
		{
			writer.Null();
		}
		writer.Key("directory");
		writer.Bool(op.isDirectory);
		writer.Key("backup");
		if (op.backup)
		{
			writer.StartObject();
			writer.Key("original");
			WriteString(writer, op.backup->originalPath.string());
			writer.Key("path");
			WriteString(writer, op.backup->backupPath.string());
			writer.EndObject();
		}
		else
		{
			writer.Null();
		}
		writer.EndObject();
	}
	writer.EndArray();
	writer.EndObject();

	return std::string(buffer.GetString(), buffer.GetSize());
}

std::string HistoryStore::SerializeUndoMarker(std::uint64_t sequenceId)
{
	rapidjson::StringBuffer buffer;
	rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

	writer.StartObject();
	writer.Key("type");
	writer.String("undo");
	writer.Key("seq");
	writer.Uint64(sequenceId);
	writer.EndObject();

	return std::string(buffer.GetString(), buffer.GetSize());
}

bool HistoryStore::ParseLine(const std::string &line, std::size_t lineNumber, std::string &errorMessage)
{
	const std::string where = "line " + std::to_string(lineNumber) + ": ";

	rapidjson::Document document;
	document.Parse(line.c_str(), line.size());
	if (document.HasParseError())
	{
		errorMessage = where + rapidjson::GetParseError_En(document.GetParseError()) + " (offset " + std::to_string(document.GetErrorOffset()) + ")";
		return false;
	}
	if (!document.IsObject())
	{
		errorMessage = where + "expected a JSON object";
		return false;
	}

	std::string type;
	if (!ReadString(document, "type", type))
	{
		errorMessage = where + "missing 'type'";
		return false;
	}
	auto seqIt = document.FindMember("seq");
	if (seqIt == document.MemberEnd() || !seqIt->value.IsUint64() || seqIt->value.GetUint64() == 0)
	{
		errorMessage = where + "missing or invalid 'seq'";
		return false;
	}
	std::uint64_t sequenceId = seqIt->value.GetUint64();

	if (type == "undo")
	{
		auto it = m_entries.find(sequenceId);
		// Markers for evicted entries are harmless
		if (it != m_entries.end())
		{
			it->second.undone = true;
		}
		return true;
	}
	if (type != "entry")
	{
		errorMessage = where + "unknown record type '" + type + "'";
		return false;
	}
	if (m_entries.count(sequenceId) > 0)
	{
		errorMessage = where + "duplicate batch #" + std::to_string(sequenceId);
		return false;
	}

	HistoryEntry entry;
	entry.sequenceId = sequenceId;
	if (!ReadString(document, "timestamp", entry.timestamp) || !ReadString(document, "label", entry.label))
	{
		errorMessage = where + "missing 'timestamp' or 'label'";
		return false;
	}

	auto opsIt = document.FindMember("operations");
	if (opsIt == document.MemberEnd() || !opsIt->value.IsArray())
	{
		errorMessage = where + "missing 'operations'";
		return false;
	}

	for (const auto &value : opsIt->value.GetArray())
	{
		if (!value.IsObject())
		{
			errorMessage = where + "operation is not an object";
			return false;
		}

		AppliedOperation op;
		std::string kind, source;
		if (!ReadString(value, "kind", kind) || !KindFromKey(kind, op.kind))
		{
			errorMessage = where + "invalid operation kind";
			return false;
		}
		if (!ReadString(value, "source", source))
		{
			errorMessage = where + "operation without 'source'";
			return false;
		}
		op.source = fs::path(source);

		auto destIt = value.FindMember("destination");
		if (destIt != value.MemberEnd() && destIt->value.IsString())
		{
			op.destination = fs::path(std::string(destIt->value.GetString(), destIt->value.GetStringLength()));
		}
		else if (destIt != value.MemberEnd() && !destIt->value.IsNull())
		{
			errorMessage = where + "invalid 'destination'";
			return false;
		}

		auto dirIt = value.FindMember("directory");
		if (dirIt != value.MemberEnd() && dirIt->value.IsBool())
		{
			op.isDirectory = dirIt->value.GetBool();
		}

		auto backupIt = value.FindMember("backup");
		if (backupIt != value.MemberEnd() && backupIt->value.IsObject())
		{
			std::string original, path;
			if (!ReadString(backupIt->value, "original", original) || !ReadString(backupIt->value, "path", path))
			{
				errorMessage = where + "incomplete 'backup'";
				return false;
			}
			op.backup = BackupRecord{fs::path(original), fs::path(path)};
		}
		else if (backupIt != value.MemberEnd() && !backupIt->value.IsNull())
		{
			errorMessage = where + "invalid 'backup'";
			return false;
		}

		entry.operations.push_back(op);
	}

	if (sequenceId >= m_nextSequence)
	{
		m_nextSequence = sequenceId + 1;
	}
	m_entries[sequenceId] = entry;
	return true;
}
