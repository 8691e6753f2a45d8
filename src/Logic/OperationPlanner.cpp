#include "OperationPlanner.h"
#include "FilterEvaluator.h"
#include "GrammarParser.h"
#include "TextUtils.h"

#include <algorithm>
#include <map>

DestinationClaims::DestinationClaims(const FileSnapshot &snapshot, bool force)
	: m_snapshot(snapshot), m_force(force)
{
}

std::optional<FileType> DestinationClaims::OccupiedType(const fs::path &path) const
{
	auto found = m_snapshot.occupiedPaths.find(path);
	if (found == m_snapshot.occupiedPaths.end())
	{
		return std::nullopt;
	}
	return found->second;
}

void DestinationClaims::Reserve(const fs::path &path)
{
	m_claimed.insert(path);
}

void DestinationClaims::Claim(PlannedOperation &op)
{
	const fs::path &destination = *op.destination;

	if (destination == op.source)
	{
		op.state = PlanState::NoOp;
		op.reason = "already named as requested";
		return;
	}
	if (m_claimed.count(destination))
	{
		// Two entries of one batch never overwrite each other, force or not
		op.state = PlanState::Conflict;
		op.reason = "another operation in this batch already targets " + destination.string();
		return;
	}

	auto existing = OccupiedType(destination);
	if (!existing)
	{
		op.state = PlanState::Ready;
		m_claimed.insert(destination);
		return;
	}
	if (!m_force)
	{
		op.state = PlanState::Conflict;
		op.reason = "destination exists (use -f to overwrite)";
		return;
	}
	if (*existing == FileType::Folder)
	{
		op.state = PlanState::Conflict;
		op.reason = "destination is an existing folder";
		return;
	}
	if (op.isDirectory)
	{
		op.state = PlanState::Conflict;
		op.reason = "cannot replace a " + FilterEvaluator::TypeName(*existing) + " with a folder";
		return;
	}
	op.state = PlanState::OverwriteAllowed;
	op.reason = "overwrites existing " + FilterEvaluator::TypeName(*existing);
	m_claimed.insert(destination);
}

bool OperationPlanner::IsWithin(const fs::path &path, const fs::path &folder)
{
	const fs::path relative = path.lexically_normal().lexically_relative(folder.lexically_normal());
	if (relative.empty() || relative == ".")
	{
		return false;
	}
	return *relative.begin() != "..";
}

fs::path OperationPlanner::Join(const fs::path &folder, const std::string &name)
{
	return (folder / name).lexically_normal();
}

std::vector<FileMetadata> OperationPlanner::DropDescendants(const std::vector<FileMetadata> &files)
{
	std::vector<FileMetadata> sorted = files;
	std::sort(sorted.begin(), sorted.end(), [](const FileMetadata &a, const FileMetadata &b)
			  { return a.path < b.path; });

	std::vector<FileMetadata> kept;
	std::vector<fs::path> keptFolders;
	for (const auto &file : sorted)
	{
		const bool nested = std::any_of(keptFolders.begin(), keptFolders.end(), [&file](const fs::path &folder)
										{ return IsWithin(file.path, folder); });
		if (nested)
		{
			continue;
		}
		kept.push_back(file);
		if (file.type == FileType::Folder)
		{
			keptFolders.push_back(file.path);
		}
	}
	return kept;
}

// Computes the planned operations for one command over the selected files
PlanResult OperationPlanner::Plan(const std::vector<FileMetadata> &files, const Command &command, const FlagSet &flags, const PlanningContext &context)
{
	PlanResult result;
	if (!context.snapshot)
	{
		result.errorMessage = "No metadata snapshot to plan against.";
		return result;
	}
	DestinationClaims claims(*context.snapshot, flags.force);

	switch (command.kind)
	{
	case CommandKind::CaseTransform:
	case CommandKind::Clean:
	case CommandKind::Split:
	case CommandKind::Change:
	case CommandKind::Regex:
	case CommandKind::StripPrefix:
		if (!context.transform)
		{
			result.errorMessage = "No name transform was built for this command.";
			return result;
		}
		PlanRenames(files, *context.transform, claims, result);
		break;
	case CommandKind::Move:
	case CommandKind::Copy:
		PlanTransfers(files, command, flags, context, claims, result);
		break;
	case CommandKind::Remove:
		PlanRemovals(files, flags, result);
		break;
	case CommandKind::CreateDir:
	case CommandKind::CreateFile:
		PlanCreation(command, context, result);
		break;
	case CommandKind::Group:
		PlanGroup(files, context, claims, result);
		break;
	case CommandKind::Flatten:
		PlanFlatten(files, context, claims, result);
		break;
	case CommandKind::Undo:
	case CommandKind::History:
		result.errorMessage = "'" + GrammarParser::CommandName(command) + "' does not plan file operations.";
		return result;
	}

	if (result.operations.empty())
	{
		result.infoLog.push_back("No files matched.");
	}
	result.success = true;
	return result;
}

// Deepest paths first, so children are renamed before their parents
void OperationPlanner::PlanRenames(const std::vector<FileMetadata> &files, const NameTransform &transform, DestinationClaims &claims, PlanResult &result)
{
	std::vector<FileMetadata> ordered = files;
	std::sort(ordered.begin(), ordered.end(),
			  [](const FileMetadata &a, const FileMetadata &b)
			  {
				  if (a.depth != b.depth)
				  {
					  return a.depth > b.depth;
				  }
				  return a.path < b.path;
			  });

	for (const auto &file : ordered)
	{
		PlannedOperation op;
		op.source = file.path;
		op.kind = OperationKind::Rename;
		op.isDirectory = file.type == FileType::Folder;

		const std::string newName = NameTransformer::ApplyToFileName(transform, file.name, op.isDirectory);
		if (newName.empty())
		{
			op.state = PlanState::Conflict;
			op.reason = "transformed name is empty";
			result.operations.push_back(op);
			continue;
		}
		if (newName == "." || newName == ".." || newName.find('/') != std::string::npos)
		{
			op.state = PlanState::Conflict;
			op.reason = "'" + newName + "' is not a valid file name";
			result.operations.push_back(op);
			continue;
		}

		op.destination = Join(file.path.parent_path(), newName);
		claims.Claim(op);
		result.operations.push_back(op);
	}
}

void OperationPlanner::PlanTransfers(const std::vector<FileMetadata> &files, const Command &command, const FlagSet &flags, const PlanningContext &context, DestinationClaims &claims, PlanResult &result)
{
	const OperationKind kind = command.kind == CommandKind::Move ? OperationKind::Move : OperationKind::Copy;
	const std::string destinationText = command.destination.string();
	const bool trailingSeparator = !destinationText.empty() &&
								   (destinationText.back() == '/' || destinationText.back() == fs::path::preferred_separator);

	fs::path destination = command.destination.lexically_normal();
	if (!destination.has_filename() && destination.has_relative_path())
	{
		destination = destination.parent_path();
	}

	const std::vector<FileMetadata> selected = DropDescendants(files);
	if (selected.empty())
	{
		return;
	}

	const auto &destinationInfo = context.snapshot->destinationInfo;
	const bool destinationIsFolder = destinationInfo && destinationInfo->type == FileType::Folder;
	const bool intoFolder = destinationIsFolder || trailingSeparator || selected.size() > 1;

	if (intoFolder && destinationInfo && !destinationIsFolder)
	{
		for (const auto &file : selected)
		{
			PlannedOperation op;
			op.source = file.path;
			op.destination = Join(destination, file.name);
			op.kind = kind;
			op.isDirectory = file.type == FileType::Folder;
			op.state = PlanState::Conflict;
			op.reason = destination.string() + " exists and is not a folder";
			result.operations.push_back(op);
		}
		return;
	}

	if (intoFolder && !destinationInfo)
	{
		PlannedOperation create;
		create.source = destination;
		create.kind = OperationKind::CreateDir;
		create.isDirectory = true;
		create.state = PlanState::Ready;
		result.operations.push_back(create);
		claims.Reserve(destination);
	}

	for (const auto &file : selected)
	{
		PlannedOperation op;
		op.source = file.path;
		op.destination = intoFolder ? Join(destination, file.name) : destination;
		op.kind = kind;
		op.isDirectory = file.type == FileType::Folder;

		if (op.isDirectory && kind == OperationKind::Copy && !flags.recursive)
		{
			result.warningLog.push_back("Skipping folder " + file.path.string() + ": copying folders requires -r.");
			continue;
		}
		if (op.isDirectory && (*op.destination == file.path || IsWithin(*op.destination, file.path)))
		{
			op.state = PlanState::Conflict;
			op.reason = "a folder cannot be placed inside itself";
			result.operations.push_back(op);
			continue;
		}

		claims.Claim(op);
		result.operations.push_back(op);
	}
}

void OperationPlanner::PlanRemovals(const std::vector<FileMetadata> &files, const FlagSet &flags, PlanResult &result)
{
	for (const auto &file : DropDescendants(files))
	{
		PlannedOperation op;
		op.source = file.path;
		op.kind = OperationKind::Remove;
		op.isDirectory = file.type == FileType::Folder;

		if (op.isDirectory && !flags.recursive)
		{
			result.warningLog.push_back("Skipping folder " + file.path.string() + ": removing folders requires -r.");
			continue;
		}
		const std::string name = file.path.lexically_normal().filename().string();
		if (name == "." || name == ".." || file.path.lexically_normal() == file.path.root_path())
		{
			op.state = PlanState::Conflict;
			op.reason = "refusing to remove " + file.path.string();
			result.operations.push_back(op);
			continue;
		}
		op.state = PlanState::Ready;
		result.operations.push_back(op);
	}
}

// mkdir and touch act on PATH itself
void OperationPlanner::PlanCreation(const Command &command, const PlanningContext &context, PlanResult &result)
{
	PlannedOperation op;
	op.source = context.root.lexically_normal();
	op.kind = command.kind == CommandKind::CreateDir ? OperationKind::CreateDir : OperationKind::CreateFile;
	op.isDirectory = op.kind == OperationKind::CreateDir;

	const auto &existing = context.snapshot->rootInfo;
	if (!existing)
	{
		op.state = PlanState::Ready;
	}
	else
	{
		const FileType wanted = op.isDirectory ? FileType::Folder : FileType::File;
		if (existing->type == wanted)
		{
			op.state = PlanState::NoOp;
			op.reason = FilterEvaluator::TypeName(wanted) + " already exists";
		}
		else
		{
			op.state = PlanState::Conflict;
			op.reason = "path exists as a " + FilterEvaluator::TypeName(existing->type);
		}
	}
	result.operations.push_back(op);
}

// PATH/<stem>.<ext> moves to PATH/<stem>/<stem>.<ext>
void OperationPlanner::PlanGroup(const std::vector<FileMetadata> &files, const PlanningContext &context, DestinationClaims &claims, PlanResult &result)
{
	std::map<std::string, std::vector<FileMetadata>> byStem;
	for (const auto &file : files)
	{
		if (file.type != FileType::File || file.depth != 1)
		{
			continue;
		}
		const auto parts = TextUtils::SplitExtension(file.name, false);
		if (parts.second.empty())
		{
			result.infoLog.push_back("Leaving " + file.name + " in place: it has no extension.");
			continue;
		}
		byStem[parts.first].push_back(file);
	}

	std::vector<PlannedOperation> creates;
	std::vector<PlannedOperation> moves;
	for (const auto &group : byStem)
	{
		const fs::path folder = Join(context.root, group.first);
		auto occupied = claims.OccupiedType(folder);
		const bool blocked = occupied && *occupied != FileType::Folder;

		if (!occupied)
		{
			PlannedOperation create;
			create.source = folder;
			create.kind = OperationKind::CreateDir;
			create.isDirectory = true;
			create.state = PlanState::Ready;
			creates.push_back(create);
			claims.Reserve(folder);
		}

		for (const auto &file : group.second)
		{
			PlannedOperation op;
			op.source = file.path;
			op.destination = Join(folder, file.name);
			op.kind = OperationKind::Move;
			if (blocked)
			{
				op.state = PlanState::Conflict;
				op.reason = folder.string() + " exists and is not a folder";
			}
			else
			{
				claims.Claim(op);
			}
			moves.push_back(op);
		}
	}

	result.operations.insert(result.operations.end(), creates.begin(), creates.end());
	result.operations.insert(result.operations.end(), moves.begin(), moves.end());
}

// Every file below PATH moves up to PATH/<name>
void OperationPlanner::PlanFlatten(const std::vector<FileMetadata> &files, const PlanningContext &context, DestinationClaims &claims, PlanResult &result)
{
	for (const auto &file : files)
	{
		if (file.type == FileType::Folder || file.depth < 2)
		{
			continue;
		}
		PlannedOperation op;
		op.source = file.path;
		op.destination = Join(context.root, file.name);
		op.kind = OperationKind::Move;
		claims.Claim(op);
		result.operations.push_back(op);
	}
}
