#ifndef OPERATIONPLANNER_H
#define OPERATIONPLANNER_H

#include "SmartMoveTypes.h"
#include "NameTransformer.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

struct PlanningContext
{
	fs::path root;
	const FileSnapshot *snapshot = nullptr;
	const NameTransform *transform = nullptr; // naming commands only
};

// Tracks which destinations are taken, in the snapshot or by this batch
class DestinationClaims
{
public:
	DestinationClaims(const FileSnapshot &snapshot, bool force);

	// Sets op.state and op.reason from op.destination, claiming it when usable
	void Claim(PlannedOperation &op);
	void Reserve(const fs::path &path);
	std::optional<FileType> OccupiedType(const fs::path &path) const;

private:
	const FileSnapshot &m_snapshot;
	bool m_force;
	std::set<fs::path> m_claimed;
};

class OperationPlanner
{
public:
	// Pure: reads only 'files' and the snapshot in 'context'
	static PlanResult Plan(const std::vector<FileMetadata> &files, const Command &command, const FlagSet &flags, const PlanningContext &context);

	// Keeps entries that are not inside another entry of the list
	static std::vector<FileMetadata> DropDescendants(const std::vector<FileMetadata> &files);
	static bool IsWithin(const fs::path &path, const fs::path &folder);
	static fs::path Join(const fs::path &folder, const std::string &name);

private:
	static void PlanRenames(const std::vector<FileMetadata> &files, const NameTransform &transform, DestinationClaims &claims, PlanResult &result);
	static void PlanTransfers(const std::vector<FileMetadata> &files, const Command &command, const FlagSet &flags, const PlanningContext &context, DestinationClaims &claims, PlanResult &result);
	static void PlanRemovals(const std::vector<FileMetadata> &files, const FlagSet &flags, PlanResult &result);
	static void PlanCreation(const Command &command, const PlanningContext &context, PlanResult &result);
	static void PlanGroup(const std::vector<FileMetadata> &files, const PlanningContext &context, DestinationClaims &claims, PlanResult &result);
	static void PlanFlatten(const std::vector<FileMetadata> &files, const PlanningContext &context, DestinationClaims &claims, PlanResult &result);
};

#endif // OPERATIONPLANNER_H
