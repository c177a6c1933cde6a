#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/DiffSelection.hpp"
#include "core/StatusEntry.hpp"
#include "core/StatusHeaders.hpp"
#include "util/Expected.hpp"

namespace gitscribe {

enum class AppFileStatusKind { New, Modified, Deleted, Copied, Renamed, Conflicted, Untracked };

const char* toString(AppFileStatusKind kind);

/**
 * @brief Status of a working directory file as presented to a user
 *
 * oldPath is set for Copied and Renamed. conflict is set for Conflicted;
 * hasConflictMarkers tells a text conflict (resolved by editing markers)
 * from one that needs a side to be chosen.
 */
struct AppFileStatus {
    AppFileStatusKind kind{AppFileStatusKind::Modified};
    std::optional<SubmoduleStatus> submoduleStatus;
    std::optional<std::string> oldPath;
    std::optional<ConflictDetails> conflict;
    bool hasConflictMarkers{false};
    int conflictMarkerCount{0};
};

/// What is known about conflicted files beyond their status code.
struct ConflictFilesDetails {
    std::map<std::string, int> conflictCountsByPath;
    std::set<std::string> binaryFilePaths;
};

struct WorkingDirectoryFileChange {
    std::string path;
    AppFileStatus status;
    DiffSelection selection;

    WorkingDirectoryFileChange withIncludeAll(bool include) const {
        return WorkingDirectoryFileChange{path, status, include ? selection.withSelectAll() : selection.withSelectNone()};
    }
};

struct StatusResult {
    StatusHeadersData headers;
    std::map<std::string, WorkingDirectoryFileChange> files;  // keyed by path
    bool doConflictedFilesExist{false};
};

namespace WorkingDirectory {

/**
 * @brief Count conflict markers per path from `git diff --check` output
 *
 * Each "<path>:<line>: leftover conflict marker" line counts once for <path>.
 */
std::map<std::string, int> parseConflictMarkerCounts(const std::string& diffCheckOutput);

/**
 * @brief Binary paths from `git diff --numstat -z` output
 *
 * Binary files report "-" for both counts. Renames carry an empty path in
 * the count token followed by the old and new paths; the new path is kept.
 */
std::set<std::string> parseBinaryPaths(const std::string& numstatOutput);

/// True for the unmerged codes DD AU UD UA DU AA UU.
bool isConflictStatusCode(const std::string& statusCode);

AppFileStatus convertToAppStatus(const std::string& path, const FileEntry& entry,
                                 const ConflictFilesDetails& conflictDetails,
                                 const std::optional<std::string>& oldPath);

/**
 * @brief Working directory status from a raw porcelain v2 stream
 *
 * @return StatusResult, or InputTooLarge when output exceeds maxOutputBytes
 */
Expected<StatusResult> buildStatusResult(const std::string& output, const ConflictFilesDetails& conflictDetails,
                                         size_t maxOutputBytes);

}  // namespace WorkingDirectory

}
