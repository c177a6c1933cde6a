#include "core/WorkingDirectory.hpp"

#include <algorithm>
#include <regex>
#include <type_traits>

#include "core/StatusParser.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {

const char* toString(AppFileStatusKind kind) {
    switch (kind) {
        case AppFileStatusKind::New: return "new";
        case AppFileStatusKind::Modified: return "modified";
        case AppFileStatusKind::Deleted: return "deleted";
        case AppFileStatusKind::Copied: return "copied";
        case AppFileStatusKind::Renamed: return "renamed";
        case AppFileStatusKind::Conflicted: return "conflicted";
        case AppFileStatusKind::Untracked: return "untracked";
    }
    return "unknown";
}

namespace WorkingDirectory {

namespace {

AppFileStatus conflictedStatus(const std::string& path, const ConflictDetails& details,
                               bool textConflict, const ConflictFilesDetails& conflictDetails) {
    AppFileStatus status;
    status.kind = AppFileStatusKind::Conflicted;
    status.conflict = details;

    bool markerAction = details.action == UnmergedEntrySummary::BothAdded ||
                        details.action == UnmergedEntrySummary::BothModified;
    bool binary = conflictDetails.binaryFilePaths.count(path) > 0;
    if (textConflict && markerAction && !binary) {
        status.hasConflictMarkers = true;
        auto it = conflictDetails.conflictCountsByPath.find(path);
        status.conflictMarkerCount = it == conflictDetails.conflictCountsByPath.end() ? 0 : it->second;
    }
    return status;
}

}

std::map<std::string, int> parseConflictMarkerCounts(const std::string& diffCheckOutput) {
    static const std::regex markerLine("^(.+):\\d+: leftover conflict marker$", std::regex::icase);

    std::map<std::string, int> counts;
    for (const auto& line : PatternMatcher::splitLines(diffCheckOutput)) {
        auto m = PatternMatcher::fullMatch(line, markerLine);
        if (!m.empty()) ++counts[m[1]];
    }
    return counts;
}

std::set<std::string> parseBinaryPaths(const std::string& numstatOutput) {
    const std::string binaryPrefix = "-\t-\t";

    std::set<std::string> paths;
    std::vector<std::string> tokens = PatternMatcher::split(numstatOutput, '\0', true);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        size_t first = token.find('\t');
        size_t second = first == std::string::npos ? std::string::npos : token.find('\t', first + 1);
        if (second == std::string::npos) continue;

        std::string path = token.substr(second + 1);
        if (path.empty()) {
            // "<added>\t<deleted>\t" NUL <old> NUL <new>
            if (i + 2 >= tokens.size()) break;
            path = tokens[i + 2];
            i += 2;
        }
        if (PatternMatcher::startsWith(token, binaryPrefix)) paths.insert(path);
    }
    return paths;
}

bool isConflictStatusCode(const std::string& statusCode) {
    static const char* const codes[] = {"DD", "AU", "UD", "UA", "DU", "AA", "UU"};
    return std::any_of(std::begin(codes), std::end(codes), [&](const char* c) { return statusCode == c; });
}

AppFileStatus convertToAppStatus(const std::string& path, const FileEntry& entry,
                                 const ConflictFilesDetails& conflictDetails,
                                 const std::optional<std::string>& oldPath) {
    return std::visit(
        [&](const auto& e) -> AppFileStatus {
            using T = std::decay_t<decltype(e)>;
            AppFileStatus status;
            if constexpr (std::is_same_v<T, OrdinaryEntry>) {
                switch (e.type) {
                    case OrdinaryChange::Added: status.kind = AppFileStatusKind::New; break;
                    case OrdinaryChange::Modified: status.kind = AppFileStatusKind::Modified; break;
                    case OrdinaryChange::Deleted: status.kind = AppFileStatusKind::Deleted; break;
                }
                status.submoduleStatus = e.submoduleStatus;
            } else if constexpr (std::is_same_v<T, RenamedOrCopiedEntry>) {
                status.kind = e.kind == RenameKind::Copied ? AppFileStatusKind::Copied : AppFileStatusKind::Renamed;
                status.oldPath = oldPath;
                status.submoduleStatus = e.submoduleStatus;
            } else if constexpr (std::is_same_v<T, UntrackedEntry>) {
                status.kind = AppFileStatusKind::Untracked;
                status.submoduleStatus = e.submoduleStatus;
            } else if constexpr (std::is_same_v<T, ConflictsWithMarkersEntry>) {
                status = conflictedStatus(path, e.details, true, conflictDetails);
            } else {
                status = conflictedStatus(path, e.details, false, conflictDetails);
            }
            return status;
        },
        entry);
}

Expected<StatusResult> buildStatusResult(const std::string& output, const ConflictFilesDetails& conflictDetails,
                                         size_t maxOutputBytes) {
    if (output.size() > maxOutputBytes) {
        return Error{ErrorCode::InputTooLarge, "status output exceeds " + std::to_string(maxOutputBytes) + " bytes"};
    }

    std::vector<StatusItem> items = StatusParser::parsePorcelain(output);

    StatusResult result;
    result.headers = StatusHeaders::fromItems(items);

    for (const auto& item : items) {
        const auto* entry = std::get_if<StatusEntry>(&item);
        if (!entry) continue;

        if (isConflictStatusCode(entry->statusCode)) result.doConflictedFilesExist = true;

        FileEntry mapped = StatusParser::mapStatus(entry->statusCode, entry->submoduleStatusCode);
        if (const auto* ordinary = std::get_if<OrdinaryEntry>(&mapped)) {
            // Added then deleted before commit: nothing left to show
            if (ordinary->index == GitStatusCode::Added && ordinary->workingTree == GitStatusCode::Deleted) continue;
        }

        AppFileStatus status = convertToAppStatus(entry->path, mapped, conflictDetails, entry->oldPath);

        bool untouchedSubmodule = status.kind == AppFileStatusKind::Modified && status.submoduleStatus &&
                                  !status.submoduleStatus->commitChanged;
        DiffSelection selection(untouchedSubmodule ? DiffSelectionType::None : DiffSelectionType::All);

        result.files.insert_or_assign(entry->path, WorkingDirectoryFileChange{entry->path, status, selection});
    }

    Logger::instance().debug("Working directory has " + std::to_string(result.files.size()) + " changed files");
    return result;
}

}  // namespace WorkingDirectory
}  // namespace gitscribe
