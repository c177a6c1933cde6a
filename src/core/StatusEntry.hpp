#pragma once

#include <optional>
#include <string>
#include <variant>

namespace gitscribe {

/**
 * @brief One side (index or working tree) of a porcelain status code
 *
 * The enumerator values are the characters git prints.
 */
enum class GitStatusCode : char {
    Modified = 'M',
    Added = 'A',
    Deleted = 'D',
    Renamed = 'R',
    Copied = 'C',
    Unchanged = '.',
    Untracked = '?',
    Ignored = '!',
    UpdatedButUnmerged = 'U'
};

inline char toChar(GitStatusCode code) { return static_cast<char>(code); }

/// Flags decoded from a 4-character "S<c><m><u>" submodule code.
struct SubmoduleStatus {
    bool commitChanged{false};
    bool modifiedChanges{false};
    bool untrackedChanges{false};
};

/// Who did what in an unmerged entry.
enum class UnmergedEntrySummary {
    AddedByUs,
    DeletedByUs,
    AddedByThem,
    DeletedByThem,
    BothDeleted,
    BothAdded,
    BothModified
};

inline const char* toString(UnmergedEntrySummary summary) {
    switch (summary) {
        case UnmergedEntrySummary::AddedByUs: return "added-by-us";
        case UnmergedEntrySummary::DeletedByUs: return "deleted-by-us";
        case UnmergedEntrySummary::AddedByThem: return "added-by-them";
        case UnmergedEntrySummary::DeletedByThem: return "deleted-by-them";
        case UnmergedEntrySummary::BothDeleted: return "both-deleted";
        case UnmergedEntrySummary::BothAdded: return "both-added";
        case UnmergedEntrySummary::BothModified: return "both-modified";
    }
    return "unknown";
}

struct ConflictDetails {
    UnmergedEntrySummary action{UnmergedEntrySummary::BothModified};
    GitStatusCode us{GitStatusCode::UpdatedButUnmerged};
    GitStatusCode them{GitStatusCode::UpdatedButUnmerged};
};

enum class OrdinaryChange { Added, Modified, Deleted };

/**
 * @brief Added, modified or deleted file
 *
 * index/workingTree are empty for codes git introduced after this table was
 * written (the "modified, unknown sub-state" fallback).
 */
struct OrdinaryEntry {
    OrdinaryChange type{OrdinaryChange::Modified};
    std::optional<GitStatusCode> index;
    std::optional<GitStatusCode> workingTree;
    std::optional<SubmoduleStatus> submoduleStatus;
};

enum class RenameKind { Renamed, Copied };

struct RenamedOrCopiedEntry {
    RenameKind kind{RenameKind::Renamed};
    std::optional<GitStatusCode> index;
    std::optional<GitStatusCode> workingTree;
    std::optional<SubmoduleStatus> submoduleStatus;
};

struct UntrackedEntry {
    std::optional<SubmoduleStatus> submoduleStatus;
};

/// Both sides touched the text (AA, UU); resolvable by editing conflict markers.
struct ConflictsWithMarkersEntry {
    ConflictDetails details;
    int conflictMarkerCount{0};
    std::optional<SubmoduleStatus> submoduleStatus;
};

/// Conflicts that need a choice of side (DD, AU, UD, UA, DU).
struct ManualConflictEntry {
    ConflictDetails details;
    std::optional<SubmoduleStatus> submoduleStatus;
};

using FileEntry = std::variant<OrdinaryEntry, RenamedOrCopiedEntry, UntrackedEntry,
                               ConflictsWithMarkersEntry, ManualConflictEntry>;

inline std::optional<SubmoduleStatus> submoduleStatusOf(const FileEntry& entry) {
    return std::visit([](const auto& e) { return e.submoduleStatus; }, entry);
}

/// "# <value>" line of the status stream, value kept verbatim.
struct StatusHeader {
    std::string value;
};

/// One decoded status record, codes still in git's raw form.
struct StatusEntry {
    std::string path;
    std::string statusCode;           // 2 characters, "??" for untracked
    std::string submoduleStatusCode;  // "N..." or "S<c><m><u>"; "????" for untracked
    std::optional<std::string> oldPath;
};

using StatusItem = std::variant<StatusHeader, StatusEntry>;

}
