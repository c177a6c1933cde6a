#include "core/StatusParser.hpp"

#include <regex>
#include <unordered_map>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {
namespace StatusParser {

namespace {

// The entry patterns cover the fixed fields only. The path is everything after them.
const std::regex& changedEntryRe() {
    static const std::regex re(
        "^1 ([MADRCUTX?!.]{2}) (N\\.\\.\\.|S[C.][M.][U.]) (\\d+) (\\d+) (\\d+) ([a-f0-9]+) ([a-f0-9]+) ");
    return re;
}

const std::regex& renamedOrCopiedEntryRe() {
    static const std::regex re(
        "^2 ([MADRCUTX?!.]{2}) (N\\.\\.\\.|S[C.][M.][U.]) (\\d+) (\\d+) (\\d+) ([a-f0-9]+) ([a-f0-9]+) ([RC]\\d+) ");
    return re;
}

const std::regex& unmergedEntryRe() {
    static const std::regex re(
        "^u ([DAU]{2}) (N\\.\\.\\.|S[C.][M.][U.]) (\\d+) (\\d+) (\\d+) (\\d+) ([a-f0-9]+) ([a-f0-9]+) ([a-f0-9]+) ");
    return re;
}

/// Fixed-field captures of an entry token, or empty when it is malformed.
/// Output captured without -z arrives as one newline-separated token and is
/// rejected here.
std::vector<std::string> matchFixedFields(const std::string& token, const std::regex& re) {
    if (token.find('\n') != std::string::npos) return {};
    return PatternMatcher::prefixMatch(token, re);
}

using S = GitStatusCode;

FileEntry ordinary(OrdinaryChange type, S index, S workingTree) {
    return OrdinaryEntry{type, index, workingTree, std::nullopt};
}

FileEntry renamedOrCopied(RenameKind kind, S index, S workingTree) {
    return RenamedOrCopiedEntry{kind, index, workingTree, std::nullopt};
}

FileEntry manual(UnmergedEntrySummary action, S us, S them) {
    return ManualConflictEntry{ConflictDetails{action, us, them}, std::nullopt};
}

FileEntry withMarkers(UnmergedEntrySummary action, S us, S them) {
    return ConflictsWithMarkersEntry{ConflictDetails{action, us, them}, 0, std::nullopt};
}

/// Status code -> entry without submodule information.
const std::unordered_map<std::string, FileEntry>& statusTable() {
    static const std::unordered_map<std::string, FileEntry> table = {
        {Constants::UNTRACKED_STATUS_CODE, UntrackedEntry{}},

        {".M", ordinary(OrdinaryChange::Modified, S::Unchanged, S::Modified)},
        {"M.", ordinary(OrdinaryChange::Modified, S::Modified, S::Unchanged)},
        {"MM", ordinary(OrdinaryChange::Modified, S::Modified, S::Modified)},
        {"MD", ordinary(OrdinaryChange::Modified, S::Modified, S::Deleted)},
        {".A", ordinary(OrdinaryChange::Added, S::Unchanged, S::Added)},
        {"A.", ordinary(OrdinaryChange::Added, S::Added, S::Unchanged)},
        {"AM", ordinary(OrdinaryChange::Added, S::Added, S::Modified)},
        {"AD", ordinary(OrdinaryChange::Added, S::Added, S::Deleted)},
        {".D", ordinary(OrdinaryChange::Deleted, S::Unchanged, S::Deleted)},
        {"D.", ordinary(OrdinaryChange::Deleted, S::Deleted, S::Unchanged)},

        {".R", renamedOrCopied(RenameKind::Renamed, S::Unchanged, S::Renamed)},
        {"R.", renamedOrCopied(RenameKind::Renamed, S::Renamed, S::Unchanged)},
        {"RM", renamedOrCopied(RenameKind::Renamed, S::Renamed, S::Modified)},
        {"RD", renamedOrCopied(RenameKind::Renamed, S::Renamed, S::Deleted)},
        {".C", renamedOrCopied(RenameKind::Copied, S::Unchanged, S::Copied)},
        {"C.", renamedOrCopied(RenameKind::Copied, S::Copied, S::Unchanged)},
        {"CM", renamedOrCopied(RenameKind::Copied, S::Copied, S::Modified)},
        {"CD", renamedOrCopied(RenameKind::Copied, S::Copied, S::Deleted)},

        {"DD", manual(UnmergedEntrySummary::BothDeleted, S::Deleted, S::Deleted)},
        {"AU", manual(UnmergedEntrySummary::AddedByUs, S::Added, S::UpdatedButUnmerged)},
        {"UD", manual(UnmergedEntrySummary::DeletedByThem, S::UpdatedButUnmerged, S::Deleted)},
        {"UA", manual(UnmergedEntrySummary::AddedByThem, S::UpdatedButUnmerged, S::Added)},
        {"DU", manual(UnmergedEntrySummary::DeletedByUs, S::Deleted, S::UpdatedButUnmerged)},
        {"AA", withMarkers(UnmergedEntrySummary::BothAdded, S::Added, S::Added)},
        {"UU", withMarkers(UnmergedEntrySummary::BothModified, S::UpdatedButUnmerged, S::UpdatedButUnmerged)},
    };
    return table;
}

}

std::vector<StatusItem> parsePorcelain(const std::string& output) {
    std::vector<StatusItem> items;
    std::vector<std::string> tokens = PatternMatcher::split(output, '\0');

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        if (PatternMatcher::startsWith(token, Constants::STATUS_HEADER_PREFIX)) {
            items.push_back(StatusHeader{token.substr(2)});
            continue;
        }

        std::optional<StatusEntry> entry;
        switch (token[0]) {
            case '1':
                entry = parseChangedEntry(token);
                break;
            case '2': {
                // The original path travels in its own token
                std::optional<std::string> oldPath;
                if (i + 1 < tokens.size()) oldPath = tokens[++i];
                entry = parseRenamedOrCopiedEntry(token, oldPath);
                break;
            }
            case 'u':
                entry = parseUnmergedEntry(token);
                break;
            case '?':
                entry = parseUntrackedEntry(token);
                break;
            case '!':
                continue;
            default:
                Logger::instance().warn("Unknown status record: " + token);
                continue;
        }
        if (entry) items.push_back(*entry);
    }

    Logger::instance().debug("Decoded " + std::to_string(items.size()) + " status items from " +
                             std::to_string(tokens.size()) + " tokens");
    return items;
}

std::optional<StatusEntry> parseChangedEntry(const std::string& token) {
    auto m = matchFixedFields(token, changedEntryRe());
    if (m.empty()) {
        Logger::instance().warn("Malformed changed entry: " + token);
        return std::nullopt;
    }
    return StatusEntry{token.substr(m[0].size()), m[1], m[2], std::nullopt};
}

std::optional<StatusEntry> parseRenamedOrCopiedEntry(const std::string& token,
                                                     const std::optional<std::string>& oldPath) {
    auto m = matchFixedFields(token, renamedOrCopiedEntryRe());
    if (m.empty()) {
        Logger::instance().warn("Malformed renamed or copied entry: " + token);
        return std::nullopt;
    }
    if (!oldPath) {
        Logger::instance().warn("Renamed or copied entry without original path: " + token);
        return std::nullopt;
    }
    return StatusEntry{token.substr(m[0].size()), m[1], m[2], oldPath};
}

std::optional<StatusEntry> parseUnmergedEntry(const std::string& token) {
    auto m = matchFixedFields(token, unmergedEntryRe());
    if (m.empty()) {
        Logger::instance().warn("Malformed unmerged entry: " + token);
        return std::nullopt;
    }
    return StatusEntry{token.substr(m[0].size()), m[1], m[2], std::nullopt};
}

StatusEntry parseUntrackedEntry(const std::string& token) {
    std::string path = token.size() > 2 ? token.substr(2) : std::string();
    return StatusEntry{path, Constants::UNTRACKED_STATUS_CODE, Constants::UNTRACKED_SUBMODULE_CODE, std::nullopt};
}

FileEntry mapStatus(const std::string& statusCode, const std::string& submoduleStatusCode) {
    std::optional<SubmoduleStatus> submodule = mapSubmoduleStatus(submoduleStatusCode);

    const auto& table = statusTable();
    auto it = table.find(statusCode);
    if (it == table.end()) {
        Logger::instance().debug("Unrecognized status code '" + statusCode + "', treating as modified");
        return OrdinaryEntry{OrdinaryChange::Modified, std::nullopt, std::nullopt, submodule};
    }

    FileEntry entry = it->second;
    std::visit([&](auto& e) { e.submoduleStatus = submodule; }, entry);
    return entry;
}

std::optional<SubmoduleStatus> mapSubmoduleStatus(const std::string& submoduleStatusCode) {
    if (submoduleStatusCode.size() < 4 || submoduleStatusCode[0] != 'S') return std::nullopt;

    SubmoduleStatus status;
    status.commitChanged = submoduleStatusCode[1] == 'C';
    status.modifiedChanges = submoduleStatusCode[2] == 'M';
    status.untrackedChanges = submoduleStatusCode[3] == 'U';
    return status;
}

}  // namespace StatusParser
}  // namespace gitscribe
