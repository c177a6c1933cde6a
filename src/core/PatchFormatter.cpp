#include "core/PatchFormatter.hpp"

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace gitscribe {
namespace PatchFormatter {

namespace {

/// Lines and counts of one rebuilt hunk.
struct HunkBuffer {
    std::string text;
    int oldCount{0};
    int newCount{0};
    bool anyAdditionsOrDeletions{false};

    void emit(const std::string& line, bool countOld, bool countNew) {
        text += line;
        text += '\n';
        if (countOld) ++oldCount;
        if (countNew) ++newCount;
    }
};

std::string lineInfo(int start, int count) {
    return count == 1 ? std::to_string(start) : std::to_string(start) + "," + std::to_string(count);
}

}

std::string formatPatchHeader(const std::optional<std::string>& fromPath, const std::optional<std::string>& toPath) {
    std::string from = fromPath ? "a/" + *fromPath : std::string(Constants::DEV_NULL);
    std::string to = toPath ? "b/" + *toPath : std::string(Constants::DEV_NULL);
    return "--- " + from + "\n+++ " + to + "\n";
}

std::string formatPatchHeaderForFile(const std::string& path, AppFileStatusKind kind) {
    switch (kind) {
        case AppFileStatusKind::New:
        case AppFileStatusKind::Untracked:
            return formatPatchHeader(std::nullopt, path);
        case AppFileStatusKind::Modified:
        case AppFileStatusKind::Deleted:
        case AppFileStatusKind::Copied:
        case AppFileStatusKind::Renamed:
        case AppFileStatusKind::Conflicted:
            break;
    }
    return formatPatchHeader(path, path);
}

std::string formatPatchHeaderForFile(const WorkingDirectoryFileChange& file) {
    return formatPatchHeaderForFile(file.path, file.status.kind);
}

std::string formatHunkHeader(int oldStartLine, int oldLineCount, int newStartLine, int newLineCount,
                             const std::string& sectionHeading) {
    std::string header = "@@ -" + lineInfo(oldStartLine, oldLineCount) + " +" + lineInfo(newStartLine, newLineCount) + " @@";
    if (!sectionHeading.empty()) header += " " + sectionHeading;
    return header + "\n";
}

Expected<std::string> formatPatch(const std::string& path, AppFileStatusKind kind,
                                  const std::vector<DiffHunk>& hunks, const DiffSelection& selection) {
    const bool newFile = kind == AppFileStatusKind::New || kind == AppFileStatusKind::Untracked;
    std::string patch;

    for (const auto& hunk : hunks) {
        HunkBuffer buf;
        for (size_t lineIndex = 0; lineIndex < hunk.lines.size(); ++lineIndex) {
            const DiffLine& line = hunk.lines[lineIndex];
            const int absoluteIndex = hunk.unifiedDiffStart + static_cast<int>(lineIndex);

            if (line.type == DiffLineType::Hunk) continue;

            if (line.type == DiffLineType::Context) {
                buf.emit(line.text, true, true);
            } else if (selection.isSelected(absoluteIndex)) {
                buf.emit(line.text, line.type == DiffLineType::Delete, line.type == DiffLineType::Add);
                buf.anyAdditionsOrDeletions = true;
            } else if (line.type == DiffLineType::Add && !newFile) {
                // Stays in the working copy but is not staged
                buf.emit(" " + line.content(), true, true);
            } else {
                continue;
            }

            if (line.noTrailingNewLine) buf.emit(Constants::NO_NEWLINE_MARKER, false, false);
        }

        if (!buf.anyAdditionsOrDeletions) continue;
        patch += formatHunkHeader(hunk.header.oldStartLine, buf.oldCount, hunk.header.newStartLine, buf.newCount,
                                  hunk.header.sectionHeading);
        patch += buf.text;
    }

    if (patch.empty()) {
        Logger::instance().debug("No selected changes for " + path);
        return Error{ErrorCode::EmptyPatch, "Could not generate a patch, no changes for file " + path};
    }
    return formatPatchHeaderForFile(path, kind) + patch;
}

Expected<std::string> formatPatch(const WorkingDirectoryFileChange& file, const TextDiff& diff) {
    return formatPatch(file.path, file.status.kind, diff.hunks, file.selection);
}

Expected<std::string> formatPatchToDiscardChanges(const std::string& path, const TextDiff& diff,
                                                  const DiffSelection& selection) {
    std::string patch;

    for (const auto& hunk : diff.hunks) {
        HunkBuffer buf;
        for (size_t lineIndex = 0; lineIndex < hunk.lines.size(); ++lineIndex) {
            const DiffLine& line = hunk.lines[lineIndex];
            const int absoluteIndex = hunk.unifiedDiffStart + static_cast<int>(lineIndex);

            switch (line.type) {
                case DiffLineType::Hunk:
                    continue;
                case DiffLineType::Context:
                    buf.emit(line.text, true, true);
                    break;
                case DiffLineType::Add:
                    if (selection.isSelected(absoluteIndex)) {
                        buf.emit("-" + line.content(), true, false);
                        buf.anyAdditionsOrDeletions = true;
                    } else {
                        buf.emit(" " + line.content(), true, true);
                    }
                    break;
                case DiffLineType::Delete:
                    if (!selection.isSelected(absoluteIndex)) continue;
                    buf.emit("+" + line.content(), false, true);
                    buf.anyAdditionsOrDeletions = true;
                    break;
            }

            if (line.noTrailingNewLine) buf.emit(Constants::NO_NEWLINE_MARKER, false, false);
        }

        if (!buf.anyAdditionsOrDeletions) continue;
        patch += formatHunkHeader(hunk.header.newStartLine, buf.oldCount, hunk.header.newStartLine, buf.newCount,
                                  hunk.header.sectionHeading);
        patch += buf.text;
    }

    if (patch.empty()) {
        Logger::instance().debug("Nothing selected to discard in " + path);
        return Error{ErrorCode::EmptyPatch, "Nothing to discard for file " + path};
    }
    return formatPatchHeader(path, path) + patch;
}

}  // namespace PatchFormatter
}  // namespace gitscribe
