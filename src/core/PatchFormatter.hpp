#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/DiffModel.hpp"
#include "core/DiffSelection.hpp"
#include "core/WorkingDirectory.hpp"
#include "util/Expected.hpp"

namespace gitscribe {

/**
 * @brief Rebuild unified-diff patches from a partially selected diff
 *
 * Used for "stage only these lines" (formatPatch, applied to the index)
 * and "discard only these lines" (formatPatchToDiscardChanges, applied in
 * reverse to the working copy). Hunk line counts are recomputed from the
 * lines actually emitted.
 */
namespace PatchFormatter {

/**
 * @brief "--- a/<from>\n+++ b/<to>\n"
 *
 * A missing side is written as /dev/null.
 */
std::string formatPatchHeader(const std::optional<std::string>& fromPath, const std::optional<std::string>& toPath);

/// New and untracked files patch from /dev/null; everything else from its own path.
std::string formatPatchHeaderForFile(const std::string& path, AppFileStatusKind kind);
std::string formatPatchHeaderForFile(const WorkingDirectoryFileChange& file);

/**
 * @brief "@@ -<old>[,<n>] +<new>[,<n>] @@[ <heading>]\n"
 *
 * The count is omitted when it is 1.
 * Example: formatHunkHeader(10, 1, 10, 3) -> "@@ -10 +10,3 @@\n"
 */
std::string formatHunkHeader(int oldStartLine, int oldLineCount, int newStartLine, int newLineCount,
                             const std::string& sectionHeading = std::string());

/**
 * @brief Patch containing only the selected changes of a file
 *
 * @return Patch text, or EmptyPatch when no hunk has a selected change
 */
Expected<std::string> formatPatch(const std::string& path, AppFileStatusKind kind,
                                  const std::vector<DiffHunk>& hunks, const DiffSelection& selection);

/// Same, taking the path, status and selection from a working directory change.
Expected<std::string> formatPatch(const WorkingDirectoryFileChange& file, const TextDiff& diff);

/**
 * @brief Reverse patch that removes the selected changes from the working copy
 *
 * Selected additions become deletions and selected deletions become
 * additions. Hunks start at the new-file line on both sides.
 *
 * @return Patch text, or EmptyPatch when nothing is selected
 */
Expected<std::string> formatPatchToDiscardChanges(const std::string& path, const TextDiff& diff,
                                                  const DiffSelection& selection);

}  // namespace PatchFormatter

}
