#pragma once

#include <cstddef>

/**
 * @brief Fixed strings and limits of the git output formats we decode
 *
 * Centralizes magic values to improve maintainability and readability.
 */
namespace gitscribe {

namespace Constants {
    // Inputs larger than this are refused (status output of a huge worktree)
    constexpr size_t MAX_STATUS_BUFFER_SIZE = 20000000;

    // Porcelain v2 markers
    constexpr const char* STATUS_HEADER_PREFIX = "# ";
    constexpr const char* UNTRACKED_STATUS_CODE = "??";
    constexpr const char* UNTRACKED_SUBMODULE_CODE = "????";

    // Unified diff
    constexpr const char* DEV_NULL = "/dev/null";
    constexpr const char* NO_NEWLINE_MARKER = "\\ No newline at end of file";

    // Push rejection for oversized files (one begin/end pair per file)
    constexpr const char* FILE_SIZE_BEGIN_MARKER = "remote: error: File ";
    constexpr const char* FILE_SIZE_END_MARKER = "; this exceeds GitHub's file size limit of 100.00 MB";

    // Progress
    constexpr const char* PROGRESS_DONE_MARKER = "done.";
}
}
