#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/StatusEntry.hpp"

namespace gitscribe {

/**
 * @brief Decoder for `git status --porcelain=2 -z` output
 *
 * Input layout (tokens separated by NUL):
 *   # branch.oid <sha>
 *   1 <XY> <sub> <mH> <mI> <mW> <hH> <hI> <path>
 *   2 <XY> <sub> <mH> <mI> <mW> <hH> <hI> <X><score> <path>  NUL  <origPath>
 *   u <XY> <sub> <m1> <m2> <m3> <mW> <h1> <h2> <h3> <path>
 *   ? <path>
 *   ! <path>
 *
 * Ignored entries are never surfaced. Tokens that do not fit their record
 * layout are dropped with a warning.
 */
namespace StatusParser {

std::vector<StatusItem> parsePorcelain(const std::string& output);

/// "1 ..." record.
std::optional<StatusEntry> parseChangedEntry(const std::string& token);

/// "2 ..." record; oldPath is the token that followed it in the stream.
std::optional<StatusEntry> parseRenamedOrCopiedEntry(const std::string& token,
                                                     const std::optional<std::string>& oldPath);

/// "u ..." record.
std::optional<StatusEntry> parseUnmergedEntry(const std::string& token);

/// "? <path>" record.
StatusEntry parseUntrackedEntry(const std::string& token);

/**
 * @brief Map a raw status code to its typed entry
 *
 * Total: codes missing from the table produce an OrdinaryEntry of type
 * Modified with unknown index and working tree sides.
 */
FileEntry mapStatus(const std::string& statusCode, const std::string& submoduleStatusCode);

/// nullopt unless the code starts with 'S'.
std::optional<SubmoduleStatus> mapSubmoduleStatus(const std::string& submoduleStatusCode);

}  // namespace StatusParser

}
