#pragma once

#include <string>
#include <vector>

namespace gitscribe {

/// A commit as listed by `git log`.
struct Commit {
    std::string sha;
    std::string shortSha;
    std::string summary;
    std::string body;
    std::string authorName;
    std::string authorEmail;
    std::string authorDate;
    std::vector<std::string> parentSHAs;
};

/**
 * @brief Decoder for `git log -z --format=<fields>` output
 *
 * Fields of a commit are joined with %x00 and -z ends every commit with a
 * NUL, so the output is a flat NUL-separated token stream read in groups
 * of fieldCount(). A trailing incomplete group is dropped.
 */
namespace CommitLog {

/// Arguments to pass to `git log` to produce the decoded layout.
std::vector<std::string> formatArgs();

size_t fieldCount();

std::vector<Commit> parse(const std::string& output);

}  // namespace CommitLog

}
