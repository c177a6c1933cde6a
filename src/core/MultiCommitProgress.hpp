#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/CommitLog.hpp"

namespace gitscribe {

/// Progress through a rebase or cherry-pick of a known list of commits.
struct MultiCommitOperationProgress {
    std::string currentCommitSummary;  // empty when the position is outside the list
    int position{0};                   // 1-based
    int totalCommitCount{0};
    double value{0.0};                 // completed fraction, 0..1 in steps of 0.01
};

/// Clamp to [0, 1] and round to two decimals.
double formatRebaseValue(double value);

/// Follows "Rebasing (i/n)" markers in rebase output.
class RebaseProgressParser {
public:
    explicit RebaseProgressParser(std::vector<Commit> commits);

    std::optional<MultiCommitOperationProgress> parse(const std::string& line) const;

private:
    std::vector<Commit> commits;
};

/**
 * @brief Counts the "[<branch> <sha>] <summary>" lines cherry-pick prints
 *        for each applied commit
 */
class CherryPickProgressParser {
public:
    explicit CherryPickProgressParser(std::vector<Commit> commits, int count = 0);

    std::optional<MultiCommitOperationProgress> parse(const std::string& line);

    int count() const { return picked; }

private:
    std::vector<Commit> commits;
    int picked;
};

}
