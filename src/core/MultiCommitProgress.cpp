#include "core/MultiCommitProgress.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <stdexcept>
#include <utility>

#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {

namespace {

std::string summaryAt(const std::vector<Commit>& commits, int position) {
    if (position < 1 || static_cast<size_t>(position) > commits.size()) return std::string();
    return commits[static_cast<size_t>(position) - 1].summary;
}

}

double formatRebaseValue(double value) {
    double clamped = std::max(0.0, std::min(value, 1.0));
    return std::round(clamped * 100.0) / 100.0;
}

RebaseProgressParser::RebaseProgressParser(std::vector<Commit> commits) : commits(std::move(commits)) {}

std::optional<MultiCommitOperationProgress> RebaseProgressParser::parse(const std::string& line) const {
    static const std::regex rebasingRe("Rebasing \\((\\d+)/(\\d+)\\)");

    auto m = PatternMatcher::firstMatch(line, rebasingRe);
    if (m.empty()) return std::nullopt;

    int position = 0;
    int total = 0;
    try {
        position = std::stoi(m[1]);
        total = std::stoi(m[2]);
    } catch (const std::out_of_range&) {
        Logger::instance().warn("Rebase progress out of range: " + line);
        return std::nullopt;
    }

    MultiCommitOperationProgress progress;
    progress.currentCommitSummary = summaryAt(commits, position);
    progress.position = position;
    progress.totalCommitCount = total;
    progress.value = total > 0 ? formatRebaseValue(static_cast<double>(position) / total) : 0.0;
    return progress;
}

CherryPickProgressParser::CherryPickProgressParser(std::vector<Commit> commits, int count)
    : commits(std::move(commits)), picked(count) {}

std::optional<MultiCommitOperationProgress> CherryPickProgressParser::parse(const std::string& line) {
    static const std::regex pickedRe("^\\[(.*\\s.*)\\]");

    if (!PatternMatcher::contains(line, pickedRe)) return std::nullopt;
    ++picked;

    const int total = static_cast<int>(commits.size());

    MultiCommitOperationProgress progress;
    progress.currentCommitSummary = summaryAt(commits, picked);
    progress.position = picked;
    progress.totalCommitCount = total;
    progress.value = total > 0 ? formatRebaseValue(static_cast<double>(picked) / total) : 0.0;
    return progress;
}

}
