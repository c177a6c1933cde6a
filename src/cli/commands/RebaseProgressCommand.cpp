#include "cli/commands/RebaseProgressCommand.hpp"

#include <cstdio>
#include <iostream>

#include "core/CommitLog.hpp"
#include "core/MultiCommitProgress.hpp"
#include "util/InputSource.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {

namespace {

void printProgress(const MultiCommitOperationProgress& progress) {
    char value[16];
    std::snprintf(value, sizeof(value), "%.2f", progress.value);
    std::cout << progress.position << "/" << progress.totalCommitCount << "\t" << value << "\t"
              << progress.currentCommitSummary << "\n";
}

}

/**
 * @brief Execute 'gitscribe rebase-progress'
 *
 * Lines that carry no progress marker are skipped. Output per marker:
 *   <position>/<total>\t<fraction>\t<summary>
 */
Expected<void> RebaseProgressCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    bool cherryPick = false;
    std::string commitsPath;
    std::string inputPath;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--cherry-pick") {
            cherryPick = true;
        } else if (args[i] == "--commits") {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, "--commits requires a file"};
            commitsPath = args[++i];
        } else if (inputPath.empty()) {
            inputPath = args[i];
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument: " + args[i]};
        }
    }
    if (commitsPath.empty() || inputPath.empty()) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }

    auto log = readFileBytes(commitsPath, ctx.maxInputBytes);
    if (!log) return log.error();
    std::vector<Commit> commits = CommitLog::parse(log.value());

    auto output = readInput(inputPath, *ctx.input, ctx.maxInputBytes);
    if (!output) return output.error();
    const auto lines = PatternMatcher::splitOutputLines(output.value());

    if (cherryPick) {
        CherryPickProgressParser parser(commits);
        for (const auto& line : lines) {
            if (auto progress = parser.parse(line)) printProgress(*progress);
        }
    } else {
        RebaseProgressParser parser(commits);
        for (const auto& line : lines) {
            if (auto progress = parser.parse(line)) printProgress(*progress);
        }
    }
    return {};
}

}
