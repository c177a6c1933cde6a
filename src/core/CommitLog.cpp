#include "core/CommitLog.hpp"

#include <utility>

#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {
namespace CommitLog {

namespace {

// Order defines the token layout of each commit
const char* const kFields[] = {"%H", "%h", "%s", "%b", "%an", "%ae", "%ad", "%P"};

}

std::vector<std::string> formatArgs() {
    std::string format;
    for (const char* field : kFields) {
        if (!format.empty()) format += "%x00";
        format += field;
    }
    return {"-z", "--format=" + format, "--date=raw"};
}

size_t fieldCount() {
    return sizeof(kFields) / sizeof(kFields[0]);
}

std::vector<Commit> parse(const std::string& output) {
    const size_t n = fieldCount();
    std::vector<std::string> tokens = PatternMatcher::split(output, '\0', true);

    std::vector<Commit> commits;
    size_t i = 0;
    for (; i + n <= tokens.size(); i += n) {
        Commit commit;
        commit.sha = tokens[i];
        commit.shortSha = tokens[i + 1];
        commit.summary = tokens[i + 2];
        commit.body = PatternMatcher::trim(tokens[i + 3]);
        commit.authorName = tokens[i + 4];
        commit.authorEmail = tokens[i + 5];
        commit.authorDate = tokens[i + 6];
        commit.parentSHAs = PatternMatcher::split(tokens[i + 7], ' ');
        commits.push_back(std::move(commit));
    }

    if (i < tokens.size()) {
        Logger::instance().warn("Dropping incomplete commit record (" + std::to_string(tokens.size() - i) +
                                " of " + std::to_string(n) + " fields)");
    }
    return commits;
}

}  // namespace CommitLog
}  // namespace gitscribe
