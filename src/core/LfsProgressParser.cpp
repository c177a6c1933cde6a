#include "core/LfsProgressParser.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {

const char* LfsProgressParser::directionVerb(const std::string& direction) {
    if (direction == "upload") return "Uploading";
    if (direction == "checkout") return "Checking out";
    return "Downloading";
}

ProgressResult LfsProgressParser::parse(const std::string& line) {
    static const std::regex lineRe("^(.+?)\\s{1}(\\d+)/(\\d+)\\s{1}(\\d+)/(\\d+)\\s{1}(.+)$");

    auto m = PatternMatcher::fullMatch(line, lineRe);
    if (m.empty()) {
        return ProgressResult{ProgressKind::Context, lastPercent, line, std::nullopt};
    }

    std::int64_t estimatedFileCount = 0;
    FileProgress file;
    try {
        estimatedFileCount = std::stoll(m[3]);
        file.transferred = std::stoll(m[4]);
        file.size = std::stoll(m[5]);
    } catch (const std::out_of_range&) {
        Logger::instance().warn("LFS progress counts out of range: " + line);
        return ProgressResult{ProgressKind::Context, lastPercent, line, std::nullopt};
    }
    file.done = file.transferred == file.size;

    const std::string& direction = m[1];
    const std::string& fileName = m[6];
    fileProgress[fileName] = file;

    std::int64_t totalTransferred = 0;
    std::int64_t totalEstimated = 0;
    std::int64_t finishedFiles = 0;
    for (const auto& entry : fileProgress) {
        totalTransferred += entry.second.transferred;
        totalEstimated += entry.second.size;
        if (entry.second.done) ++finishedFiles;
    }
    const std::int64_t fileCount = std::max<std::int64_t>(estimatedFileCount, fileProgress.size());

    const std::string verb = directionVerb(direction);

    GitProgressInfo info;
    info.title = verb + " \"" + fileName + "\"";
    info.value = totalTransferred;
    info.total = totalEstimated;
    if (totalEstimated > 0) {
        info.percent = static_cast<int>(static_cast<double>(totalTransferred) / static_cast<double>(totalEstimated) * 100.0);
    }
    info.done = finishedFiles == fileCount;
    info.text = verb + " " + fileName + " (" + std::to_string(finishedFiles) + " out of an estimated " +
                std::to_string(fileCount) + " completed, " + std::to_string(totalTransferred) + " / " +
                std::to_string(totalEstimated) + ")";

    lastPercent = info.percent.value_or(0);
    return ProgressResult{ProgressKind::Progress, lastPercent, info.text, info};
}

}
