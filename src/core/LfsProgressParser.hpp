#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "core/ProgressParser.hpp"

namespace gitscribe {

struct FileProgress {
    std::int64_t transferred{0};
    std::int64_t size{0};
    bool done{false};
};

/**
 * @brief Progress of Git LFS transfers
 *
 * git-lfs writes one line per update to the file named by
 * GIT_LFS_PROGRESS:
 *   <direction> <n>/<estimated files> <transferred>/<size> <file>
 * e.g. "download 1/3 1024/4096 assets/big.psd".
 *
 * Files are remembered for the lifetime of the parser so totals include
 * finished transfers.
 */
class LfsProgressParser {
public:
    ProgressResult parse(const std::string& line);

    const std::map<std::string, FileProgress>& files() const { return fileProgress; }

    /// "Downloading", "Uploading" or "Checking out"; unknown directions download.
    static const char* directionVerb(const std::string& direction);

private:
    std::map<std::string, FileProgress> fileProgress;
    int lastPercent{0};
};

}
