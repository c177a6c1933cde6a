#include "cli/commands/StatusCommand.hpp"

#include <iostream>

#include "core/WorkingDirectory.hpp"
#include "util/InputSource.hpp"

namespace gitscribe {

namespace {

void printHeaders(const StatusHeadersData& headers) {
    std::cout << "# branch: " << headers.currentBranch.value_or("(detached)") << "\n";
    if (headers.currentTip) std::cout << "# tip: " << *headers.currentTip << "\n";
    if (headers.currentUpstreamBranch) std::cout << "# upstream: " << *headers.currentUpstreamBranch << "\n";
    if (headers.branchAheadBehind) {
        std::cout << "# ahead " << headers.branchAheadBehind->ahead << ", behind " << headers.branchAheadBehind->behind
                  << "\n";
    }
}

void printFile(const WorkingDirectoryFileChange& file) {
    const AppFileStatus& status = file.status;
    std::cout << toString(status.kind) << "\t" << file.path;

    if (status.oldPath) std::cout << "\tfrom " << *status.oldPath;
    if (status.conflict) {
        std::cout << "\t" << toString(status.conflict->action);
        if (status.hasConflictMarkers) std::cout << ", " << status.conflictMarkerCount << " conflict markers";
    }
    if (status.submoduleStatus) {
        std::cout << "\tsubmodule";
        if (status.submoduleStatus->commitChanged) std::cout << " commit-changed";
        if (status.submoduleStatus->modifiedChanges) std::cout << " modified";
        if (status.submoduleStatus->untrackedChanges) std::cout << " untracked";
    }
    if (file.selection.areNoneSelected()) std::cout << "\t(excluded)";
    std::cout << "\n";
}

}

/**
 * @brief Execute 'gitscribe status'
 *
 * Prints "# ..." branch lines, then "<kind>\t<path>[\t<details>]" per file
 * in path order.
 */
Expected<void> StatusCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    ConflictFilesDetails conflictDetails;
    std::string inputPath;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if ((arg == "--conflicts" || arg == "--numstat" || arg == "--binary") && i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, arg + " requires a value"};
        }
        if (arg == "--conflicts") {
            auto text = readFileBytes(args[++i], ctx.maxInputBytes);
            if (!text) return text.error();
            conflictDetails.conflictCountsByPath = WorkingDirectory::parseConflictMarkerCounts(text.value());
        } else if (arg == "--numstat") {
            auto text = readFileBytes(args[++i], ctx.maxInputBytes);
            if (!text) return text.error();
            for (const auto& path : WorkingDirectory::parseBinaryPaths(text.value())) {
                conflictDetails.binaryFilePaths.insert(path);
            }
        } else if (arg == "--binary") {
            conflictDetails.binaryFilePaths.insert(args[++i]);
        } else if (inputPath.empty()) {
            inputPath = arg;
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument: " + arg};
        }
    }
    if (inputPath.empty()) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }

    auto output = readInput(inputPath, *ctx.input, ctx.maxInputBytes);
    if (!output) return output.error();

    auto result = WorkingDirectory::buildStatusResult(output.value(), conflictDetails, ctx.maxInputBytes);
    if (!result) return result.error();

    printHeaders(result.value().headers);
    if (result.value().doConflictedFilesExist) std::cout << "# conflicts present\n";
    for (const auto& entry : result.value().files) {
        printFile(entry.second);
    }
    return {};
}

}
