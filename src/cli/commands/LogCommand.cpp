#include "cli/commands/LogCommand.hpp"

#include <iostream>

#include "core/CommitLog.hpp"
#include "util/InputSource.hpp"

namespace gitscribe {

Expected<void> LogCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() == 1 && args[0] == "--format-args") {
        for (const auto& arg : CommitLog::formatArgs()) std::cout << arg << "\n";
        return {};
    }
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }

    auto output = readInput(args[0], *ctx.input, ctx.maxInputBytes);
    if (!output) return output.error();

    for (const auto& commit : CommitLog::parse(output.value())) {
        std::cout << commit.shortSha << " " << commit.summary << "\n";
    }
    return {};
}

}
