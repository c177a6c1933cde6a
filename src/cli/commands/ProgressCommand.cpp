#include "cli/commands/ProgressCommand.hpp"

#include <iostream>

#include "core/ProgressParser.hpp"
#include "util/InputSource.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {

Expected<void> ProgressCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::string operation = "clone";
    std::string inputPath;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--steps") {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, "--steps requires an operation"};
            operation = args[++i];
        } else if (inputPath.empty()) {
            inputPath = args[i];
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument: " + args[i]};
        }
    }
    if (inputPath.empty()) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }

    auto steps = ProgressSteps::forOperation(operation);
    if (!steps) {
        return Error{ErrorCode::InvalidArgs, "unknown operation '" + operation + "'"};
    }

    auto output = readInput(inputPath, *ctx.input, ctx.maxInputBytes);
    if (!output) return output.error();

    GitProgressParser parser(*steps);
    for (const auto& line : PatternMatcher::splitOutputLines(output.value())) {
        ProgressResult result = parser.parse(line);
        std::cout << result.percent << "\t" << result.text << "\n";
    }
    return {};
}

}
