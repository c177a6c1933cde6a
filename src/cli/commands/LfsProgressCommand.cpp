#include "cli/commands/LfsProgressCommand.hpp"

#include <iostream>

#include "core/LfsProgressParser.hpp"
#include "util/InputSource.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {

Expected<void> LfsProgressCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }

    auto output = readInput(args[0], *ctx.input, ctx.maxInputBytes);
    if (!output) return output.error();

    LfsProgressParser parser;
    for (const auto& line : PatternMatcher::splitOutputLines(output.value())) {
        ProgressResult result = parser.parse(line);
        std::cout << result.percent << "\t" << result.text << "\n";
    }
    return {};
}

}
