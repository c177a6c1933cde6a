#include "cli/commands/ClassifyCommand.hpp"

#include <iostream>

#include "core/ErrorTaxonomy.hpp"
#include "util/InputSource.hpp"

namespace gitscribe {

/**
 * @brief Execute 'gitscribe classify'
 *
 * Output:
 *   <ErrorKind>
 *   <explanation, with the offending files for oversized pushes>
 *
 * Kinds that have no explanation print only their name.
 */
Expected<void> ClassifyCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        return Error{ErrorCode::InvalidArgs, "usage: gitscribe classify <stderr-file> [<stdout-file>]"};
    }

    auto stderrText = readInput(args[0], *ctx.input, ctx.maxInputBytes);
    if (!stderrText) return stderrText.error();

    std::string stdoutText;
    if (args.size() == 2) {
        auto out = readInput(args[1], *ctx.input, ctx.maxInputBytes);
        if (!out) return out.error();
        stdoutText = out.value();
    }

    const ErrorTaxonomy& taxonomy = ErrorTaxonomy::instance();
    auto kind = taxonomy.classify(stderrText.value(), stdoutText);
    if (!kind) {
        return Error{ErrorCode::UnsupportedInput, "no known git failure recognized"};
    }

    // The message is built from whichever stream produced the match
    const std::string& source = taxonomy.classify(stderrText.value()) ? stderrText.value() : stdoutText;

    std::cout << toString(*kind) << "\n";
    if (auto message = taxonomy.failureMessage(*kind, source)) {
        std::cout << *message << "\n";
    }
    return {};
}

}
