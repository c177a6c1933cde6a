// Command-line front end: decode captured git output with the Command Pattern.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/ClassifyCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/LfsProgressCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/ProgressCommand.hpp"
#include "cli/commands/RebaseProgressCommand.hpp"
#include "cli/commands/StatusCommand.hpp"
#include "util/Logger.hpp"

using namespace gitscribe;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("classify", [] { return std::make_unique<ClassifyCommand>(); });
    f.registerCreator("status", [] { return std::make_unique<StatusCommand>(); });
    f.registerCreator("progress", [] { return std::make_unique<ProgressCommand>(); });
    f.registerCreator("lfs-progress", [] { return std::make_unique<LfsProgressCommand>(); });
    f.registerCreator("rebase-progress", [] { return std::make_unique<RebaseProgressCommand>(); });
    f.registerCreator("log", [] { return std::make_unique<LogCommand>(); });
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        auto res = invoker.invoke(*cmd, ctx, {});
        return res ? 0 : 1;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        Logger::instance().error("Unknown command: " + cmdName);
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
