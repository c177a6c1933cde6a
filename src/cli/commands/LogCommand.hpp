#pragma once

#include "cli/ICommand.hpp"

namespace gitscribe {

class LogCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Decode commit history"; }
    const char* helpNameLine() const override { return "log -  Show commits from captured log output"; }
    const char* helpSynopsis() const override { return "gitscribe log [--format-args] <input>"; }
    const char* helpDescription() const override {
        return "Decode the output of `git log` run with the format arguments printed by --format-args and show "
               "one line per commit.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--format-args", "Print the git log arguments that produce the expected input, then exit."} };
    }
};

}
