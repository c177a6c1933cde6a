#pragma once

#include "cli/ICommand.hpp"

namespace gitscribe {

class StatusCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "status"; }
    const char* description() const override { return "Decode a porcelain v2 status stream"; }
    const char* helpNameLine() const override { return "status -  Show the working tree status from captured output"; }
    const char* helpSynopsis() const override {
        return "gitscribe status [--conflicts <file>] [--numstat <file>] [--binary <path>]... <input>";
    }
    const char* helpDescription() const override {
        return "Decode the output of `git status --untracked-files=all --branch --porcelain=2 -z` and print the "
               "branch information followed by one line per changed path.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--conflicts <file>", "Output of `git diff --check`, used to count conflict markers."},
                 {"--numstat <file>", "Output of `git diff --numstat -z <ref>`, used to find binary files."},
                 {"--binary <path>", "Treat path as binary when reporting conflicts."} };
    }
};

}
