#pragma once

#include "cli/ICommand.hpp"

namespace gitscribe {

class RebaseProgressCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "rebase-progress"; }
    const char* description() const override { return "Track progress of a rebase or cherry-pick"; }
    const char* helpNameLine() const override { return "rebase-progress -  Report which commit a rebase or cherry-pick is on"; }
    const char* helpSynopsis() const override {
        return "gitscribe rebase-progress [--cherry-pick] --commits <log-file> <input>";
    }
    const char* helpDescription() const override {
        return "Match rebase (or cherry-pick) output against the list of commits being applied and print the "
               "position, completed fraction and summary of the current commit.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--commits <log-file>", "Commits being applied, as written by `git log` with the format from `gitscribe log`."},
                 {"--cherry-pick", "Input is cherry-pick output instead of rebase output."} };
    }
};

}
