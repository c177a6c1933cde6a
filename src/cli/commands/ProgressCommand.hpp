#pragma once

#include "cli/ICommand.hpp"

namespace gitscribe {

class ProgressCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "progress"; }
    const char* description() const override { return "Compute overall progress of a git operation"; }
    const char* helpNameLine() const override { return "progress -  Turn git progress output into percentages"; }
    const char* helpSynopsis() const override { return "gitscribe progress [--steps <operation>] <input>"; }
    const char* helpDescription() const override {
        return "Read captured stderr of a git operation run with --progress and print the overall percent "
               "and the line for every line of input.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--steps <operation>", "Step table to use: clone, fetch, pull, push or checkout (default clone)."} };
    }
};

}
