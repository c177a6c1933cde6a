#pragma once

#include "cli/ICommand.hpp"

namespace gitscribe {

class ClassifyCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "classify"; }
    const char* description() const override { return "Recognize why a git command failed"; }
    const char* helpNameLine() const override { return "classify -  Classify git failure output"; }
    const char* helpSynopsis() const override { return "gitscribe classify <stderr-file> [<stdout-file>]"; }
    const char* helpDescription() const override {
        return "Match the captured output of a failed git command against the known failure patterns. "
               "Stderr is checked first, then stdout. Prints the failure kind and its explanation; "
               "exits with an error when nothing is recognized.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<stderr-file>", "Captured stderr, or - for stdin."}, {"<stdout-file>", "Captured stdout (optional)."} };
    }
};

}
