#pragma once

#include "cli/ICommand.hpp"

namespace gitscribe {

class LfsProgressCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "lfs-progress"; }
    const char* description() const override { return "Summarize Git LFS transfer progress"; }
    const char* helpNameLine() const override { return "lfs-progress -  Decode a GIT_LFS_PROGRESS file"; }
    const char* helpSynopsis() const override { return "gitscribe lfs-progress <input>"; }
    const char* helpDescription() const override {
        return "Read the lines git-lfs wrote to its progress file and print the transfer percent and summary "
               "for each.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
