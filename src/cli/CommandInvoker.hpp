#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace gitscribe {

/// Runs a command and reports its failure on the diagnostic stream.
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
