#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/StatusEntry.hpp"

namespace gitscribe {

struct AheadBehind {
    int ahead{0};
    int behind{0};
};

/// Branch information carried by the "# branch.*" status headers.
struct StatusHeadersData {
    std::optional<std::string> currentBranch;          // unset when HEAD is detached
    std::optional<std::string> currentUpstreamBranch;
    std::optional<std::string> currentTip;
    std::optional<AheadBehind> branchAheadBehind;
};

namespace StatusHeaders {

/// Fold one header value into data. Unknown headers leave data unchanged.
void apply(StatusHeadersData& data, const StatusHeader& header);

/// Fold every header of a decoded status stream.
StatusHeadersData fromItems(const std::vector<StatusItem>& items);

}  // namespace StatusHeaders

}
