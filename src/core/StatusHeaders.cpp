#include "core/StatusHeaders.hpp"

#include <regex>
#include <stdexcept>

#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {
namespace StatusHeaders {

void apply(StatusHeadersData& data, const StatusHeader& header) {
    static const std::regex branchOid("^branch\\.oid ([a-f0-9]+)$");
    static const std::regex branchHead("^branch\\.head (.*)$");
    static const std::regex branchUpstream("^branch\\.upstream (.*)$");
    static const std::regex branchAb("^branch\\.ab \\+(\\d+) -(\\d+)$");

    const std::string& value = header.value;

    if (auto oid = PatternMatcher::fullMatch(value, branchOid); !oid.empty()) {
        data.currentTip = oid[1];
    } else if (auto head = PatternMatcher::fullMatch(value, branchHead); !head.empty()) {
        if (head[1] != "(detached)") data.currentBranch = head[1];
    } else if (auto upstream = PatternMatcher::fullMatch(value, branchUpstream); !upstream.empty()) {
        data.currentUpstreamBranch = upstream[1];
    } else if (auto ab = PatternMatcher::fullMatch(value, branchAb); !ab.empty()) {
        try {
            data.branchAheadBehind = AheadBehind{std::stoi(ab[1]), std::stoi(ab[2])};
        } catch (const std::out_of_range&) {
            Logger::instance().warn("Ahead/behind counts out of range: " + value);
        }
    } else {
        Logger::instance().debug("Ignoring status header: " + value);
    }
}

StatusHeadersData fromItems(const std::vector<StatusItem>& items) {
    StatusHeadersData data;
    for (const auto& item : items) {
        if (const auto* header = std::get_if<StatusHeader>(&item)) apply(data, *header);
    }
    return data;
}

}  // namespace StatusHeaders
}  // namespace gitscribe
