#include "core/ProgressParser.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <stdexcept>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace gitscribe {

namespace {

std::optional<std::int64_t> toInt(const std::string& digits) {
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

}

GitProgressParser::GitProgressParser(const std::vector<ProgressStep>& steps) {
    if (steps.empty()) {
        throw std::invalid_argument("GitProgressParser requires at least one step");
    }

    double totalWeight = 0.0;
    for (const auto& step : steps) totalWeight += step.weight;

    stepList.reserve(steps.size());
    for (const auto& step : steps) {
        // Without a usable total every step counts the same
        double weight = totalWeight > 0.0 ? step.weight / totalWeight : 1.0 / static_cast<double>(steps.size());
        stepList.push_back(ProgressStep{step.title, weight});
    }
}

ProgressResult GitProgressParser::parse(const std::string& line) {
    std::optional<GitProgressInfo> progress = parseLine(line);
    if (!progress) {
        return ProgressResult{ProgressKind::Context, lastReported, line, std::nullopt};
    }

    double fraction = 0.0;
    bool matched = false;
    for (size_t i = 0; i < stepList.size(); ++i) {
        const ProgressStep& step = stepList[i];
        if (i >= stepIndex && step.title == progress->title) {
            if (progress->total && *progress->total > 0) {
                // A phase never contributes more than its own weight
                double ratio = static_cast<double>(progress->value) / static_cast<double>(*progress->total);
                fraction += step.weight * std::min(std::max(ratio, 0.0), 1.0);
            }
            stepIndex = i;
            matched = true;
            break;
        }
        fraction += step.weight;
    }

    if (!matched) {
        Logger::instance().debug("Progress line for unknown or finished step: " + progress->title);
        return ProgressResult{ProgressKind::Context, lastReported, line, std::nullopt};
    }

    int percent = static_cast<int>(std::lround(fraction * 100.0));
    lastReported = std::max(lastReported, percent);
    return ProgressResult{ProgressKind::Progress, lastReported, line, progress};
}

std::optional<GitProgressInfo> GitProgressParser::parseLine(const std::string& line) {
    static const std::regex percentRe("^(\\d{1,3})% \\((\\d+)/(\\d+)\\)$");
    static const std::regex valueOnlyRe("^\\d+$");

    size_t colon = line.rfind(": ");
    if (colon == std::string::npos || colon == 0) return std::nullopt;

    std::string title = line.substr(0, colon);
    std::string remainder = PatternMatcher::trim(line.substr(colon + 2));
    if (remainder.empty()) return std::nullopt;

    std::vector<std::string> parts = PatternMatcher::split(remainder, ',');
    for (auto& part : parts) part = PatternMatcher::trim(part);
    if (parts.empty()) return std::nullopt;

    GitProgressInfo info;
    info.title = title;
    info.text = line;

    if (auto valueOnly = PatternMatcher::fullMatch(parts[0], valueOnlyRe); !valueOnly.empty()) {
        auto value = toInt(valueOnly[0]);
        if (!value) return std::nullopt;
        info.value = *value;
    } else if (auto withPercent = PatternMatcher::fullMatch(parts[0], percentRe); !withPercent.empty()) {
        auto percent = toInt(withPercent[1]);
        auto value = toInt(withPercent[2]);
        auto total = toInt(withPercent[3]);
        if (!percent || !value || !total) return std::nullopt;
        info.percent = static_cast<int>(*percent);
        info.value = *value;
        info.total = *total;
    } else {
        return std::nullopt;
    }

    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i] == Constants::PROGRESS_DONE_MARKER) {
            info.done = true;
            break;
        }
    }
    return info;
}

namespace ProgressSteps {

std::optional<std::vector<ProgressStep>> forOperation(const std::string& operation) {
    if (operation == "clone") {
        return std::vector<ProgressStep>{
            {"remote: Compressing objects", 0.1},
            {"Receiving objects", 0.6},
            {"Resolving deltas", 0.1},
            {"Checking out files", 0.2},
        };
    }
    if (operation == "fetch") {
        return std::vector<ProgressStep>{
            {"remote: Compressing objects", 0.1},
            {"Receiving objects", 0.7},
            {"Resolving deltas", 0.2},
        };
    }
    if (operation == "pull") {
        return std::vector<ProgressStep>{
            {"remote: Compressing objects", 0.1},
            {"Receiving objects", 0.7},
            {"Resolving deltas", 0.15},
            {"Checking out files", 0.15},
        };
    }
    if (operation == "push") {
        return std::vector<ProgressStep>{
            {"Compressing objects", 0.2},
            {"Writing objects", 0.7},
            {"remote: Resolving deltas", 0.1},
        };
    }
    if (operation == "checkout") {
        return std::vector<ProgressStep>{{"Checking out files", 1.0}};
    }
    return std::nullopt;
}

std::vector<std::string> operations() {
    return {"clone", "fetch", "pull", "push", "checkout"};
}

}  // namespace ProgressSteps

}
