#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitscribe {

/**
 * @brief A titled phase of a git operation and its relative weight
 *
 * The title is everything before the last ": " of a progress line, e.g.
 * "remote: Compressing objects" for
 *   remote: Compressing objects:  14% (159/1133)
 */
struct ProgressStep {
    std::string title;
    double weight{1.0};
};

/// One progress line of git's stderr, decoded.
struct GitProgressInfo {
    std::string title;
    std::int64_t value{0};                // processed units: 159 in "14% (159/1133)"
    std::optional<std::int64_t> total;    // unset for "Counting objects: 123"
    std::optional<int> percent;           // percent printed by git, 0..100
    bool done{false};                     // trailing ", done."
    std::string text;                     // the raw line
};

enum class ProgressKind { Progress, Context };

/**
 * @brief Result of feeding one line to a progress parser
 *
 * percent is the overall percent of the operation. Context lines carry
 * the last reported percent and no details.
 */
struct ProgressResult {
    ProgressKind kind{ProgressKind::Context};
    int percent{0};
    std::string text;
    std::optional<GitProgressInfo> details;
};

/**
 * @brief Turns the progress lines of one git operation into an overall percent
 *
 * Steps must be listed in the order git reports them; some may never appear.
 * Once a line for a step is seen, every earlier step counts as complete.
 * The reported percent never decreases. One instance serves one stream.
 */
class GitProgressParser {
public:
    /// @throws std::invalid_argument when steps is empty
    explicit GitProgressParser(const std::vector<ProgressStep>& steps);

    ProgressResult parse(const std::string& line);

    /// Decode a single line; nullopt when it is not a progress line.
    static std::optional<GitProgressInfo> parseLine(const std::string& line);

    /// Steps with weights rescaled to sum to 1.
    const std::vector<ProgressStep>& steps() const { return stepList; }

    int lastPercent() const { return lastReported; }

private:
    std::vector<ProgressStep> stepList;
    size_t stepIndex{0};
    int lastReported{0};
};

namespace ProgressSteps {

/// Known step tables: "clone", "fetch", "pull", "push", "checkout".
std::optional<std::vector<ProgressStep>> forOperation(const std::string& operation);

std::vector<std::string> operations();

}  // namespace ProgressSteps

}
