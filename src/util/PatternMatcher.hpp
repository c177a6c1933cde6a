#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace gitscribe {

/**
 * @brief Text splitting and regular-expression helpers shared by the decoders
 *
 * Git output is decoded with ECMAScript std::regex patterns. These helpers
 * wrap the iterator boilerplate so the decoders read as a sequence of
 * "does it match / what did it capture" questions.
 */
namespace PatternMatcher {

/// Begin/end byte offsets of one regex match inside the searched text.
struct MatchSpan {
    size_t begin{0};
    size_t end{0};
};

/**
 * @brief Split text on a single delimiter character
 *
 * @param text Input text (may contain NUL bytes)
 * @param delim Delimiter, e.g. '\0' for -z output or ',' for progress parts
 * @param keepEmpty Keep empty fields between adjacent delimiters
 * @return Fields in input order. A trailing delimiter never yields a final
 *         empty field.
 *
 * Example: split("a\0b\0", '\0', false) -> {"a", "b"}
 */
std::vector<std::string> split(const std::string& text, char delim, bool keepEmpty = false);

/// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Split terminal output on '\n' and '\r', dropping empty lines
 *
 * git redraws progress lines with a bare '\r', so each redraw is its own line.
 */
std::vector<std::string> splitOutputLines(const std::string& text);

/// Strip leading and trailing ASCII whitespace.
std::string trim(const std::string& text);

bool startsWith(const std::string& text, const std::string& prefix);

/// True if the pattern matches anywhere in text.
bool contains(const std::string& text, const std::regex& re);

/**
 * @brief Captures of the first match of re in text
 *
 * @return Element 0 is the whole match, then one element per capture group
 *         (unmatched groups are empty strings). Empty vector when no match.
 */
std::vector<std::string> firstMatch(const std::string& text, const std::regex& re);

/// Same as firstMatch but the whole text must match.
std::vector<std::string> fullMatch(const std::string& text, const std::regex& re);

/**
 * @brief Captures of a match anchored at the start of text
 *
 * The match does not have to reach the end of text, so callers can match a
 * fixed-field prefix and take the rest with text.substr(groups[0].size()).
 */
std::vector<std::string> prefixMatch(const std::string& text, const std::regex& re);

/// Offsets of every non-overlapping match, left to right.
std::vector<MatchSpan> findAll(const std::string& text, const std::regex& re);

}  // namespace PatternMatcher

}  // namespace gitscribe
