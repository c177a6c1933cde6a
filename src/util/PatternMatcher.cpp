#include "util/PatternMatcher.hpp"

#include <cctype>
#include <iterator>
#include <utility>

namespace gitscribe {
namespace PatternMatcher {

namespace {

std::vector<std::string> collect(const std::smatch& m) {
    std::vector<std::string> groups;
    groups.reserve(m.size());
    for (size_t i = 0; i < m.size(); ++i) {
        groups.push_back(m[i].matched ? m[i].str() : std::string());
    }
    return groups;
}

}

std::vector<std::string> split(const std::string& text, char delim, bool keepEmpty) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start < text.size()) {
        size_t pos = text.find(delim, start);
        if (pos == std::string::npos) {
            fields.push_back(text.substr(start));
            break;
        }
        if (pos > start || keepEmpty) {
            fields.push_back(text.substr(start, pos - start));
        }
        start = pos + 1;
    }
    return fields;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines = split(text, '\n', true);
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }
    return lines;
}

std::vector<std::string> splitOutputLines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& line : split(text, '\n')) {
        for (auto& part : split(line, '\r')) lines.push_back(std::move(part));
    }
    return lines;
}

std::string trim(const std::string& text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
    return text.substr(b, e - b);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& text, const std::regex& re) {
    return std::regex_search(text, re);
}

std::vector<std::string> firstMatch(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(text, m, re)) return {};
    return collect(m);
}

std::vector<std::string> fullMatch(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (!std::regex_match(text, m, re)) return {};
    return collect(m);
}

std::vector<std::string> prefixMatch(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(text, m, re, std::regex_constants::match_continuous)) return {};
    return collect(m);
}

std::vector<MatchSpan> findAll(const std::string& text, const std::regex& re) {
    std::vector<MatchSpan> spans;
    auto begin = std::sregex_iterator(text.begin(), text.end(), re);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        size_t pos = static_cast<size_t>(it->position(0));
        spans.push_back(MatchSpan{pos, pos + static_cast<size_t>(it->length(0))});
    }
    return spans;
}

}  // namespace PatternMatcher
}  // namespace gitscribe
