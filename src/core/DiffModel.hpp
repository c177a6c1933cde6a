#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gitscribe {

enum class DiffLineType { Context, Add, Delete, Hunk };

/**
 * @brief One line of a unified diff
 *
 * text keeps the leading marker character (' ', '+', '-', or "@@" for the
 * hunk header line).
 */
struct DiffLine {
    std::string text;
    DiffLineType type{DiffLineType::Context};
    std::optional<int> oldLineNumber;
    std::optional<int> newLineNumber;
    bool noTrailingNewLine{false};

    /// Text without the marker character.
    std::string content() const { return text.empty() ? std::string() : text.substr(1); }

    /// Add and delete lines are the ones a selection can include or exclude.
    bool isIncludeableLine() const { return type == DiffLineType::Add || type == DiffLineType::Delete; }
};

struct DiffHunkHeader {
    int oldStartLine{0};
    int oldLineCount{0};
    int newStartLine{0};
    int newLineCount{0};
    std::string sectionHeading;  // text after the closing "@@", may be empty
};

/**
 * @brief Contiguous block of changed lines
 *
 * lines[0] is normally the "@@ ... @@" line itself. unifiedDiffStart is the
 * index of that line within the whole diff, so line i of this hunk has the
 * absolute index unifiedDiffStart + i used by DiffSelection.
 */
struct DiffHunk {
    DiffHunkHeader header;
    std::vector<DiffLine> lines;
    int unifiedDiffStart{0};
    int unifiedDiffEnd{0};
};

/// Hunk-structured text diff of one file, produced outside this library.
struct TextDiff {
    std::string text;
    std::vector<DiffHunk> hunks;
};

}
