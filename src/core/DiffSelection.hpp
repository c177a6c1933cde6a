#pragma once

#include <optional>
#include <set>

namespace gitscribe {

enum class DiffSelectionType { All, Partial, None };

inline const char* toString(DiffSelectionType type) {
    switch (type) {
        case DiffSelectionType::All: return "all";
        case DiffSelectionType::Partial: return "partial";
        case DiffSelectionType::None: return "none";
    }
    return "unknown";
}

/**
 * @brief Immutable set of diff lines chosen for staging or discarding
 *
 * Stored sparsely: a default state (All or None) plus the line indexes
 * whose state differs from it. Indexes are absolute positions in the
 * unified diff (see DiffHunk::unifiedDiffStart). When a set of selectable
 * lines is attached, lines outside it are never selected.
 *
 * Every with* operation returns a new selection.
 */
class DiffSelection {
public:
    /// Nothing selected.
    DiffSelection() = default;

    /// @throws std::invalid_argument if defaultSelectionType is Partial
    explicit DiffSelection(DiffSelectionType defaultSelectionType);

    DiffSelectionType getSelectionType() const;
    bool areAllSelected() const { return getSelectionType() == DiffSelectionType::All; }
    bool areNoneSelected() const { return getSelectionType() == DiffSelectionType::None; }

    bool isSelected(int lineIndex) const;
    bool isSelectable(int lineIndex) const;

    DiffSelection withLineSelection(int lineIndex, bool selected) const;

    /// Select or deselect [from, from + length).
    DiffSelection withRangeSelection(int from, int length, bool selected) const;

    DiffSelection withToggleLineSelection(int lineIndex) const;
    DiffSelection withSelectAll() const;
    DiffSelection withSelectNone() const;

    /// Restrict selection to the given lines; diverging lines outside it are dropped.
    DiffSelection withSelectableLines(const std::set<int>& selectableLines) const;

private:
    DiffSelection(DiffSelectionType defaultSelectionType, std::set<int> divergingLines,
                  std::optional<std::set<int>> selectableLines);

    DiffSelectionType defaultSelectionType{DiffSelectionType::None};
    std::set<int> divergingLines;                 // lines whose state differs from the default
    std::optional<std::set<int>> selectableLines; // unset means every line is selectable
};

}
