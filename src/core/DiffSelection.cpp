#include "core/DiffSelection.hpp"

#include <stdexcept>
#include <utility>

namespace gitscribe {

DiffSelection::DiffSelection(DiffSelectionType defaultSelectionType)
    : defaultSelectionType(defaultSelectionType) {
    if (defaultSelectionType == DiffSelectionType::Partial) {
        throw std::invalid_argument("default selection type must be All or None");
    }
}

DiffSelection::DiffSelection(DiffSelectionType defaultSelectionType, std::set<int> divergingLines,
                             std::optional<std::set<int>> selectableLines)
    : defaultSelectionType(defaultSelectionType),
      divergingLines(std::move(divergingLines)),
      selectableLines(std::move(selectableLines)) {}

DiffSelectionType DiffSelection::getSelectionType() const {
    if (divergingLines.empty()) return defaultSelectionType;

    // Every selectable line diverges: the selection is the opposite of the default
    if (selectableLines && selectableLines->size() == divergingLines.size()) {
        return defaultSelectionType == DiffSelectionType::All ? DiffSelectionType::None : DiffSelectionType::All;
    }
    return DiffSelectionType::Partial;
}

bool DiffSelection::isSelected(int lineIndex) const {
    if (!isSelectable(lineIndex)) return false;

    bool diverging = divergingLines.count(lineIndex) > 0;
    return defaultSelectionType == DiffSelectionType::All ? !diverging : diverging;
}

bool DiffSelection::isSelectable(int lineIndex) const {
    return !selectableLines || selectableLines->count(lineIndex) > 0;
}

DiffSelection DiffSelection::withLineSelection(int lineIndex, bool selected) const {
    return withRangeSelection(lineIndex, 1, selected);
}

DiffSelection DiffSelection::withRangeSelection(int from, int length, bool selected) const {
    const DiffSelectionType requested = selected ? DiffSelectionType::All : DiffSelectionType::None;
    std::set<int> diverging = divergingLines;

    for (int i = from; i < from + length; ++i) {
        if (requested == defaultSelectionType) {
            diverging.erase(i);
        } else if (isSelectable(i)) {
            diverging.insert(i);
        }
    }
    return DiffSelection(defaultSelectionType, std::move(diverging), selectableLines);
}

DiffSelection DiffSelection::withToggleLineSelection(int lineIndex) const {
    return withLineSelection(lineIndex, !isSelected(lineIndex));
}

DiffSelection DiffSelection::withSelectAll() const {
    return DiffSelection(DiffSelectionType::All, {}, selectableLines);
}

DiffSelection DiffSelection::withSelectNone() const {
    return DiffSelection(DiffSelectionType::None, {}, selectableLines);
}

DiffSelection DiffSelection::withSelectableLines(const std::set<int>& selectable) const {
    std::set<int> diverging;
    for (int line : divergingLines) {
        if (selectable.count(line) > 0) diverging.insert(line);
    }
    return DiffSelection(defaultSelectionType, std::move(diverging), selectable);
}

}
