#pragma once
#include "core.h"
#include <optional>

namespace tbx {

// Active part of the grid: nothing, a single cell, or a rectangle.
// Indices are not clamped; callers keep them inside the grid.
class SelectionModel {
public:
    const Selection& current() const { return m_sel; }

    bool isEmpty() const { return std::holds_alternative<std::monostate>(m_sel); }
    bool isCell() const  { return std::holds_alternative<Cell>(m_sel); }
    bool isRange() const { return std::holds_alternative<SelectionRange>(m_sel); }

    const Cell*           cell() const  { return std::get_if<Cell>(&m_sel); }
    const SelectionRange* range() const { return std::get_if<SelectionRange>(&m_sel); }

    void selectCell(const Cell& cell);
    void selectRange(const SelectionRange& range);
    void selectRow(int row, const Grid& grid);
    void selectColumn(int col, const Grid& grid);
    void selectAll(const Grid& grid);
    void extendSelection(const Cell& to);
    void clear();

    bool contains(int row, int col) const;

    // Top-left of the active selection (paste target fallback)
    std::optional<CellRef> origin() const;

    static SelectionRange makeRange(CellRef anchor, CellRef focus,
                                    RangeKind kind = RangeKind::Range);

private:
    Selection m_sel;
};

} // namespace tbx
