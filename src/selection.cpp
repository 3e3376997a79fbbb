#include "selection.h"

namespace tbx {

SelectionRange SelectionModel::makeRange(CellRef anchor, CellRef focus, RangeKind kind) {
    SelectionRange r;
    r.start  = {qMin(anchor.row, focus.row), qMin(anchor.column, focus.column)};
    r.end    = {qMax(anchor.row, focus.row), qMax(anchor.column, focus.column)};
    r.anchor = anchor;
    r.focus  = focus;
    r.kind   = kind;
    return r;
}

void SelectionModel::selectCell(const Cell& cell) {
    m_sel = cell;
}

void SelectionModel::selectRange(const SelectionRange& range) {
    m_sel = range;
}

// Axis-spanning ranges are built as-is: on an empty axis the far edge sits
// before the near one and the range covers no cells.
static SelectionRange spanRange(CellRef from, CellRef to, RangeKind kind) {
    SelectionRange r;
    r.start  = from;
    r.end    = to;
    r.anchor = from;
    r.focus  = to;
    r.kind   = kind;
    return r;
}

void SelectionModel::selectRow(int row, const Grid& grid) {
    m_sel = spanRange({row, 0}, {row, grid.columnCount() - 1}, RangeKind::Row);
}

void SelectionModel::selectColumn(int col, const Grid& grid) {
    m_sel = spanRange({0, col}, {grid.rowCount() - 1, col}, RangeKind::Column);
}

void SelectionModel::selectAll(const Grid& grid) {
    m_sel = spanRange({0, 0}, {grid.rowCount() - 1, grid.columnCount() - 1},
                      RangeKind::Range);
}

// The anchor is fixed for the whole gesture: repeated extends always
// measure from the original anchor, never from the previous focus.
void SelectionModel::extendSelection(const Cell& to) {
    if (auto* c = std::get_if<Cell>(&m_sel)) {
        m_sel = makeRange(c->ref(), to.ref());
    } else if (auto* r = std::get_if<SelectionRange>(&m_sel)) {
        m_sel = makeRange(r->anchor, to.ref());
    } else {
        m_sel = to;
    }
}

void SelectionModel::clear() {
    m_sel = std::monostate{};
}

bool SelectionModel::contains(int row, int col) const {
    if (auto* c = std::get_if<Cell>(&m_sel))
        return c->row == row && c->column == col;
    if (auto* r = std::get_if<SelectionRange>(&m_sel))
        return r->contains(row, col);
    return false;
}

std::optional<CellRef> SelectionModel::origin() const {
    if (auto* c = std::get_if<Cell>(&m_sel))
        return c->ref();
    if (auto* r = std::get_if<SelectionRange>(&m_sel))
        return r->start;
    return std::nullopt;
}

} // namespace tbx
