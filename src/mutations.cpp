#include "core.h"

namespace tbx::ops {

// Every transform copies the Grid value first. Only rows that are written
// detach from the shared storage; the caller's snapshot stays intact.

static QStringList emptyRow(int width) {
    QStringList row;
    row.reserve(width);
    for (int i = 0; i < width; i++) row.append(QString());
    return row;
}

Grid setCell(const Grid& grid, int row, int col, const QString& value) {
    if (!grid.contains(row, col)) return grid;
    Grid g = grid;
    QStringList& r = g.rows[row];
    while (r.size() < g.headers.size()) r.append(QString());
    r[col] = value;
    return g;
}

Grid pasteBlock(const Grid& grid, const ClipboardBlock& block, CellRef target) {
    if (block.isEmpty() || target.row < 0 || target.column < 0) return grid;
    Grid g = grid;
    const int width = g.headers.size();

    for (int br = 0; br < block.size(); br++) {
        const int row = target.row + br;
        while (row >= g.rows.size())
            g.rows.append(emptyRow(width));

        const QStringList& src = block[br];
        for (int bc = 0; bc < src.size(); bc++) {
            const int col = target.column + bc;
            if (col >= width) break;   // paste never adds columns
            QStringList& dst = g.rows[row];
            while (dst.size() < width) dst.append(QString());
            dst[col] = src[bc];
        }
    }
    g.syncMetadata();
    return g;
}

Grid blankSelection(const Grid& grid, const Selection& sel) {
    if (auto* c = std::get_if<Cell>(&sel))
        return setCell(grid, c->row, c->column, QString());

    auto* r = std::get_if<SelectionRange>(&sel);
    if (!r) return grid;

    Grid g = grid;
    const int rowFrom = qMax(0, r->start.row);
    const int rowTo   = qMin(int(g.rows.size()) - 1, r->end.row);
    const int colFrom = qMax(0, r->start.column);
    for (int row = rowFrom; row <= rowTo; row++) {
        const int colTo = qMin(int(g.rows[row].size()) - 1, r->end.column);
        if (colTo < colFrom) continue;
        QStringList& dst = g.rows[row];
        for (int col = colFrom; col <= colTo; col++)
            dst[col] = QString();
    }
    return g;
}

Grid insertRow(const Grid& grid, int at) {
    if (at < 0 || at > grid.rows.size()) return grid;
    Grid g = grid;
    g.rows.insert(at, emptyRow(g.headers.size()));
    g.syncMetadata();
    return g;
}

Grid removeRow(const Grid& grid, int at) {
    if (at < 0 || at >= grid.rows.size()) return grid;
    Grid g = grid;
    g.rows.removeAt(at);
    g.syncMetadata();
    return g;
}

Grid duplicateRow(const Grid& grid, int at) {
    if (at < 0 || at >= grid.rows.size()) return grid;
    Grid g = grid;
    QStringList copy = g.rows[at];
    g.rows.insert(at + 1, copy);
    g.syncMetadata();
    return g;
}

Grid insertColumn(const Grid& grid, int at, const QString& name) {
    if (at < 0 || at > grid.headers.size()) return grid;
    Grid g = grid;
    g.headers.insert(at, name);
    for (QStringList& row : g.rows) {
        while (row.size() < at) row.append(QString());
        row.insert(at, QString());
    }
    g.syncMetadata();
    return g;
}

Grid removeColumn(const Grid& grid, int at) {
    if (at < 0 || at >= grid.headers.size()) return grid;
    Grid g = grid;
    g.headers.removeAt(at);
    for (QStringList& row : g.rows) {
        if (at < row.size()) row.removeAt(at);
    }
    g.syncMetadata();
    return g;
}

Grid renameColumn(const Grid& grid, int at, const QString& name) {
    if (at < 0 || at >= grid.headers.size()) return grid;
    Grid g = grid;
    g.headers[at] = name;
    return g;
}

ClipboardBlock copyBlock(const Grid& grid, const Selection& sel) {
    ClipboardBlock block;
    if (auto* c = std::get_if<Cell>(&sel)) {
        block.append(QStringList{grid.cell(c->row, c->column)});
    } else if (auto* r = std::get_if<SelectionRange>(&sel)) {
        if (r->isEmpty()) return block;
        for (int row = r->start.row; row <= r->end.row; row++) {
            QStringList line;
            for (int col = r->start.column; col <= r->end.column; col++)
                line.append(grid.cell(row, col));
            block.append(line);
        }
    }
    return block;
}

// "Column %1" with %1 = columnCount + 1, bumped until no header uses it
QString autoColumnName(const Grid& grid, const QString& nameTemplate) {
    const QString tmpl = nameTemplate.contains(QLatin1String("%1"))
        ? nameTemplate : QStringLiteral("Column %1");
    int n = grid.headers.size() + 1;
    QString name = tmpl.arg(n);
    while (grid.headers.contains(name))
        name = tmpl.arg(++n);
    return name;
}

// ── Text interchange (tab separated, one line per row) ──

QString blockToText(const ClipboardBlock& block) {
    QStringList lines;
    lines.reserve(block.size());
    for (const QStringList& row : block)
        lines.append(row.join(QLatin1Char('\t')));
    return lines.join(QLatin1Char('\n'));
}

ClipboardBlock blockFromText(const QString& text) {
    ClipboardBlock block;
    if (text.isEmpty()) return block;

    QString normalized = text;
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    normalized.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    if (normalized.endsWith(QLatin1Char('\n')))
        normalized.chop(1);

    int width = 0;
    const QStringList lines = normalized.split(QLatin1Char('\n'));
    for (const QString& line : lines) {
        QStringList cells = line.split(QLatin1Char('\t'));
        width = qMax(width, int(cells.size()));
        block.append(cells);
    }
    // Pad ragged lines so the block stays rectangular
    for (QStringList& row : block)
        while (row.size() < width) row.append(QString());
    return block;
}

} // namespace tbx::ops
