#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include <cstdint>
#include <variant>

namespace tbx {

// ── Grid ──

struct GridMetadata {
    QString filename;
    QString path;
    bool    hasHeaders   = true;
    QString delimiter    = QStringLiteral(",");
    QString encoding     = QStringLiteral("UTF-8");
    qint64  fileSize     = 0;
    QString lastModified;
    int     rowCount     = 0;   // display only, never trusted
    int     columnCount  = 0;   // display only, never trusted

    bool operator==(const GridMetadata& o) const {
        return filename == o.filename && path == o.path
            && hasHeaders == o.hasHeaders && delimiter == o.delimiter
            && encoding == o.encoding && fileSize == o.fileSize
            && lastModified == o.lastModified
            && rowCount == o.rowCount && columnCount == o.columnCount;
    }
    bool operator!=(const GridMetadata& o) const { return !(*this == o); }

    QJsonObject toJson() const {
        QJsonObject o;
        o["filename"]     = filename;
        o["path"]         = path;
        o["hasHeaders"]   = hasHeaders;
        o["delimiter"]    = delimiter;
        o["encoding"]     = encoding;
        o["fileSize"]     = QString::number(fileSize);
        o["lastModified"] = lastModified;
        o["rowCount"]     = rowCount;
        o["columnCount"]  = columnCount;
        return o;
    }
    static GridMetadata fromJson(const QJsonObject& o) {
        GridMetadata m;
        m.filename     = o["filename"].toString();
        m.path         = o["path"].toString();
        m.hasHeaders   = o["hasHeaders"].toBool(true);
        m.delimiter    = o["delimiter"].toString(QStringLiteral(","));
        m.encoding     = o["encoding"].toString(QStringLiteral("UTF-8"));
        m.fileSize     = o["fileSize"].toString("0").toLongLong();
        m.lastModified = o["lastModified"].toString();
        m.rowCount     = o["rowCount"].toInt(0);
        m.columnCount  = o["columnCount"].toInt(0);
        return m;
    }
};

// Value type. Copies share row storage (implicit sharing) until written,
// so a retained snapshot is never affected by later edits.
struct Grid {
    QStringList          headers;
    QVector<QStringList> rows;
    GridMetadata         metadata;

    int rowCount() const    { return rows.size(); }
    int columnCount() const { return headers.size(); }
    bool isEmpty() const    { return headers.isEmpty() && rows.isEmpty(); }

    bool contains(int row, int col) const {
        return row >= 0 && row < rows.size() && col >= 0 && col < headers.size();
    }

    // Missing addresses read as empty
    QString cell(int row, int col) const {
        if (row < 0 || row >= rows.size()) return {};
        const QStringList& r = rows[row];
        if (col < 0 || col >= r.size()) return {};
        return r[col];
    }

    bool isRectangular() const {
        for (const QStringList& r : rows)
            if (r.size() != headers.size()) return false;
        return true;
    }

    // Refresh the display-only counters from the authoritative shape
    void syncMetadata() {
        metadata.rowCount    = rows.size();
        metadata.columnCount = headers.size();
    }

    bool operator==(const Grid& o) const {
        return headers == o.headers && rows == o.rows && metadata == o.metadata;
    }
    bool operator!=(const Grid& o) const { return !(*this == o); }

    QJsonObject toJson() const {
        QJsonObject o;
        o["headers"] = QJsonArray::fromStringList(headers);
        QJsonArray arr;
        for (const auto& r : rows) arr.append(QJsonArray::fromStringList(r));
        o["rows"]     = arr;
        o["metadata"] = metadata.toJson();
        return o;
    }

    static Grid fromJson(const QJsonObject& o) {
        Grid g;
        for (const auto& v : o["headers"].toArray())
            g.headers.append(v.toString());
        for (const auto& rv : o["rows"].toArray()) {
            QStringList row;
            for (const auto& v : rv.toArray()) row.append(v.toString());
            g.rows.append(row);
        }
        g.metadata = GridMetadata::fromJson(o["metadata"].toObject());
        return g;
    }
};

// ── Cells ──

struct CellRef {
    int row    = 0;
    int column = 0;

    bool operator==(const CellRef& o) const { return row == o.row && column == o.column; }
    bool operator!=(const CellRef& o) const { return !(*this == o); }
};

// value is a snapshot taken when the Cell was built; re-derive after edits
struct Cell {
    int     row    = 0;
    int     column = 0;
    QString value;

    CellRef ref() const { return {row, column}; }

    bool operator==(const Cell& o) const {
        return row == o.row && column == o.column && value == o.value;
    }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

// ── Selection ──

enum class RangeKind : uint8_t { Range, Row, Column };

struct SelectionRange {
    CellRef   start;    // normalized top-left
    CellRef   end;      // normalized bottom-right, inclusive
    CellRef   anchor;   // origin of the gesture
    CellRef   focus;    // moving endpoint
    RangeKind kind = RangeKind::Range;

    int rowSpan() const    { return end.row - start.row + 1; }
    int columnSpan() const { return end.column - start.column + 1; }
    // Row/column/all over a grid with no rows or no columns covers nothing
    bool isEmpty() const   { return rowSpan() <= 0 || columnSpan() <= 0; }

    bool contains(int row, int col) const {
        return row >= start.row && row <= end.row
            && col >= start.column && col <= end.column;
    }

    bool operator==(const SelectionRange& o) const {
        return start == o.start && end == o.end && anchor == o.anchor
            && focus == o.focus && kind == o.kind;
    }
    bool operator!=(const SelectionRange& o) const { return !(*this == o); }
};

// monostate only before the first select or after clear()
using Selection = std::variant<std::monostate, Cell, SelectionRange>;

// ── Clipboard ──

using ClipboardBlock = QVector<QStringList>;   // row-major, rectangular

// ── Structural positions ──

enum class RowPosition    : uint8_t { Above, Below };
enum class ColumnPosition : uint8_t { Before, After };

// ── History kinds ──

enum class HistoryKind : uint8_t {
    CellEdit, Paste, Delete, Cut,
    AddRow, DeleteRow, DuplicateRow,
    AddColumn, DeleteColumn, RenameColumn,
    BulkReplace
};

struct HistoryKindMeta {
    HistoryKind kind;
    const char* name;    // stable identifier: "cell_update", "paste"
    const char* label;   // default description
};

inline constexpr HistoryKindMeta kHistoryKindMeta[] = {
    {HistoryKind::CellEdit,     "cell_update",   "Edit cell"},
    {HistoryKind::Paste,        "paste",         "Paste"},
    {HistoryKind::Delete,       "delete",        "Delete"},
    {HistoryKind::Cut,          "cut",           "Cut"},
    {HistoryKind::AddRow,       "add_row",       "Add row"},
    {HistoryKind::DeleteRow,    "delete_row",    "Delete row"},
    {HistoryKind::DuplicateRow, "duplicate_row", "Duplicate row"},
    {HistoryKind::AddColumn,    "add_column",    "Add column"},
    {HistoryKind::DeleteColumn, "delete_column", "Delete column"},
    {HistoryKind::RenameColumn, "rename_column", "Rename column"},
    {HistoryKind::BulkReplace,  "replace_all",   "Replace all"},
};

inline constexpr const HistoryKindMeta* historyKindMeta(HistoryKind k) {
    for (const auto& m : kHistoryKindMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline const char* historyKindToString(HistoryKind k) {
    auto* m = historyKindMeta(k);
    return m ? m->name : "unknown";
}

inline HistoryKind historyKindFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kHistoryKindMeta) {
        if (s == m.name) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return HistoryKind::CellEdit;
}

// ── HistoryAction ──

struct HistoryAction {
    HistoryKind kind = HistoryKind::CellEdit;
    Grid        before;
    Grid        after;
    Selection   selection;
    QString     description;
    qint64      timestamp = 0;   // ms since epoch

    QString label() const {
        if (!description.isEmpty()) return description;
        auto* m = historyKindMeta(kind);
        return m ? QString::fromLatin1(m->label) : QString();
    }
};

// ── Search ──

struct SearchOptions {
    bool caseSensitive = false;
    bool wholeWord     = false;
    bool regex         = false;
    int  columnIndex   = -1;     // -1 = every column

    bool operator==(const SearchOptions& o) const {
        return caseSensitive == o.caseSensitive && wholeWord == o.wholeWord
            && regex == o.regex && columnIndex == o.columnIndex;
    }
    bool operator!=(const SearchOptions& o) const { return !(*this == o); }
};

struct ReplacePreview {
    int     row    = 0;
    int     column = 0;
    QString originalValue;
    QString newValue;
};

// ── Sort ──

enum class SortDirection : uint8_t { Ascending, Descending };

struct SortColumn {
    int           columnIndex = 0;
    SortDirection direction   = SortDirection::Ascending;

    bool operator==(const SortColumn& o) const {
        return columnIndex == o.columnIndex && direction == o.direction;
    }
};

struct SortState {
    QVector<SortColumn> columns;

    bool isEmpty() const { return columns.isEmpty(); }
    bool operator==(const SortState& o) const { return columns == o.columns; }
    bool operator!=(const SortState& o) const { return !(*this == o); }

    QJsonObject toJson() const {
        QJsonArray arr;
        for (const auto& c : columns) {
            QJsonObject o;
            o["column_index"] = c.columnIndex;
            o["direction"] = c.direction == SortDirection::Descending
                ? QStringLiteral("Descending") : QStringLiteral("Ascending");
            arr.append(o);
        }
        QJsonObject o;
        o["columns"] = arr;
        return o;
    }

    static SortState fromJson(const QJsonObject& o) {
        SortState s;
        for (const auto& v : o["columns"].toArray()) {
            QJsonObject c = v.toObject();
            SortColumn sc;
            sc.columnIndex = c["column_index"].toInt(0);
            sc.direction = c["direction"].toString() == QLatin1String("Descending")
                ? SortDirection::Descending : SortDirection::Ascending;
            s.columns.append(sc);
        }
        return s;
    }
};

// ── Grid transforms ──
// Pure: each returns a new Grid and leaves the argument untouched.
// Out-of-range indices return the input unchanged.

namespace ops {
    Grid setCell(const Grid& grid, int row, int col, const QString& value);
    Grid pasteBlock(const Grid& grid, const ClipboardBlock& block, CellRef target);
    Grid blankSelection(const Grid& grid, const Selection& sel);
    Grid insertRow(const Grid& grid, int at);
    Grid removeRow(const Grid& grid, int at);
    Grid duplicateRow(const Grid& grid, int at);
    Grid insertColumn(const Grid& grid, int at, const QString& name);
    Grid removeColumn(const Grid& grid, int at);
    Grid renameColumn(const Grid& grid, int at, const QString& name);

    ClipboardBlock copyBlock(const Grid& grid, const Selection& sel);
    QString autoColumnName(const Grid& grid, const QString& nameTemplate);

    QString blockToText(const ClipboardBlock& block);
    ClipboardBlock blockFromText(const QString& text);
} // namespace ops

} // namespace tbx
