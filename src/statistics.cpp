#include "statistics.h"
#include <QRegularExpression>

namespace tbx {

double parseLooseNumber(const QString& text, bool* ok) {
    static const QRegularExpression kStrip(QStringLiteral("[,$%]"));
    static const QRegularExpression kPrefix(
        QStringLiteral("^[+-]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][+-]?\\d+)?"));

    QString cleaned = text;
    cleaned.remove(kStrip);
    cleaned = cleaned.trimmed();

    QRegularExpressionMatch m = kPrefix.match(cleaned);
    if (!m.hasMatch()) {
        if (ok) *ok = false;
        return 0.0;
    }
    return m.captured(0).toDouble(ok);
}

SelectionStatistics computeStatistics(const Grid& grid, const Selection& sel) {
    SelectionStatistics st;

    QStringList values;
    if (auto* c = std::get_if<Cell>(&sel)) {
        values.append(grid.cell(c->row, c->column));
    } else if (auto* r = std::get_if<SelectionRange>(&sel)) {
        for (int row = r->start.row; row <= r->end.row; row++)
            for (int col = r->start.column; col <= r->end.column; col++)
                values.append(grid.cell(row, col));
    } else {
        return st;
    }
    st.valid = true;

    for (const QString& v : values) {
        if (v.trimmed().isEmpty()) continue;
        st.count++;

        bool ok = false;
        double d = parseLooseNumber(v, &ok);
        if (!ok) continue;
        if (st.numericCount == 0) {
            st.min = st.max = d;
        } else {
            st.min = qMin(st.min, d);
            st.max = qMax(st.max, d);
        }
        st.sum += d;
        st.numericCount++;
    }

    st.hasNumericData = st.numericCount > 0;
    if (st.hasNumericData)
        st.average = st.sum / st.numericCount;
    return st;
}

} // namespace tbx
