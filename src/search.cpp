#include "search.h"
#include <QDebug>

namespace tbx {

void SearchEngine::setQuery(const QString& text, const SearchOptions& options) {
    m_query   = text;
    m_options = options;
    m_lastError.clear();

    QRegularExpression::PatternOptions po = QRegularExpression::NoPatternOption;
    if (!m_options.caseSensitive)
        po |= QRegularExpression::CaseInsensitiveOption;
    m_regex = m_options.regex ? QRegularExpression(m_query, po) : QRegularExpression();
}

// Row-major scan, columns left to right within a row. An invalid pattern
// aborts with zero matches and returns false; lastError() says why.
bool SearchEngine::performSearch(const Grid& grid) {
    m_matches.clear();
    m_cursor = -1;
    m_lastError.clear();

    if (m_query.isEmpty())
        return true;

    if (m_options.regex && !m_regex.isValid()) {
        m_lastError = m_regex.errorString();
        qWarning() << "[Search] invalid pattern" << m_query << "-" << m_lastError
                   << "at offset" << m_regex.patternErrorOffset();
        return false;
    }

    int colFrom = 0;
    int colTo   = grid.columnCount() - 1;
    if (m_options.columnIndex >= 0) {
        if (m_options.columnIndex >= grid.columnCount())
            return true;
        colFrom = colTo = m_options.columnIndex;
    }

    for (int row = 0; row < grid.rowCount(); row++) {
        for (int col = colFrom; col <= colTo; col++) {
            QString value = grid.cell(row, col);
            if (isMatch(value))
                m_matches.append(Cell{row, col, value});
        }
    }

    if (!m_matches.isEmpty())
        m_cursor = 0;
    qDebug() << "[Search]" << m_matches.size() << "match(es) for" << m_query;
    return true;
}

void SearchEngine::clear() {
    m_query.clear();
    m_options = SearchOptions{};
    m_regex = QRegularExpression();
    m_matches.clear();
    m_cursor = -1;
    m_lastError.clear();
}

const Cell* SearchEngine::currentMatch() const {
    if (m_cursor < 0 || m_cursor >= m_matches.size()) return nullptr;
    return &m_matches[m_cursor];
}

bool SearchEngine::nextMatch() {
    if (m_matches.isEmpty()) return false;
    m_cursor = (m_cursor + 1) % m_matches.size();
    return true;
}

bool SearchEngine::previousMatch() {
    if (m_matches.isEmpty()) return false;
    m_cursor = m_cursor <= 0 ? m_matches.size() - 1 : m_cursor - 1;
    return true;
}

int SearchEngine::findWholeWord(const QString& value, const QString& word,
                                Qt::CaseSensitivity cs, int* length) {
    const int n = value.size();
    int i = 0;
    while (i < n) {
        while (i < n && value[i].isSpace()) i++;
        const int begin = i;
        while (i < n && !value[i].isSpace()) i++;
        if (i > begin && QString::compare(value.mid(begin, i - begin), word, cs) == 0) {
            if (length) *length = i - begin;
            return begin;
        }
    }
    return -1;
}

bool SearchEngine::isMatch(const QString& value) const {
    if (m_query.isEmpty()) return false;
    if (m_options.regex)
        return m_regex.isValid() && m_regex.match(value).hasMatch();
    if (m_options.wholeWord)
        return findWholeWord(value, m_query, caseSensitivity()) >= 0;
    return value.contains(m_query, caseSensitivity());
}

// plain: first occurrence only; whole word: first equal token only;
// regex: every match in the value, \1-style back-references
QString SearchEngine::replaceInValue(const QString& value, const QString& replacement) const {
    if (m_query.isEmpty()) return value;

    if (m_options.regex) {
        if (!m_regex.isValid()) return value;
        QString out = value;
        out.replace(m_regex, replacement);
        return out;
    }

    if (m_options.wholeWord) {
        int len = 0;
        int pos = findWholeWord(value, m_query, caseSensitivity(), &len);
        if (pos < 0) return value;
        QString out = value;
        return out.replace(pos, len, replacement);
    }

    int pos = value.indexOf(m_query, 0, caseSensitivity());
    if (pos < 0) return value;
    QString out = value;
    return out.replace(pos, m_query.size(), replacement);
}

} // namespace tbx
