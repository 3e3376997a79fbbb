#pragma once
#include "core.h"
#include <QRegularExpression>

namespace tbx {

// Query state plus the matcher. Matches are a point-in-time scan of the
// grid they were computed from; nothing here tracks later edits.
class SearchEngine {
public:
    void setQuery(const QString& text, const SearchOptions& options = {});
    bool performSearch(const Grid& grid);
    void clear();

    bool isActive() const { return !m_query.isEmpty(); }
    const QString&       query() const   { return m_query; }
    const SearchOptions& options() const { return m_options; }
    const QVector<Cell>& matches() const { return m_matches; }
    int                  cursor() const  { return m_cursor; }
    const QString&       lastError() const { return m_lastError; }

    const Cell* currentMatch() const;
    bool nextMatch();
    bool previousMatch();

    bool isMatch(const QString& value) const;
    QString replaceInValue(const QString& value, const QString& replacement) const;

    // Start index of the first whitespace-delimited token equal to word, or -1
    static int findWholeWord(const QString& value, const QString& word,
                             Qt::CaseSensitivity cs, int* length = nullptr);

private:
    QString            m_query;
    SearchOptions      m_options;
    QRegularExpression m_regex;
    QVector<Cell>      m_matches;
    int                m_cursor = -1;
    QString            m_lastError;

    Qt::CaseSensitivity caseSensitivity() const {
        return m_options.caseSensitive ? Qt::CaseSensitive : Qt::CaseInsensitive;
    }
};

} // namespace tbx
