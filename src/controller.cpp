#include "controller.h"
#include <QDateTime>
#include <QDebug>
#include <QtConcurrent/QtConcurrentRun>

namespace tbx {

static QString positionText(int from, int to) {
    return QStringLiteral("from position %1 to %2").arg(from + 1).arg(to + 1);
}

// ── TbxDocument ──

TbxDocument::TbxDocument(QObject* parent)
    : TbxDocument(EngineSettings{}, parent) {}

TbxDocument::TbxDocument(const EngineSettings& s, QObject* parent)
    : QObject(parent)
    , settings(s)
{
    // QUndoStack only accepts a limit while empty
    undoStack.setUndoLimit(qMax(1, settings.historyLimit));
}

void TbxDocument::setModified(bool on) {
    if (modified == on) return;
    modified = on;
    emit modifiedChanged(on);
}

// ── TbxCommand ──

TbxCommand::TbxCommand(TbxController* ctrl, HistoryAction action)
    : m_ctrl(ctrl), m_action(std::move(action))
{
    setText(m_action.label());
}

void TbxCommand::undo() { m_ctrl->applyHistory(m_action, true, true); }

void TbxCommand::redo() {
    m_ctrl->applyHistory(m_action, false, m_pushed);
    m_pushed = true;
}

// ── TbxController ──

TbxController::TbxController(TbxDocument* doc, QObject* parent)
    : QObject(parent), m_doc(doc)
{
    m_externalWatcher = new QFutureWatcher<ExternalResult>(this);
    connect(m_externalWatcher, &QFutureWatcher<ExternalResult>::finished,
            this, &TbxController::onExternalComplete);
}

TbxController::~TbxController() {
    // The worker only touches its own Grid copy, but the watcher must not
    // outlive a running future.
    if (m_externalInFlight)
        m_externalWatcher->waitForFinished();
    // Commands call back into this controller; none may outlive it
    m_doc->undoStack.clear();
}

void TbxController::loadGrid(const Grid& grid) {
    m_doc->undoStack.clear();
    m_doc->grid = grid;
    m_doc->setModified(false);
    m_selection.clear();
    m_search.clear();
    m_currentSort = SortState{};
    emit m_doc->documentChanged();
    emit gridChanged();
    emit selectionChanged();
}

void TbxController::reset() {
    loadGrid(Grid{});
    m_clipboard.clear();
}

void TbxController::markSaved() {
    m_doc->undoStack.setClean();
    m_doc->setModified(false);
}

// ── Selection ──

Cell TbxController::cellAt(int row, int col) const {
    return Cell{row, col, m_doc->grid.cell(row, col)};
}

void TbxController::selectCell(const Cell& cell) {
    m_selection.selectCell(cell);
    emit selectionChanged();
}

void TbxController::selectRange(const SelectionRange& range) {
    m_selection.selectRange(range);
    emit selectionChanged();
}

void TbxController::selectRow(int row) {
    m_selection.selectRow(row, m_doc->grid);
    emit selectionChanged();
}

void TbxController::selectColumn(int col) {
    m_selection.selectColumn(col, m_doc->grid);
    emit selectionChanged();
}

void TbxController::selectAll() {
    m_selection.selectAll(m_doc->grid);
    emit selectionChanged();
}

void TbxController::extendSelection(const Cell& to) {
    m_selection.extendSelection(to);
    emit selectionChanged();
}

void TbxController::clearSelection() {
    m_selection.clear();
    emit selectionChanged();
}

// ── Clipboard ──

bool TbxController::copySelection() {
    ClipboardBlock block = ops::copyBlock(m_doc->grid, m_selection.current());
    if (block.isEmpty()) return false;
    m_clipboard = block;
    return true;
}

bool TbxController::cutSelection() {
    if (!copySelection()) return false;
    commit(HistoryKind::Cut, ops::blankSelection(m_doc->grid, m_selection.current()),
           m_selection.current());
    return true;
}

bool TbxController::pasteBlockAt(const ClipboardBlock& block,
                                 std::optional<CellRef> target, HistoryKind kind) {
    if (block.isEmpty()) return false;
    if (!target) target = m_selection.origin();
    if (!target || target->row < 0 || target->column < 0) return false;
    if (target->column >= m_doc->grid.columnCount()) {
        qWarning() << "[Grid] paste target column out of range:" << target->column;
        return false;
    }

    commit(kind, ops::pasteBlock(m_doc->grid, block, *target),
           cellAt(target->row, target->column));
    return true;
}

bool TbxController::paste(std::optional<CellRef> target) {
    return pasteBlockAt(m_clipboard, target, HistoryKind::Paste);
}

bool TbxController::deleteSelection() {
    if (m_selection.isEmpty()) return false;
    const SelectionRange* r = m_selection.range();
    if (r && r->isEmpty()) return false;
    commit(HistoryKind::Delete, ops::blankSelection(m_doc->grid, m_selection.current()),
           m_selection.current());
    return true;
}

QString TbxController::copySelectionText() {
    if (!copySelection()) return {};
    return ops::blockToText(m_clipboard);
}

bool TbxController::pasteText(const QString& text, std::optional<CellRef> target) {
    return pasteBlockAt(ops::blockFromText(text), target, HistoryKind::Paste);
}

// ── Edits ──

bool TbxController::updateCell(const CellRef& at, const QString& value) {
    if (!m_doc->grid.contains(at.row, at.column)) {
        qWarning() << "[Grid] updateCell out of range:" << at.row << at.column;
        return false;
    }
    Cell edited{at.row, at.column, value};
    commit(HistoryKind::CellEdit, ops::setCell(m_doc->grid, at.row, at.column, value), edited);

    // The edited cell stays selected so keyboard editing can continue
    m_selection.selectCell(edited);
    emit selectionChanged();
    return true;
}

bool TbxController::addRow(RowPosition pos, int index) {
    const int at = pos == RowPosition::Above ? index : index + 1;
    if (index < 0 || at > m_doc->grid.rowCount()) {
        qWarning() << "[Grid] addRow index out of range:" << index;
        return false;
    }
    commit(HistoryKind::AddRow, ops::insertRow(m_doc->grid, at), Cell{at, 0, QString()});
    return true;
}

bool TbxController::deleteRow(int index) {
    if (index < 0 || index >= m_doc->grid.rowCount()) {
        qWarning() << "[Grid] deleteRow index out of range:" << index;
        return false;
    }
    commit(HistoryKind::DeleteRow, ops::removeRow(m_doc->grid, index), Cell{index, 0, QString()});
    return true;
}

bool TbxController::duplicateRow(int index) {
    if (index < 0 || index >= m_doc->grid.rowCount()) {
        qWarning() << "[Grid] duplicateRow index out of range:" << index;
        return false;
    }
    commit(HistoryKind::DuplicateRow, ops::duplicateRow(m_doc->grid, index),
           Cell{index + 1, 0, QString()});
    return true;
}

bool TbxController::addColumn(ColumnPosition pos, int index) {
    const int at = pos == ColumnPosition::Before ? index : index + 1;
    if (index < 0 || at > m_doc->grid.columnCount()) {
        qWarning() << "[Grid] addColumn index out of range:" << index;
        return false;
    }
    QString name = ops::autoColumnName(m_doc->grid, m_doc->settings.columnNameTemplate);
    commit(HistoryKind::AddColumn, ops::insertColumn(m_doc->grid, at, name),
           Cell{0, at, QString()});
    return true;
}

bool TbxController::deleteColumn(int index) {
    if (index < 0 || index >= m_doc->grid.columnCount()) {
        qWarning() << "[Grid] deleteColumn index out of range:" << index;
        return false;
    }
    commit(HistoryKind::DeleteColumn, ops::removeColumn(m_doc->grid, index),
           Cell{0, qMax(0, index - 1), QString()});
    return true;
}

bool TbxController::renameColumn(int index, const QString& name) {
    if (index < 0 || index >= m_doc->grid.columnCount()) {
        qWarning() << "[Grid] renameColumn index out of range:" << index;
        return false;
    }
    commit(HistoryKind::RenameColumn, ops::renameColumn(m_doc->grid, index, name),
           Cell{0, index, name});
    return true;
}

bool TbxController::replaceAll(const Grid& newGrid, const QString& description) {
    if (!newGrid.isRectangular()) {
        qWarning() << "[Grid] replaceAll rejected: rows do not match"
                   << newGrid.columnCount() << "headers";
        return false;
    }
    commit(HistoryKind::BulkReplace, newGrid, Selection{},
           description.isEmpty() ? QStringLiteral("Replace all") : description);
    return true;
}

// ── History ──

void TbxController::commit(HistoryKind kind, const Grid& after,
                           const Selection& context, const QString& description) {
    HistoryAction a;
    a.kind        = kind;
    a.before      = m_doc->grid;
    a.after       = after;
    a.selection   = context;
    a.description = description;
    a.timestamp   = QDateTime::currentMSecsSinceEpoch();
    record(std::move(a));
}

// QUndoStack::push drops the redo branch, appends, runs redo() (which
// installs the after snapshot) and evicts the oldest entry past the limit.
void TbxController::record(HistoryAction action) {
    qDebug() << "[History] record" << historyKindToString(action.kind) << action.label();
    m_doc->undoStack.push(new TbxCommand(this, std::move(action)));
    Q_ASSERT(m_doc->undoStack.count() <= qMax(1, m_doc->settings.historyLimit));
    Q_ASSERT(historyCursor() == historyCount() - 1);
}

bool TbxController::undo() {
    Q_ASSERT(historyCursor() >= -1 && historyCursor() < historyCount());
    if (!canUndo()) return false;
    m_doc->undoStack.undo();
    return true;
}

bool TbxController::redo() {
    Q_ASSERT(historyCursor() >= -1 && historyCursor() < historyCount());
    if (!canRedo()) return false;
    m_doc->undoStack.redo();
    return true;
}

const HistoryAction* TbxController::historyAction(int i) const {
    if (i < 0 || i >= m_doc->undoStack.count()) return nullptr;
    auto* cmd = static_cast<const TbxCommand*>(m_doc->undoStack.command(i));
    return cmd ? &cmd->action() : nullptr;
}

void TbxController::applyHistory(const HistoryAction& action, bool isUndo, bool rescanSearch) {
    m_doc->grid = isUndo ? action.before : action.after;
    m_doc->setModified(true);
    emit m_doc->documentChanged();
    emit gridChanged();

    if (rescanSearch && m_search.isActive())
        rescan();
}

// ── Search & replace ──

void TbxController::setSearchQuery(const QString& text, const SearchOptions& options) {
    m_search.setQuery(text, options);
}

void TbxController::setSearchQuery(const QString& text) {
    m_search.setQuery(text, m_doc->settings.searchDefaults);
}

void TbxController::selectCurrentMatch() {
    if (const Cell* m = m_search.currentMatch()) {
        m_selection.selectCell(*m);
        emit selectionChanged();
    }
}

bool TbxController::rescan() {
    bool ok = m_search.performSearch(m_doc->grid);
    if (!ok) {
        emit searchFailed(m_search.lastError());
        emit searchUpdated(0);
        return false;
    }
    selectCurrentMatch();
    emit searchUpdated(m_search.matches().size());
    return true;
}

bool TbxController::performSearch() {
    return rescan();
}

bool TbxController::nextMatch() {
    if (!m_search.nextMatch()) return false;
    selectCurrentMatch();
    return true;
}

bool TbxController::previousMatch() {
    if (!m_search.previousMatch()) return false;
    selectCurrentMatch();
    return true;
}

// Replacement is recomputed against the live value, which may differ from
// the snapshot stored in the match.
bool TbxController::replaceCurrent(const QString& replacement) {
    const Cell* current = m_search.currentMatch();
    if (!current) return false;
    const CellRef at = current->ref();

    bool replaced = false;
    if (m_doc->grid.contains(at.row, at.column)) {
        QString oldValue = m_doc->grid.cell(at.row, at.column);
        QString newValue = m_search.replaceInValue(oldValue, replacement);
        if (newValue != oldValue) {
            commit(HistoryKind::BulkReplace,
                   ops::setCell(m_doc->grid, at.row, at.column, newValue),
                   Cell{at.row, at.column, newValue}, QStringLiteral("Replace text"));
            replaced = true;
        }
    }
    nextMatch();
    return replaced;
}

int TbxController::replaceAllMatches(const QString& replacement) {
    const QVector<Cell> matches = m_search.matches();
    if (matches.isEmpty()) return 0;

    Grid after = m_doc->grid;
    int changed = 0;
    for (const Cell& m : matches) {
        if (!after.contains(m.row, m.column)) continue;
        QString oldValue = after.cell(m.row, m.column);
        QString newValue = m_search.replaceInValue(oldValue, replacement);
        if (newValue == oldValue) continue;
        after.rows[m.row][m.column] = newValue;
        changed++;
    }

    if (changed > 0) {
        commit(HistoryKind::BulkReplace, after, Selection{},
               QStringLiteral("Replace all: %1 match(es)").arg(matches.size()));
    }
    m_search.clear();
    emit searchUpdated(0);
    return changed;
}

QVector<ReplacePreview> TbxController::previewReplace(const QString& replacement) const {
    QVector<ReplacePreview> out;
    for (const Cell& m : m_search.matches()) {
        if (!m_doc->grid.contains(m.row, m.column)) continue;
        QString oldValue = m_doc->grid.cell(m.row, m.column);
        out.append({m.row, m.column, oldValue, m_search.replaceInValue(oldValue, replacement)});
    }
    return out;
}

void TbxController::clearSearch() {
    m_search.clear();
    emit searchUpdated(0);
}

SelectionStatistics TbxController::selectionStatistics() const {
    return computeStatistics(m_doc->grid, m_selection.current());
}

// ── External mutations ──
// One request at a time. The before snapshot is captured now; the result is
// applied only if the live grid still equals it when the worker finishes.

bool TbxController::runExternal(ExternalJob job, const QString& description,
                                std::function<void()> onSuccess) {
    if (m_externalInFlight) {
        qWarning() << "[External] refused, another request is pending:" << description;
        return false;
    }
    m_externalInFlight    = true;
    m_externalBefore      = m_doc->grid;
    m_externalDescription = description;
    m_externalOnSuccess   = std::move(onSuccess);

    Grid before = m_externalBefore;
    qDebug() << "[External] started:" << description;
    m_externalWatcher->setFuture(QtConcurrent::run([job, before]() {
        ExternalResult r;
        try {
            r.grid = job(before);
            r.ok = true;
        } catch (const std::exception& e) {
            r.error = QString::fromUtf8(e.what());
        }
        return r;
    }));
    return true;
}

void TbxController::onExternalComplete() {
    m_externalInFlight = false;
    Grid before = m_externalBefore;
    QString description = m_externalDescription;
    auto onSuccess = std::move(m_externalOnSuccess);
    m_externalBefore = Grid{};
    m_externalOnSuccess = nullptr;

    ExternalResult res;
    try {
        res = m_externalWatcher->result();
    } catch (const std::exception& e) {
        res.error = QString::fromUtf8(e.what());
    }

    if (!res.ok) {
        qWarning() << "[External]" << description << "failed:" << res.error;
        emit externalMutationFailed(res.error);
        return;
    }
    if (before != m_doc->grid) {
        QString err = QStringLiteral("Grid changed while \"%1\" was running").arg(description);
        qWarning() << "[External] stale result discarded:" << description;
        emit externalMutationFailed(err);
        return;
    }
    if (!replaceAll(res.grid, description)) {
        emit externalMutationFailed(
            QStringLiteral("\"%1\" returned a malformed grid").arg(description));
        return;
    }
    if (onSuccess) onSuccess();
    qDebug() << "[External] applied:" << description;
    emit externalMutationFinished(description);
}

bool TbxController::applySorting(const SortState& state) {
    if (!m_service) {
        qWarning() << "[External] no grid service for sort";
        return false;
    }
    const int n = state.columns.size();
    if (n == 0) return false;
    for (const SortColumn& c : state.columns) {
        if (c.columnIndex < 0 || c.columnIndex >= m_doc->grid.columnCount()) {
            qWarning() << "[External] sort column out of range:" << c.columnIndex;
            return false;
        }
    }

    auto svc = m_service;
    QString desc = QStringLiteral("Sort by %1 column%2").arg(n).arg(n > 1 ? QStringLiteral("s") : QString());
    return runExternal([svc, state](const Grid& g) { return svc->sort(g, state); },
                       desc, [this, state]() { m_currentSort = state; });
}

void TbxController::clearSorting() {
    m_currentSort = SortState{};
}

bool TbxController::moveRow(int from, int to) {
    if (!m_service) {
        qWarning() << "[External] no grid service for moveRow";
        return false;
    }
    const int rows = m_doc->grid.rowCount();
    if (from < 0 || from >= rows || to < 0 || to >= rows) {
        qWarning() << "[External] moveRow out of range:" << from << to;
        return false;
    }
    auto svc = m_service;
    return runExternal([svc, from, to](const Grid& g) { return svc->moveRow(g, from, to); },
                       QStringLiteral("Move row %1").arg(positionText(from, to)));
}

bool TbxController::moveColumn(int from, int to) {
    if (!m_service) {
        qWarning() << "[External] no grid service for moveColumn";
        return false;
    }
    const int cols = m_doc->grid.columnCount();
    if (from < 0 || from >= cols || to < 0 || to >= cols) {
        qWarning() << "[External] moveColumn out of range:" << from << to;
        return false;
    }
    auto svc = m_service;
    return runExternal([svc, from, to](const Grid& g) { return svc->moveColumn(g, from, to); },
                       QStringLiteral("Move column %1").arg(positionText(from, to)));
}

} // namespace tbx
