#pragma once
#include "core.h"
#include "selection.h"
#include "search.h"
#include "statistics.h"
#include "settings.h"
#include "gridservice.h"
#include <QObject>
#include <QUndoStack>
#include <QUndoCommand>
#include <QFutureWatcher>
#include <functional>
#include <memory>
#include <optional>

namespace tbx {

class TbxController;

// ── Document ──

class TbxDocument : public QObject {
    Q_OBJECT
public:
    explicit TbxDocument(QObject* parent = nullptr);
    explicit TbxDocument(const EngineSettings& settings, QObject* parent = nullptr);

    Grid           grid;
    QUndoStack     undoStack;      // the history log, capped at settings.historyLimit
    bool           modified = false;
    EngineSettings settings;

    void setModified(bool on);

signals:
    void documentChanged();
    void modifiedChanged(bool modified);
};

// ── Undo command ──
// One history entry. The first redo() comes from QUndoStack::push and only
// installs the after snapshot; later undo()/redo() calls also rescan search.
// Holds a raw controller pointer: ~TbxController clears the document's stack.

class TbxCommand : public QUndoCommand {
public:
    TbxCommand(TbxController* ctrl, HistoryAction action);
    void undo() override;
    void redo() override;
    const HistoryAction& action() const { return m_action; }
private:
    TbxController* m_ctrl;
    HistoryAction  m_action;
    bool           m_pushed = false;
};

// ── Controller ──

class TbxController : public QObject {
    Q_OBJECT
public:
    explicit TbxController(TbxDocument* doc, QObject* parent = nullptr);
    ~TbxController() override;

    TbxDocument* document() const { return m_doc; }
    const Grid& grid() const { return m_doc->grid; }

    void loadGrid(const Grid& grid);
    void reset();
    void markSaved();
    bool hasUnsavedChanges() const { return m_doc->modified; }

    // Selection
    const SelectionModel& selection() const { return m_selection; }
    Cell cellAt(int row, int col) const;
    void selectCell(const Cell& cell);
    void selectRange(const SelectionRange& range);
    void selectRow(int row);
    void selectColumn(int col);
    void selectAll();
    void extendSelection(const Cell& to);
    void clearSelection();

    // Clipboard
    const ClipboardBlock& clipboard() const { return m_clipboard; }
    bool copySelection();
    bool cutSelection();
    bool paste(std::optional<CellRef> target = std::nullopt);
    bool deleteSelection();
    QString copySelectionText();
    bool pasteText(const QString& text, std::optional<CellRef> target = std::nullopt);

    // Edits
    bool updateCell(const CellRef& at, const QString& value);
    bool addRow(RowPosition pos, int index);
    bool deleteRow(int index);
    bool duplicateRow(int index);
    bool addColumn(ColumnPosition pos, int index);
    bool deleteColumn(int index);
    bool renameColumn(int index, const QString& name);
    bool replaceAll(const Grid& newGrid, const QString& description = {});

    // History
    void record(HistoryAction action);
    bool undo();
    bool redo();
    bool canUndo() const { return m_doc->undoStack.canUndo(); }
    bool canRedo() const { return m_doc->undoStack.canRedo(); }
    int  historyCount() const { return m_doc->undoStack.count(); }
    int  historyCursor() const { return m_doc->undoStack.index() - 1; }
    const HistoryAction* historyAction(int i) const;
    void applyHistory(const HistoryAction& action, bool isUndo, bool rescan);

    // Search & replace
    const SearchEngine& search() const { return m_search; }
    void setSearchQuery(const QString& text, const SearchOptions& options);
    void setSearchQuery(const QString& text);
    bool performSearch();
    bool nextMatch();
    bool previousMatch();
    bool replaceCurrent(const QString& replacement);
    int  replaceAllMatches(const QString& replacement);
    QVector<ReplacePreview> previewReplace(const QString& replacement) const;
    void clearSearch();

    SelectionStatistics selectionStatistics() const;

    // External mutations (sort / reorder)
    void setGridService(std::shared_ptr<GridService> service) { m_service = std::move(service); }
    std::shared_ptr<GridService> gridService() const { return m_service; }
    bool applySorting(const SortState& state);
    void clearSorting();
    const SortState& currentSort() const { return m_currentSort; }
    bool moveRow(int from, int to);
    bool moveColumn(int from, int to);
    bool externalMutationPending() const { return m_externalInFlight; }

signals:
    void gridChanged();
    void selectionChanged();
    void searchUpdated(int matchCount);
    void searchFailed(const QString& error);
    void externalMutationFinished(const QString& description);
    void externalMutationFailed(const QString& error);

private:
    struct ExternalResult {
        bool    ok = false;
        Grid    grid;
        QString error;
    };
    using ExternalJob = std::function<Grid(const Grid&)>;

    TbxDocument*    m_doc;
    SelectionModel  m_selection;
    ClipboardBlock  m_clipboard;
    SearchEngine    m_search;
    SortState       m_currentSort;

    std::shared_ptr<GridService>     m_service;
    QFutureWatcher<ExternalResult>*  m_externalWatcher = nullptr;
    bool                             m_externalInFlight = false;
    Grid                             m_externalBefore;
    QString                          m_externalDescription;
    std::function<void()>            m_externalOnSuccess;

    void commit(HistoryKind kind, const Grid& after, const Selection& context,
                const QString& description = {});
    bool pasteBlockAt(const ClipboardBlock& block, std::optional<CellRef> target,
                      HistoryKind kind);
    void selectCurrentMatch();
    bool rescan();
    bool runExternal(ExternalJob job, const QString& description,
                     std::function<void()> onSuccess = {});
    void onExternalComplete();
};

} // namespace tbx
