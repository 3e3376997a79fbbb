#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include <QSemaphore>
#include <algorithm>
#include "controller.h"

using namespace tbx;

// In-process stand-in for the native sort/reorder backend
class FakeGridService : public GridService {
public:
    bool        fail = false;
    QSemaphore* gate = nullptr;     // when set, each call blocks until released

    Grid sort(const Grid& grid, const SortState& state) override {
        wait();
        if (fail) throw ServiceError("sort backend unavailable");
        Grid g = grid;
        const SortColumn key = state.columns.first();
        std::stable_sort(g.rows.begin(), g.rows.end(),
                         [key](const QStringList& a, const QStringList& b) {
            int ia = a.value(key.columnIndex).toInt();
            int ib = b.value(key.columnIndex).toInt();
            return key.direction == SortDirection::Ascending ? ia < ib : ia > ib;
        });
        return g;
    }

    Grid moveRow(const Grid& grid, int from, int to) override {
        wait();
        if (fail) throw ServiceError("move failed");
        Grid g = grid;
        g.rows.move(from, to);
        return g;
    }

    Grid moveColumn(const Grid& grid, int from, int to) override {
        wait();
        if (fail) throw ServiceError("move failed");
        Grid g = grid;
        g.headers.move(from, to);
        for (QStringList& row : g.rows)
            row.move(from, to);
        return g;
    }

    QString name() const override { return QStringLiteral("fake"); }

private:
    void wait() { if (gate) gate->acquire(); }
};

static Grid scoreGrid() {
    Grid g;
    g.headers = {"name", "score"};
    g.rows = {{"ann", "30"},
              {"bob", "10"},
              {"cid", "20"}};
    g.syncMetadata();
    return g;
}

class TestExternal : public QObject {
    Q_OBJECT
private:
    TbxDocument*                     m_doc  = nullptr;
    TbxController*                   m_ctrl = nullptr;
    std::shared_ptr<FakeGridService> m_svc;

private slots:
    void init() {
        m_doc  = new TbxDocument;
        m_ctrl = new TbxController(m_doc);
        m_svc  = std::make_shared<FakeGridService>();
        m_ctrl->setGridService(m_svc);
        m_ctrl->loadGrid(scoreGrid());
    }

    void cleanup() {
        delete m_ctrl;
        delete m_doc;
        m_ctrl = nullptr;
        m_doc  = nullptr;
        m_svc.reset();
    }

    void testSortIsRecordedAsOneEntry() {
        QSignalSpy done(m_ctrl, &TbxController::externalMutationFinished);
        SortState s;
        s.columns = {{1, SortDirection::Ascending}};
        QVERIFY(m_ctrl->applySorting(s));
        QVERIFY(m_ctrl->externalMutationPending());
        QVERIFY(done.wait(5000));

        QVERIFY(!m_ctrl->externalMutationPending());
        QCOMPARE(done.at(0).at(0).toString(), QString("Sort by 1 column"));
        QCOMPARE(m_ctrl->grid().cell(0, 0), QString("bob"));
        QCOMPARE(m_ctrl->grid().cell(2, 0), QString("ann"));
        QCOMPARE(m_ctrl->historyCount(), 1);
        QCOMPARE(m_ctrl->historyAction(0)->kind, HistoryKind::BulkReplace);
        QVERIFY(m_ctrl->currentSort() == s);

        m_ctrl->undo();
        QVERIFY(m_ctrl->grid() == scoreGrid());
    }

    void testMultiColumnSortDescription() {
        QSignalSpy done(m_ctrl, &TbxController::externalMutationFinished);
        SortState s;
        s.columns = {{1, SortDirection::Descending}, {0, SortDirection::Ascending}};
        QVERIFY(m_ctrl->applySorting(s));
        QVERIFY(done.wait(5000));
        QCOMPARE(m_ctrl->historyAction(0)->label(), QString("Sort by 2 columns"));
        QCOMPARE(m_ctrl->grid().cell(0, 0), QString("ann"));

        m_ctrl->clearSorting();
        QVERIFY(m_ctrl->currentSort().isEmpty());
    }

    void testMoveRowAndColumn() {
        QSignalSpy done(m_ctrl, &TbxController::externalMutationFinished);
        QVERIFY(m_ctrl->moveRow(0, 2));
        QVERIFY(done.wait(5000));
        QCOMPARE(m_ctrl->historyAction(0)->label(), QString("Move row from position 1 to 3"));
        QCOMPARE(m_ctrl->grid().cell(2, 0), QString("ann"));

        QVERIFY(m_ctrl->moveColumn(1, 0));
        QTRY_COMPARE(done.count(), 2);
        QCOMPARE(m_ctrl->historyAction(1)->label(), QString("Move column from position 2 to 1"));
        QCOMPARE(m_ctrl->grid().headers, QStringList({"score", "name"}));
        QCOMPARE(m_ctrl->grid().rows[0], QStringList({"10", "bob"}));
    }

    void testFailureLeavesStateUntouched() {
        m_svc->fail = true;
        QSignalSpy failed(m_ctrl, &TbxController::externalMutationFailed);
        QVERIFY(m_ctrl->moveRow(0, 1));
        QVERIFY(failed.wait(5000));
        QCOMPARE(failed.at(0).at(0).toString(), QString("move failed"));
        QVERIFY(m_ctrl->grid() == scoreGrid());
        QCOMPARE(m_ctrl->historyCount(), 0);
        QVERIFY(!m_ctrl->hasUnsavedChanges());
        QVERIFY(!m_ctrl->externalMutationPending());

        SortState s;
        s.columns = {{0, SortDirection::Ascending}};
        QVERIFY(m_ctrl->applySorting(s));
        QTRY_COMPARE(failed.count(), 2);
        QVERIFY(m_ctrl->currentSort().isEmpty());
    }

    void testInvalidRequestsAreRejected() {
        SortState none;
        QVERIFY(!m_ctrl->applySorting(none));
        SortState bad;
        bad.columns = {{5, SortDirection::Ascending}};
        QVERIFY(!m_ctrl->applySorting(bad));
        QVERIFY(!m_ctrl->moveRow(0, 3));
        QVERIFY(!m_ctrl->moveColumn(-1, 0));
        QVERIFY(!m_ctrl->externalMutationPending());

        m_ctrl->setGridService(nullptr);
        QVERIFY(!m_ctrl->moveRow(0, 1));
    }

    void testSecondRequestRefusedWhilePending() {
        QSemaphore gate;
        m_svc->gate = &gate;
        QSignalSpy done(m_ctrl, &TbxController::externalMutationFinished);

        QVERIFY(m_ctrl->moveRow(0, 1));
        QVERIFY(!m_ctrl->moveRow(1, 2));
        QVERIFY(!m_ctrl->moveColumn(0, 1));

        gate.release();
        QVERIFY(done.wait(5000));
        QCOMPARE(done.count(), 1);
        QCOMPARE(m_ctrl->historyCount(), 1);
        m_svc->gate = nullptr;
    }

    void testStaleResultIsDiscarded() {
        QSemaphore gate;
        m_svc->gate = &gate;
        QSignalSpy failed(m_ctrl, &TbxController::externalMutationFailed);
        QSignalSpy done(m_ctrl, &TbxController::externalMutationFinished);

        SortState s;
        s.columns = {{1, SortDirection::Ascending}};
        QVERIFY(m_ctrl->applySorting(s));

        // The grid moves on while the service is still working
        QVERIFY(m_ctrl->updateCell({0, 0}, "zed"));
        gate.release();

        QVERIFY(failed.wait(5000));
        QCOMPARE(done.count(), 0);
        QCOMPARE(m_ctrl->grid().cell(0, 0), QString("zed"));
        QCOMPARE(m_ctrl->grid().cell(1, 0), QString("bob"));
        QCOMPARE(m_ctrl->historyCount(), 1);
        QCOMPARE(m_ctrl->historyAction(0)->kind, HistoryKind::CellEdit);
        QVERIFY(m_ctrl->currentSort().isEmpty());
        m_svc->gate = nullptr;
    }
};

QTEST_GUILESS_MAIN(TestExternal)
#include "test_external.moc"
