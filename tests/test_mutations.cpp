#include <QtTest/QTest>
#include "core.h"
#include "selection.h"

using namespace tbx;

static Grid makeGrid() {
    Grid g;
    g.headers = {"a", "b", "c"};
    g.rows = {{"1", "2", "3"},
              {"4", "5", "6"},
              {"7", "8", "9"}};
    return g;
}

class TestMutations : public QObject {
    Q_OBJECT
private slots:
    void testSetCellLeavesInputUntouched() {
        Grid g = makeGrid();
        Grid out = ops::setCell(g, 1, 2, "x");
        QCOMPARE(out.cell(1, 2), QString("x"));
        QCOMPARE(g.cell(1, 2), QString("6"));
        // Out of range is the identity
        QVERIFY(ops::setCell(g, 5, 0, "x") == g);
        QVERIFY(ops::setCell(g, 0, 3, "x") == g);
    }

    void testInsertRemoveDuplicateRow() {
        Grid g = makeGrid();

        Grid ins = ops::insertRow(g, 1);
        QCOMPARE(ins.rowCount(), 4);
        QCOMPARE(ins.rows[1], QStringList({"", "", ""}));
        QCOMPARE(ins.rows[2], g.rows[1]);
        QCOMPARE(ins.headers, g.headers);

        Grid atEnd = ops::insertRow(g, 3);
        QCOMPARE(atEnd.rows.last(), QStringList({"", "", ""}));

        Grid rem = ops::removeRow(g, 0);
        QCOMPARE(rem.rowCount(), 2);
        QCOMPARE(rem.rows[0], QStringList({"4", "5", "6"}));

        Grid dup = ops::duplicateRow(g, 1);
        QCOMPARE(dup.rowCount(), 4);
        QCOMPARE(dup.rows[1], dup.rows[2]);
        dup.rows[2][0] = "changed";
        QCOMPARE(dup.rows[1][0], QString("4"));
    }

    void testInsertColumnRewritesEveryRow() {
        Grid g;
        g.headers = {"a", "b"};
        g.rows = {{"1", "2"}};

        Grid out = ops::insertColumn(g, 1, ops::autoColumnName(g, "Column %1"));
        QCOMPARE(out.columnCount(), 3);
        QCOMPARE(out.headers.at(0), QString("a"));
        QVERIFY(out.headers.at(1).startsWith("Column "));
        QCOMPARE(out.headers.at(2), QString("b"));
        QCOMPARE(out.rows[0], QStringList({"1", "", "2"}));
        QVERIFY(out.isRectangular());
    }

    void testRemoveAndRenameColumn() {
        Grid g = makeGrid();
        Grid rem = ops::removeColumn(g, 0);
        QCOMPARE(rem.headers, QStringList({"b", "c"}));
        for (const QStringList& row : rem.rows)
            QCOMPARE(int(row.size()), 2);
        QCOMPARE(rem.rows[2], QStringList({"8", "9"}));

        Grid ren = ops::renameColumn(g, 2, "total");
        QCOMPARE(ren.headers.at(2), QString("total"));
        QCOMPARE(ren.rows, g.rows);
    }

    void testAutoColumnNameAvoidsDuplicates() {
        Grid g;
        g.headers = {"Column 3", "b"};
        QCOMPARE(ops::autoColumnName(g, "Column %1"), QString("Column 4"));
        QCOMPARE(ops::autoColumnName(g, "Field %1"), QString("Field 3"));
        // Template without a placeholder falls back to the default
        QCOMPARE(ops::autoColumnName(g, "Untitled"), QString("Column 4"));
    }

    void testCopyBlockFromRange() {
        Grid g = makeGrid();
        Selection sel = SelectionModel::makeRange({2, 1}, {1, 3});
        ClipboardBlock block = ops::copyBlock(g, sel);
        QCOMPARE(int(block.size()), 2);
        // Column 3 is outside the grid and reads as empty
        QCOMPARE(block[0], QStringList({"5", "6", ""}));
        QCOMPARE(block[1], QStringList({"8", "9", ""}));
    }

    void testCopyBlockFromCellReadsLiveGrid() {
        Grid g = makeGrid();
        Selection sel = Cell{0, 0, "stale"};
        ClipboardBlock block = ops::copyBlock(g, sel);
        QCOMPARE(block, ClipboardBlock({{"1"}}));
        QVERIFY(ops::copyBlock(g, Selection{}).isEmpty());
    }

    void testPasteGrowsRowsButNotColumns() {
        Grid g = makeGrid();
        ClipboardBlock block = {{"p", "q"}, {"r", "s"}};
        Grid out = ops::pasteBlock(g, block, {2, 2});
        QCOMPARE(out.columnCount(), 3);
        QCOMPARE(out.rowCount(), 4);
        QCOMPARE(out.cell(2, 2), QString("p"));
        QCOMPARE(out.rows[3], QStringList({"", "", "r"}));
        QVERIFY(out.isRectangular());
        QCOMPARE(out.metadata.rowCount, 4);
    }

    void testPasteIsPure() {
        Grid g = makeGrid();
        ClipboardBlock block = {{"x", "y"}};
        Grid first = ops::pasteBlock(g, block, {0, 1});
        Grid second = ops::pasteBlock(g, block, {0, 1});
        QVERIFY(first == second);
        QVERIFY(ops::pasteBlock(first, block, {0, 1}) == first);
        QVERIFY(ops::pasteBlock(g, {}, {0, 0}) == g);
        QVERIFY(ops::pasteBlock(g, block, {-1, 0}) == g);
    }

    void testBlankSelection() {
        Grid g = makeGrid();
        Grid one = ops::blankSelection(g, Cell{1, 1, "5"});
        QVERIFY(one.cell(1, 1).isEmpty());
        QCOMPARE(one.cell(1, 0), QString("4"));

        Grid box = ops::blankSelection(g, SelectionModel::makeRange({0, 1}, {1, 5}));
        QCOMPARE(box.rows[0], QStringList({"1", "", ""}));
        QCOMPARE(box.rows[1], QStringList({"4", "", ""}));
        QCOMPARE(box.rows[2], g.rows[2]);
        QVERIFY(box.isRectangular());
    }

    void testBlockText() {
        ClipboardBlock block = {{"a", "b"}, {"c", ""}};
        QCOMPARE(ops::blockToText(block), QString("a\tb\nc\t"));
        QCOMPARE(ops::blockFromText("a\tb\r\nc\t\r\n"), block);
        QCOMPARE(ops::blockFromText("x\ny\tz"), ClipboardBlock({{"x", ""}, {"y", "z"}}));
        QVERIFY(ops::blockFromText(QString()).isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestMutations)
#include "test_mutations.moc"
