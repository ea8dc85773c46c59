#include <QtTest>
#include <QSqlQuery>
#include <QTemporaryDir>
#include "DrawingDatabase.h"
#include "VolumeReportCommand.h"

namespace {

bool exec(QSqlDatabase db, const QString& sql) {
    QSqlQuery q(db);
    return q.exec(sql);
}

// Main road (1): list "Earthwork" with Topsoil + Rock, list "Ramp" on alignment 2
void populate(DrawingDatabase& drawing) {
    QSqlDatabase db = drawing.database();
    QVERIFY(exec(db, "INSERT INTO alignments(id, name) VALUES (1, 'Main road'), (2, 'Ramp A')"));
    QVERIFY(exec(db, "INSERT INTO material_lists(id, alignment_id, name) VALUES "
                     "(10, 1, 'Earthwork'), (11, 2, 'Ramp'), (12, 1, 'Subgrade')"));
    QVERIFY(exec(db, "INSERT INTO material_list_items(id, list_id, name) VALUES "
                     "(100, 10, 'Topsoil'), (101, 10, 'Rock'), (102, 11, 'Earth'), (103, 12, 'Sand')"));
    QVERIFY(exec(db, "INSERT INTO material_quantities"
                     "(item_id, start_station, end_station, cut_volume, fill_volume) VALUES "
                     "(100, 0, 20, 10, 4), (100, 20, 40, 5, 6), (101, 0, 20, 2.5, 0), "
                     "(102, 0, 20, 99, 99), (103, 40, 60, 0, 3)"));
}

} // namespace

class TestDrawingDatabase : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void listsAlignmentsInOrder();
    void findsAlignmentByIdOrName();
    void resolvesSelectionByNameThenRawText();
    void unreadableAlignmentTableSetsLastError();
    void enumeratesGraphInDocumentOrder();
    void nonNumericQuantityRaisesSourceError();
    void missingQuantityRaisesSourceError();
    void commandRunsAgainstDrawing();
    void readScopeAlwaysEndsItsTransaction();
    void readOnlyDrawingIsNeverWritten();
    void openFailureReportsError();
    void reopeningSwitchesMode();

private:
    DrawingDatabase* drawing_ = nullptr;
};

void TestDrawingDatabase::init() {
    drawing_ = new DrawingDatabase;
    QVERIFY(drawing_->open(":memory:", DrawingDatabase::ReadWrite));
    populate(*drawing_);
}

void TestDrawingDatabase::cleanup() {
    delete drawing_;
    drawing_ = nullptr;
}

void TestDrawingDatabase::listsAlignmentsInOrder() {
    auto all = drawing_->alignments();
    QCOMPARE(int(all.size()), 2);
    QCOMPARE(all[0].id, std::string("1"));
    QCOMPARE(all[0].name, std::string("Main road"));
    QCOMPARE(all[1].name, std::string("Ramp A"));
}

void TestDrawingDatabase::findsAlignmentByIdOrName() {
    auto byId = drawing_->findAlignment("2");
    QVERIFY(byId.has_value());
    QCOMPARE(byId->name, std::string("Ramp A"));

    auto byName = drawing_->findAlignment("Main road");
    QVERIFY(byName.has_value());
    QCOMPARE(byName->id, std::string("1"));

    QVERIFY(!drawing_->findAlignment("Bypass").has_value());
    QVERIFY(!drawing_->alignment("not-an-id").has_value());
}

void TestDrawingDatabase::resolvesSelectionByNameThenRawText() {
    QCOMPARE(drawing_->resolveAlignmentId("Ramp A"), std::string("2"));
    QCOMPARE(drawing_->resolveAlignmentId("1"), std::string("1"));
    QCOMPARE(drawing_->resolveAlignmentId("Bypass"), std::string("Bypass"));
    QCOMPARE(drawing_->resolveAlignmentId(QString()), std::string());

    VolumeReportCommand command;
    QVERIFY(command.run(drawing_->resolveAlignmentId("Main road"), *drawing_).status
            == CommandOutcome::Ok);
    auto unknown = command.run(drawing_->resolveAlignmentId("Bypass"), *drawing_);
    QVERIFY(unknown.status == CommandOutcome::SelectionFailed);
    QCOMPARE(unknown.exitCode(), 1);
    auto none = command.run(drawing_->resolveAlignmentId(QString()), *drawing_);
    QVERIFY(none.status == CommandOutcome::Cancelled);
    QCOMPARE(none.exitCode(), 1);
}

void TestDrawingDatabase::unreadableAlignmentTableSetsLastError() {
    QVERIFY(drawing_->alignments().size() == 2);
    QVERIFY(drawing_->lastError().isEmpty());

    QVERIFY(exec(drawing_->database(), "DROP TABLE alignments"));
    QVERIFY(drawing_->alignments().empty());
    QVERIFY(!drawing_->lastError().isEmpty());
}

void TestDrawingDatabase::enumeratesGraphInDocumentOrder() {
    auto lists = drawing_->listMaterialLists();
    QCOMPARE(int(lists.size()), 3);
    QCOMPARE(lists[0].name, std::string("Earthwork"));
    QCOMPARE(lists[0].alignmentId, std::string("1"));
    QCOMPARE(lists[1].alignmentId, std::string("2"));

    auto items = drawing_->listItems(lists[0]);
    QCOMPARE(int(items.size()), 2);
    QCOMPARE(items[0].name, std::string("Topsoil"));
    QCOMPARE(items[1].name, std::string("Rock"));

    auto qs = drawing_->listQuantities(items[0]);
    QCOMPARE(int(qs.size()), 2);
    QCOMPARE(qs[1].stationStart, 20.0);
    QCOMPARE(qs[1].stationEnd, 40.0);
    QCOMPARE(qs[1].cutVolume, 5.0);
    QCOMPARE(qs[1].fillVolume, 6.0);
}

void TestDrawingDatabase::nonNumericQuantityRaisesSourceError() {
    QVERIFY(exec(drawing_->database(),
        "INSERT INTO material_quantities(item_id, start_station, end_station, cut_volume, fill_volume) "
        "VALUES (101, 20, 40, 'n/a', 0)"));
    ItemRecord rock{"101", "Rock"};
    QVERIFY_EXCEPTION_THROWN(drawing_->listQuantities(rock), SourceError);
}

void TestDrawingDatabase::missingQuantityRaisesSourceError() {
    QVERIFY(exec(drawing_->database(),
        "INSERT INTO material_quantities(item_id, start_station, end_station, cut_volume) "
        "VALUES (103, 60, 80, 1)"));
    ItemRecord sand{"103", "Sand"};
    QVERIFY_EXCEPTION_THROWN(drawing_->listQuantities(sand), SourceError);
}

void TestDrawingDatabase::commandRunsAgainstDrawing() {
    // Rock row broken: its item is skipped, the rest of the report stands
    QVERIFY(exec(drawing_->database(),
        "INSERT INTO material_quantities(item_id, start_station, end_station, cut_volume, fill_volume) "
        "VALUES (101, 20, 40, 'n/a', 0)"));

    CommandOutcome out;
    {
        DrawingDatabase::ReadScope scope(*drawing_);
        QVERIFY(scope.isActive());
        out = VolumeReportCommand().run("1", *drawing_);
    }
    QVERIFY(out.status == CommandOutcome::Ok);
    QCOMPARE(out.rowCount, 3);
    QCOMPARE(int(out.faults.size()), 1);
    QCOMPARE(out.faults[0].recordId, std::string("101"));
    QVERIFY(out.report.find("Total Cut Volume: 15.00") != std::string::npos);
    QVERIFY(out.report.find("Total Fill Volume: 13.00") != std::string::npos);
    QVERIFY(out.report.find("Ramp") == std::string::npos);
}

void TestDrawingDatabase::readScopeAlwaysEndsItsTransaction() {
    QSqlDatabase db = drawing_->database();
    {
        DrawingDatabase::ReadScope scope(*drawing_);
        QVERIFY(scope.isActive());
        QVERIFY(!db.transaction());
        QVERIFY(exec(db, "DELETE FROM material_quantities"));
    }
    // rolled back: the delete is gone and a new transaction can start
    QCOMPARE(int(drawing_->listQuantities(ItemRecord{"100", "Topsoil"}).size()), 2);
    QVERIFY(db.transaction());
    QVERIFY(db.rollback());
}

void TestDrawingDatabase::readOnlyDrawingIsNeverWritten() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("drawing.sqlite");
    {
        DrawingDatabase writer;
        QVERIFY(writer.open(path, DrawingDatabase::ReadWrite));
        populate(writer);
    }

    DrawingDatabase reader;
    QVERIFY(reader.open(path, DrawingDatabase::ReadOnly));
    QVERIFY(!exec(reader.database(), "DELETE FROM material_quantities"));
    QCOMPARE(int(reader.listMaterialLists().size()), 3);

    CommandOutcome out;
    {
        DrawingDatabase::ReadScope scope(reader);
        out = VolumeReportCommand().run("1", reader);
    }
    QVERIFY(out.status == CommandOutcome::Ok);
    QCOMPARE(out.rowCount, 4);
}

void TestDrawingDatabase::openFailureReportsError() {
    QTemporaryDir dir;
    DrawingDatabase db;
    QVERIFY(!db.open(dir.filePath("missing/nowhere.sqlite"), DrawingDatabase::ReadOnly));
    QVERIFY(!db.isOpen());
    QVERIFY(!db.lastError().isEmpty());
}

void TestDrawingDatabase::reopeningSwitchesMode() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("drawing.sqlite");

    DrawingDatabase db;
    QVERIFY(db.open(path, DrawingDatabase::ReadWrite));
    populate(db);
    QVERIFY(db.open(path, DrawingDatabase::ReadWrite));
    QVERIFY(exec(db.database(), "INSERT INTO alignments(id, name) VALUES (3, 'Bypass')"));

    QVERIFY(db.open(path, DrawingDatabase::ReadOnly));
    QVERIFY(db.isOpen());
    QVERIFY(!exec(db.database(), "DELETE FROM alignments"));
    QCOMPARE(int(db.alignments().size()), 3);
}

QTEST_GUILESS_MAIN(TestDrawingDatabase)
#include "tst_drawingdatabase.moc"
