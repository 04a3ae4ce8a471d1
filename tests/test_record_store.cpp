#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>
#include <stdexcept>
#include "RecordStore.h"

static ExpenseRecord makeRecord(const char* date, const char* category, double dollars,
                                const char* note = "") {
    return ExpenseRecord(QDate::fromString(date, "yyyy-MM-dd"), category,
                         MoneyUtils::fromDollars(dollars), note);
}

static void writeText(const QString& path, const QString& text) {
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
    QTextStream out(&file);
    out.setCodec("UTF-8");
    out << text;
}

static QString readText(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return QString();
    QTextStream in(&file);
    in.setCodec("UTF-8");
    return in.readAll();
}

class RecordStoreTest : public ::testing::Test {
protected:
    QTemporaryDir dir;

    QString pathFor(const QString& name) const { return dir.filePath(name); }

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }
};

// ==================== Load ====================

TEST_F(RecordStoreTest, LoadCreatesHeaderOnlyFileWhenMissing) {
    RecordStore store(pathFor("expenses.csv"));
    LoadSummary summary = store.load();

    EXPECT_EQ(summary.accepted, 0u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(QFile::exists(pathFor("expenses.csv")));
    EXPECT_EQ(readText(pathFor("expenses.csv")), QString("date,category,amount,note\n"));
}

TEST_F(RecordStoreTest, LoadSkipsMalformedRows) {
    writeText(pathFor("expenses.csv"),
              "date,category,amount,note\n"
              "2024-01-01,Food,12.50,lunch\n"
              "2024-01-02,Food,abc,broken\n"
              "not-a-date,Rent,500,\n"
              "2024-01-03,Transport,3,bus\n");

    RecordStore store(pathFor("expenses.csv"));
    LoadSummary summary = store.load();

    EXPECT_EQ(summary.accepted, 2u);
    EXPECT_EQ(summary.skipped, 2u);
    auto all = store.fetchAll();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].record, makeRecord("2024-01-01", "Food", 12.5, "lunch"));
    EXPECT_EQ(all[1].record, makeRecord("2024-01-03", "Transport", 3.0, "bus"));
}

TEST_F(RecordStoreTest, LoadEmptyFileYieldsEmptyStore) {
    writeText(pathFor("expenses.csv"), "");
    RecordStore store(pathFor("expenses.csv"));
    EXPECT_EQ(store.load().accepted, 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(RecordStoreTest, LoadRejectsFileWithoutHeader) {
    writeText(pathFor("expenses.csv"), "foo,bar\n1,2\n");
    RecordStore store(pathFor("expenses.csv"));
    EXPECT_THROW(store.load(), std::runtime_error);
}

TEST_F(RecordStoreTest, LoadFailsWhenDirectoryMissing) {
    RecordStore store(pathFor("missing/dir/expenses.csv"));
    EXPECT_THROW(store.load(), std::runtime_error);
}

// ==================== CRUD ====================

TEST_F(RecordStoreTest, AddPreservesInsertionOrder) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();

    store.add(makeRecord("2024-03-01", "Rent", 900));
    store.add(makeRecord("2024-01-15", "Food", 20));
    store.add(makeRecord("2024-02-10", "Travel", 300));

    auto all = store.fetchAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].record.getCategory(), "Rent");
    EXPECT_EQ(all[1].record.getCategory(), "Food");
    EXPECT_EQ(all[2].record.getCategory(), "Travel");
}

TEST_F(RecordStoreTest, AddAssignsDistinctIds) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    RecordId a = store.add(makeRecord("2024-03-01", "Rent", 900));
    RecordId b = store.add(makeRecord("2024-03-01", "Rent", 900));
    EXPECT_NE(a, b);
    EXPECT_EQ(store.indexOf(a), std::optional<std::size_t>(0));
    EXPECT_EQ(store.indexOf(b), std::optional<std::size_t>(1));
}

TEST_F(RecordStoreTest, MutationsRewriteBackingFile) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-03-01", "Rent", 900, "march"));

    RecordStore reopened(pathFor("expenses.csv"));
    reopened.load();
    ASSERT_EQ(reopened.size(), 1u);
    EXPECT_EQ(reopened.fetchAll()[0].record, makeRecord("2024-03-01", "Rent", 900, "march"));
    EXPECT_EQ(readText(pathFor("expenses.csv")),
              QString("date,category,amount,note\n2024-03-01,Rent,900.00,march\n"));
}

TEST_F(RecordStoreTest, UpdateReplacesOnlyTargetIndex) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-01-01", "Food", 10));
    store.add(makeRecord("2024-01-02", "Food", 20));
    store.add(makeRecord("2024-01-03", "Food", 30));
    RecordId middleId = store.fetchAll()[1].id;

    ExpenseRecord replacement = makeRecord("2024-02-02", "Health", 45.25, "dentist");
    store.update(1, replacement);

    auto all = store.fetchAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[1].record, replacement);
    EXPECT_EQ(all[1].id, middleId);
    EXPECT_EQ(all[0].record, makeRecord("2024-01-01", "Food", 10));
    EXPECT_EQ(all[2].record, makeRecord("2024-01-03", "Food", 30));
}

TEST_F(RecordStoreTest, RemoveShiftsLaterIndices) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-01-01", "A", 1));
    store.add(makeRecord("2024-01-02", "B", 2));
    store.add(makeRecord("2024-01-03", "C", 3));

    store.remove(0);

    auto all = store.fetchAll();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].record.getCategory(), "B");
    EXPECT_EQ(all[1].record.getCategory(), "C");
}

TEST_F(RecordStoreTest, BadIndexThrows) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-01-01", "A", 1));

    EXPECT_THROW(store.update(1, makeRecord("2024-01-01", "B", 2)), std::out_of_range);
    EXPECT_THROW(store.remove(5), std::out_of_range);
    EXPECT_THROW(store.removeById(999), std::out_of_range);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(RecordStoreTest, ClearEmptiesStoreAndFile) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-01-01", "A", 1));
    store.add(makeRecord("2024-01-02", "B", 2));

    store.clear();

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(readText(pathFor("expenses.csv")), QString("date,category,amount,note\n"));
}

TEST_F(RecordStoreTest, DataChangedEmittedOnEveryMutation) {
    RecordStore store(pathFor("expenses.csv"));
    int signals = 0;
    QObject::connect(&store, &RecordStore::dataChanged, [&signals]() { ++signals; });

    store.load();
    RecordId id = store.add(makeRecord("2024-01-01", "A", 1));
    store.updateById(id, makeRecord("2024-01-01", "A", 2));
    store.removeById(id);
    store.clear();

    EXPECT_EQ(signals, 5);
}

TEST_F(RecordStoreTest, InvalidDateIsRejected) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    RecordId id = store.add(makeRecord("2024-01-05", "A", 1));
    const QString before = readText(pathFor("expenses.csv"));

    EXPECT_THROW(store.add(ExpenseRecord(QDate(), "Broken", 100)), std::invalid_argument);
    EXPECT_THROW(store.update(0, ExpenseRecord(QDate(), "Broken", 100)), std::invalid_argument);
    EXPECT_THROW(store.updateById(id, ExpenseRecord(QDate(), "Broken", 100)), std::invalid_argument);

    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.fetchAll()[0].record, makeRecord("2024-01-05", "A", 1));
    EXPECT_EQ(readText(pathFor("expenses.csv")), before);
}

// ==================== Save failures ====================

TEST_F(RecordStoreTest, FailedSaveLeavesListUnchanged) {
    ASSERT_TRUE(QDir(dir.path()).mkdir("data"));
    RecordStore store(dir.filePath("data/expenses.csv"));
    int signals = 0;
    QObject::connect(&store, &RecordStore::dataChanged, [&signals]() { ++signals; });

    store.load();
    RecordId id = store.add(makeRecord("2024-01-01", "Food", 5));
    ASSERT_EQ(signals, 2);
    ASSERT_TRUE(QDir(dir.filePath("data")).removeRecursively());

    EXPECT_THROW(store.add(makeRecord("2024-01-02", "Food", 6)), std::runtime_error);
    EXPECT_THROW(store.updateById(id, makeRecord("2024-01-01", "Rent", 7)), std::runtime_error);
    EXPECT_THROW(store.removeById(id), std::runtime_error);
    EXPECT_THROW(store.clear(), std::runtime_error);

    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.fetchAll()[0].id, id);
    EXPECT_EQ(store.fetchAll()[0].record, makeRecord("2024-01-01", "Food", 5));
    EXPECT_EQ(signals, 2);

    // A retry after the directory comes back writes the record once
    ASSERT_TRUE(QDir(dir.path()).mkdir("data"));
    store.add(makeRecord("2024-01-02", "Food", 6));
    EXPECT_EQ(readText(dir.filePath("data/expenses.csv")),
              QString("date,category,amount,note\n"
                      "2024-01-01,Food,5.00,\n"
                      "2024-01-02,Food,6.00,\n"));
}

TEST_F(RecordStoreTest, FailedImportSaveAddsNothing) {
    writeText(pathFor("incoming.csv"), "date,category,amount,note\n2024-05-01,Food,1,\n");
    ASSERT_TRUE(QDir(dir.path()).mkdir("data"));
    RecordStore store(dir.filePath("data/expenses.csv"));
    store.load();
    ASSERT_TRUE(QDir(dir.filePath("data")).removeRecursively());

    EXPECT_THROW(store.importFrom(pathFor("incoming.csv")), std::runtime_error);
    EXPECT_EQ(store.size(), 0u);
}

// ==================== Filtering ====================

TEST_F(RecordStoreTest, FetchByMonthMatchesYearAndMonth) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-01-05", "A", 1));
    store.add(makeRecord("2024-02-05", "B", 2));
    store.add(makeRecord("2023-01-20", "C", 3));
    store.add(makeRecord("2024-01-31", "D", 4));

    auto jan2024 = store.fetchByMonth(2024, 1);
    ASSERT_EQ(jan2024.size(), 2u);
    EXPECT_EQ(jan2024[0].record.getCategory(), "A");
    EXPECT_EQ(jan2024[1].record.getCategory(), "D");

    EXPECT_EQ(store.fetchByMonth(2024, std::nullopt).size(), 3u);
    EXPECT_EQ(store.fetchByMonth(std::nullopt, 1).size(), 3u);
    EXPECT_EQ(store.fetchByMonth().size(), 4u);
    EXPECT_TRUE(store.fetchByMonth(2022, 1).empty());
}

TEST_F(RecordStoreTest, LoadedViewNeverContainsUnparseableDates) {
    writeText(pathFor("expenses.csv"),
              "date,category,amount,note\n"
              "2024-02-30,Broken,1,\n"
              "2024-01-05,A,1,\n"
              ",Blank,2,\n");

    RecordStore store(pathFor("expenses.csv"));
    EXPECT_EQ(store.load().skipped, 2u);

    EXPECT_EQ(store.fetchByMonth(2024, 1).size(), 1u);
    EXPECT_EQ(store.fetchByMonth(std::nullopt, 2).size(), 0u);
    for (const StoredRecord& row : store.fetchAll()) {
        EXPECT_TRUE(row.record.getDate().isValid());
    }
}

TEST_F(RecordStoreTest, RemoveByIdFromFilteredView) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2023-12-30", "Old", 5));
    store.add(makeRecord("2024-01-05", "Keep", 1));
    store.add(makeRecord("2023-11-01", "Old", 6));
    store.add(makeRecord("2024-01-06", "Drop", 2));

    auto view = store.fetchByMonth(2024, 1);
    ASSERT_EQ(view.size(), 2u);
    // Position 1 in the view is position 3 in the full list
    store.removeById(view[1].id);

    auto all = store.fetchAll();
    ASSERT_EQ(all.size(), 3u);
    for (const StoredRecord& row : all) {
        EXPECT_NE(row.record.getCategory(), "Drop");
    }
}

// ==================== Import / Export ====================

TEST_F(RecordStoreTest, ImportSkipsRowMissingAmount) {
    writeText(pathFor("import.csv"),
              "date,category,amount,note\n"
              "2024-05-01,Food,15.00,\n"
              "2024-05-02,Food,,no amount\n");

    RecordStore store(pathFor("expenses.csv"));
    store.load();
    ImportSummary summary = store.importFrom(pathFor("import.csv"));

    EXPECT_EQ(summary.accepted, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.fetchAll()[0].record, makeRecord("2024-05-01", "Food", 15.0));
}

TEST_F(RecordStoreTest, ImportToleratesMissingNoteColumnAndBlankCategory) {
    writeText(pathFor("import.csv"),
              "amount,date,category\n"
              "7.5,2024-05-01,\n"
              "3,2024-05-02,Transport\n");

    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-04-01", "Rent", 800));
    ImportSummary summary = store.importFrom(pathFor("import.csv"));

    EXPECT_EQ(summary.accepted, 2u);
    auto all = store.fetchAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[1].record, makeRecord("2024-05-01", "Other", 7.5));
    EXPECT_EQ(all[2].record, makeRecord("2024-05-02", "Transport", 3.0));
}

TEST_F(RecordStoreTest, ImportMissingFileThrowsAndLeavesStoreUntouched) {
    RecordStore store(pathFor("expenses.csv"));
    store.load();
    store.add(makeRecord("2024-04-01", "Rent", 800));

    EXPECT_THROW(store.importFrom(pathFor("nope.csv")), std::runtime_error);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(RecordStoreTest, ExportThenImportRoundTrip) {
    RecordStore source(pathFor("expenses.csv"));
    source.load();
    source.add(makeRecord("2024-01-01", "Food", 12.34, "lunch, with \"friends\""));
    source.add(makeRecord("2024-01-02", "Rent", 1500, "line one\nline two"));
    source.add(makeRecord("2024-01-02", "Refund", -20.5));
    source.add(makeRecord("2024-02-14", "Gifts", 0.1, ""));

    EXPECT_EQ(source.exportTo(pathFor("export.csv")), 4u);

    RecordStore target(pathFor("other.csv"));
    target.load();
    ImportSummary summary = target.importFrom(pathFor("export.csv"));

    EXPECT_EQ(summary.accepted, 4u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(RecordStore::recordsOf(target.fetchAll()), RecordStore::recordsOf(source.fetchAll()));
}

TEST_F(RecordStoreTest, LargeAmountSurvivesExportAndImport) {
    const Money largest = 999999999999999; // 9,999,999,999,999.99
    RecordStore source(pathFor("expenses.csv"));
    source.load();
    source.add(ExpenseRecord(QDate(2024, 1, 1), "House", largest));
    source.add(ExpenseRecord(QDate(2024, 1, 2), "Refund", -largest));
    source.add(ExpenseRecord(QDate(2024, 1, 3), "Odd", 900719925474099));

    source.exportTo(pathFor("export.csv"));
    EXPECT_TRUE(readText(pathFor("export.csv")).contains("2024-01-01,House,9999999999999.99,"));

    RecordStore target(pathFor("other.csv"));
    target.load();
    EXPECT_EQ(target.importFrom(pathFor("export.csv")).accepted, 3u);
    EXPECT_EQ(RecordStore::recordsOf(target.fetchAll()), RecordStore::recordsOf(source.fetchAll()));
}
