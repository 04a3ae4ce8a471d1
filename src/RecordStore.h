#pragma once

#include "ExpenseRecord.h"

#include <QObject>
#include <QString>
#include <cstddef>
#include <optional>
#include <vector>

struct LoadSummary {
    std::size_t accepted = 0;
    std::size_t skipped = 0;
};

using ImportSummary = LoadSummary;

// Owns the ordered expense list and its CSV mirror. Every mutation rewrites the
// whole backing file and then emits dataChanged(). If the write fails the list
// is left as it was and the error propagates. Records must carry a valid date.
class RecordStore : public QObject {
    Q_OBJECT

private:
    QString path_;
    std::vector<StoredRecord> rows_;
    RecordId next_record_id_ = 1;

public:
    explicit RecordStore(const QString& path, QObject* parent = nullptr);

    const QString& path() const { return path_; }
    std::size_t size() const { return rows_.size(); }

    LoadSummary load();

    RecordId add(const ExpenseRecord& record);
    void update(std::size_t index, const ExpenseRecord& record);
    void remove(std::size_t index);
    void clear();

    void updateById(RecordId id, const ExpenseRecord& record);
    void removeById(RecordId id);
    std::optional<std::size_t> indexOf(RecordId id) const;
    const StoredRecord* find(RecordId id) const;

    std::vector<StoredRecord> fetchAll() const;
    std::vector<StoredRecord> fetchByMonth(std::optional<int> year = std::nullopt,
                                           std::optional<int> month = std::nullopt) const;

    ImportSummary importFrom(const QString& path);
    std::size_t exportTo(const QString& path) const;

    static std::vector<ExpenseRecord> recordsOf(const std::vector<StoredRecord>& stored);

signals:
    void dataChanged();

private:
    void commit(std::vector<StoredRecord> rows);
    static void requireValidDate(const ExpenseRecord& record);
    void writeFile(const QString& path, const std::vector<StoredRecord>& rows) const;
    QString readFile(const QString& path) const;
    std::size_t checkedIndex(RecordId id) const;
};
