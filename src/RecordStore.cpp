#include "RecordStore.h"

#include "CsvFormat.h"
#include "RecordValidation.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <stdexcept>
#include <utility>

namespace {

std::runtime_error fileError(const QString& action, const QString& path, const QString& reason) {
    return std::runtime_error(
        QString("Failed to %1 %2: %3").arg(action, path, reason).toStdString());
}

// Runs every data row through validateRow; rejected rows are counted and logged, never fatal.
std::vector<ExpenseRecord> parseRecords(const QString& text, const QString& source,
                                        LoadSummary& summary) {
    std::vector<ExpenseRecord> records;
    const QVector<Csv::Row> rows = Csv::parseDocument(text);
    if (rows.isEmpty()) {
        return records;
    }

    const Csv::ColumnMap columns = Csv::ColumnMap::fromHeader(rows.first());
    if (!columns.isUsable()) {
        throw std::runtime_error(
            QString("%1 has no date/amount header row").arg(source).toStdString());
    }

    for (int i = 1; i < rows.size(); ++i) {
        const Csv::Row& row = rows.at(i);
        RowValidation result = validateRow(columns.field(row, Csv::Date),
                                           columns.field(row, Csv::Category),
                                           columns.field(row, Csv::Amount),
                                           columns.field(row, Csv::Note));
        if (!result.accepted()) {
            ++summary.skipped;
            qWarning() << "Skipping row" << i + 1 << "of" << source << "-" << describe(result.status);
            continue;
        }
        records.push_back(result.record);
        ++summary.accepted;
    }
    return records;
}

} // namespace

RecordStore::RecordStore(const QString& path, QObject* parent)
    : QObject(parent), path_(path) {}

LoadSummary RecordStore::load() {
    if (!QFileInfo::exists(path_)) {
        commit({});
        qInfo() << "Created empty expense file" << path_;
        return LoadSummary{};
    }

    LoadSummary summary;
    std::vector<ExpenseRecord> records = parseRecords(readFile(path_), path_, summary);

    rows_.clear();
    rows_.reserve(records.size());
    for (const ExpenseRecord& record : records) {
        rows_.push_back(StoredRecord{next_record_id_++, record});
    }

    qInfo() << "Loaded" << summary.accepted << "records from" << path_;
    if (summary.skipped > 0) {
        qWarning() << summary.skipped << "malformed rows skipped while loading" << path_;
    }
    emit dataChanged();
    return summary;
}

RecordId RecordStore::add(const ExpenseRecord& record) {
    requireValidDate(record);
    std::vector<StoredRecord> rows = rows_;
    RecordId id = next_record_id_++;
    rows.push_back(StoredRecord{id, record});
    commit(std::move(rows));
    return id;
}

void RecordStore::update(std::size_t index, const ExpenseRecord& record) {
    if (index >= rows_.size()) {
        throw std::out_of_range("Record index out of range");
    }
    requireValidDate(record);
    std::vector<StoredRecord> rows = rows_;
    rows[index].record = record;
    commit(std::move(rows));
}

void RecordStore::remove(std::size_t index) {
    if (index >= rows_.size()) {
        throw std::out_of_range("Record index out of range");
    }
    std::vector<StoredRecord> rows = rows_;
    rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(index));
    commit(std::move(rows));
}

void RecordStore::clear() {
    commit({});
}

void RecordStore::updateById(RecordId id, const ExpenseRecord& record) {
    update(checkedIndex(id), record);
}

void RecordStore::removeById(RecordId id) {
    remove(checkedIndex(id));
}

std::optional<std::size_t> RecordStore::indexOf(RecordId id) const {
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

const StoredRecord* RecordStore::find(RecordId id) const {
    auto index = indexOf(id);
    return index ? &rows_[*index] : nullptr;
}

std::vector<StoredRecord> RecordStore::fetchAll() const {
    return rows_;
}

std::vector<StoredRecord> RecordStore::fetchByMonth(std::optional<int> year,
                                                    std::optional<int> month) const {
    if (!year && !month) {
        return rows_;
    }

    std::vector<StoredRecord> result;
    for (const StoredRecord& row : rows_) {
        const QDate& date = row.record.getDate();
        if (!date.isValid()) {
            continue;
        }
        if (year && date.year() != *year) {
            continue;
        }
        if (month && date.month() != *month) {
            continue;
        }
        result.push_back(row);
    }
    return result;
}

ImportSummary RecordStore::importFrom(const QString& path) {
    ImportSummary summary;
    std::vector<ExpenseRecord> records = parseRecords(readFile(path), path, summary);

    if (!records.empty()) {
        std::vector<StoredRecord> rows = rows_;
        for (const ExpenseRecord& record : records) {
            rows.push_back(StoredRecord{next_record_id_++, record});
        }
        commit(std::move(rows));
    }

    qInfo() << "Imported" << summary.accepted << "records from" << path
            << "(" << summary.skipped << "skipped )";
    return summary;
}

std::size_t RecordStore::exportTo(const QString& path) const {
    writeFile(path, rows_);
    qInfo() << "Exported" << rows_.size() << "records to" << path;
    return rows_.size();
}

std::vector<ExpenseRecord> RecordStore::recordsOf(const std::vector<StoredRecord>& stored) {
    std::vector<ExpenseRecord> records;
    records.reserve(stored.size());
    for (const StoredRecord& row : stored) {
        records.push_back(row.record);
    }
    return records;
}

void RecordStore::commit(std::vector<StoredRecord> rows) {
    writeFile(path_, rows);
    rows_ = std::move(rows);
    emit dataChanged();
}

void RecordStore::requireValidDate(const ExpenseRecord& record) {
    if (!record.getDate().isValid()) {
        throw std::invalid_argument("Record date is not a valid calendar date");
    }
}

void RecordStore::writeFile(const QString& path, const std::vector<StoredRecord>& rows) const {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Cannot open" << path << "for writing:" << file.errorString();
        throw fileError("write", path, file.errorString());
    }

    QTextStream out(&file);
    out.setCodec("UTF-8");
    out << Csv::formatLine(Csv::header()) << '\n';
    for (const StoredRecord& row : rows) {
        const ExpenseRecord& r = row.record;
        out << Csv::formatLine({r.getDateString(),
                                QString::fromStdString(r.getCategory()),
                                MoneyUtils::toPlain(r.getAmount()),
                                QString::fromStdString(r.getNote())})
            << '\n';
    }
    out.flush();

    if (out.status() != QTextStream::Ok || !file.commit()) {
        qWarning() << "Error saving expenses to" << path << ":" << file.errorString();
        throw fileError("save", path, file.errorString());
    }
}

QString RecordStore::readFile(const QString& path) const {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Cannot open" << path << "for reading:" << file.errorString();
        throw fileError("open", path, file.errorString());
    }
    QTextStream in(&file);
    in.setCodec("UTF-8");
    return in.readAll();
}

std::size_t RecordStore::checkedIndex(RecordId id) const {
    auto index = indexOf(id);
    if (!index) {
        throw std::out_of_range("Record not found");
    }
    return *index;
}
