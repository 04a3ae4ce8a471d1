#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

namespace Csv {

using Row = QStringList;

enum Column { Date = 0, Category, Amount, Note, ColumnCount };

// Canonical header written on every save and export.
const QStringList& header();

// Quotes a field when it contains a separator, a quote or a line break.
QString escapeField(const QString& field);
QString formatLine(const QStringList& fields);

// Splits a whole document into rows. Quoted fields may span lines.
// Completely blank lines are dropped.
QVector<Row> parseDocument(const QString& text);

// Maps header names to positions so reordered or extended files still import.
class ColumnMap {
private:
    int positions_[ColumnCount] = {-1, -1, -1, -1};

public:
    static ColumnMap fromHeader(const Row& headerRow);

    bool has(Column column) const { return positions_[column] >= 0; }

    // Date and amount columns are required; category and note may be absent.
    bool isUsable() const { return has(Date) && has(Amount); }

    QString field(const Row& row, Column column) const;
};

} // namespace Csv
