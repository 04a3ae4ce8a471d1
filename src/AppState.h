#pragma once

#include "ExpenseRecord.h"
#include "RecordValidation.h"

#include <QDate>
#include <QString>
#include <optional>

// Year/month predicate shared by the transaction table and the analytics charts.
struct FilterState {
    std::optional<int> year;
    std::optional<int> month;

    // Blank or non-numeric text means "no constraint"; so does a month outside 1..12.
    static FilterState parse(const QString& yearText, const QString& monthText);

    bool isActive() const { return year.has_value() || month.has_value(); }
    QString describe() const;
};

// Pie slice caption, e.g. "Food 42%". fraction is the share in 0..1.
QString sliceLabel(const QString& category, double fraction);

// Text currently in the add/edit form.
struct ExpenseForm {
    QString date;
    QString category;
    QString amount;
    QString note;

    static ExpenseForm blank(const QDate& today);
    static ExpenseForm fromRecord(const ExpenseRecord& record);

    RowValidation validate() const {
        return validateRow(date, category, amount, note);
    }
};
