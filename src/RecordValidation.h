#pragma once

#include "ExpenseRecord.h"

#include <QDate>
#include <QString>
#include <cstdint>

enum class RowStatus : std::uint8_t {
    Accepted, MissingDate, InvalidDate, MissingAmount, InvalidAmount
};

struct RowValidation {
    RowStatus status = RowStatus::Accepted;
    ExpenseRecord record;

    bool accepted() const { return status == RowStatus::Accepted; }
};

// Strict yyyy-MM-dd. Returns an invalid QDate when the text is not a real calendar date.
QDate parseDate(const QString& text);

// Plain decimal numeral, optional sign and exponent, no thousands separators.
bool parseAmount(const QString& text, Money& out);

// Single accept/reject policy shared by file load, CSV import and the entry form.
// A blank category becomes "Other"; a blank note stays empty.
RowValidation validateRow(const QString& date, const QString& category,
                          const QString& amount, const QString& note);

QString describe(RowStatus status);
