#include "RecordValidation.h"

#include <QRegularExpression>
#include <cmath>

QDate parseDate(const QString& text) {
    const QString trimmed = text.trimmed();
    if (trimmed.size() != 10) {
        return QDate();
    }
    return QDate::fromString(trimmed, ExpenseDefaults::kDateFormat);
}

bool parseAmount(const QString& text, Money& out) {
    static const QRegularExpression numeral(
        R"(^[+-]?(\d+(\.\d*)?|\.\d+)([eE][+-]?\d+)?$)");

    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty() || !numeral.match(trimmed).hasMatch()) {
        return false;
    }

    bool ok = false;
    double value = trimmed.toDouble(&ok);
    if (!ok || !std::isfinite(value) || std::fabs(value) > MoneyUtils::kMaxDollars) {
        return false;
    }
    out = MoneyUtils::fromDollars(value);
    return true;
}

RowValidation validateRow(const QString& date, const QString& category,
                          const QString& amount, const QString& note) {
    RowValidation result;

    if (date.trimmed().isEmpty()) {
        result.status = RowStatus::MissingDate;
        return result;
    }
    QDate parsed = parseDate(date);
    if (!parsed.isValid()) {
        result.status = RowStatus::InvalidDate;
        return result;
    }

    if (amount.trimmed().isEmpty()) {
        result.status = RowStatus::MissingAmount;
        return result;
    }
    Money cents = 0;
    if (!parseAmount(amount, cents)) {
        result.status = RowStatus::InvalidAmount;
        return result;
    }

    QString cat = category.trimmed();
    if (cat.isEmpty()) {
        cat = ExpenseDefaults::kOtherCategory;
    }

    result.record = ExpenseRecord(parsed, cat.toStdString(), cents, note.trimmed().toStdString());
    return result;
}

QString describe(RowStatus status) {
    switch (status) {
        case RowStatus::Accepted: return "Accepted";
        case RowStatus::MissingDate: return "Date is missing";
        case RowStatus::InvalidDate: return "Date must be YYYY-MM-DD";
        case RowStatus::MissingAmount: return "Amount is missing";
        case RowStatus::InvalidAmount: return "Enter a valid amount";
        default: return "Unknown";
    }
}
