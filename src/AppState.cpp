#include "AppState.h"

namespace {

std::optional<int> parseNumber(const QString& text) {
    bool ok = false;
    int value = text.trimmed().toInt(&ok);
    return ok ? std::optional<int>(value) : std::nullopt;
}

} // namespace

FilterState FilterState::parse(const QString& yearText, const QString& monthText) {
    FilterState state;
    state.year = parseNumber(yearText);
    state.month = parseNumber(monthText);
    if (state.month && (*state.month < 1 || *state.month > 12)) {
        state.month.reset();
    }
    return state;
}

QString FilterState::describe() const {
    if (year && month) {
        return QString("%1-%2").arg(*year, 4, 10, QChar('0')).arg(*month, 2, 10, QChar('0'));
    }
    if (year) {
        return QString::number(*year);
    }
    if (month) {
        return QString("month %1").arg(*month);
    }
    return "All";
}

QString sliceLabel(const QString& category, double fraction) {
    return QString("%1 %2%").arg(category, QString::number(qRound(fraction * 100.0)));
}

ExpenseForm ExpenseForm::blank(const QDate& today) {
    ExpenseForm form;
    form.date = today.toString(ExpenseDefaults::kDateFormat);
    return form;
}

ExpenseForm ExpenseForm::fromRecord(const ExpenseRecord& record) {
    ExpenseForm form;
    form.date = record.getDateString();
    form.category = QString::fromStdString(record.getCategory());
    form.amount = MoneyUtils::toPlain(record.getAmount());
    form.note = QString::fromStdString(record.getNote());
    return form;
}
