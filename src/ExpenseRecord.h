#pragma once

#include <QDate>
#include <QString>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

using RecordId = std::uint64_t;
using Money = std::int64_t; // Store as cents to avoid floating point issues

// Money utility functions
class MoneyUtils {
public:
    // Largest accepted magnitude, in dollars. Keeps cents exact in a double
    // and leaves headroom for sums.
    static constexpr double kMaxDollars = 1e13;

    static Money fromDollars(double dollars) {
        return static_cast<Money>(std::llround(dollars * 100.0));
    }

    static double toDollars(Money cents) {
        return static_cast<double>(cents) / 100.0;
    }

    // Display form with thousands grouping, e.g. "1,234.50"
    static QString format(Money cents) {
        QString whole = QString::number(wholeDollars(cents));
        for (int i = whole.size() - 3; i > 0; i -= 3) {
            whole.insert(i, QLatin1Char(','));
        }
        return sign(cents) + whole + QLatin1Char('.') + centPart(cents);
    }

    // Storage form without grouping, e.g. "1234.50"
    static QString toPlain(Money cents) {
        return sign(cents) + QString::number(wholeDollars(cents)) + QLatin1Char('.') + centPart(cents);
    }

private:
    static QString sign(Money cents) {
        return cents < 0 ? QStringLiteral("-") : QString();
    }

    // Unsigned so INT64_MIN has a magnitude
    static std::uint64_t magnitude(Money cents) {
        return cents < 0 ? 0 - static_cast<std::uint64_t>(cents) : static_cast<std::uint64_t>(cents);
    }

    static qulonglong wholeDollars(Money cents) {
        return static_cast<qulonglong>(magnitude(cents) / 100);
    }

    static QString centPart(Money cents) {
        return QString("%1").arg(static_cast<qulonglong>(magnitude(cents) % 100), 2, 10, QLatin1Char('0'));
    }
};

class ExpenseRecord {
private:
    QDate date_;
    std::string category_;
    Money amount_ = 0;
    std::string note_;

public:
    ExpenseRecord() = default;
    ExpenseRecord(const QDate& date, const std::string& category, Money amount,
                  const std::string& note = "")
        : date_(date), category_(category), amount_(amount), note_(note) {}

    const QDate& getDate() const { return date_; }
    const std::string& getCategory() const { return category_; }
    Money getAmount() const { return amount_; }
    const std::string& getNote() const { return note_; }

    QString getDateString() const { return date_.toString("yyyy-MM-dd"); }

    bool operator==(const ExpenseRecord& other) const {
        return date_ == other.date_ && category_ == other.category_ &&
               amount_ == other.amount_ && note_ == other.note_;
    }
    bool operator!=(const ExpenseRecord& other) const { return !(*this == other); }
};

// A record as held by the store, tagged with the identifier it was given on entry.
struct StoredRecord {
    RecordId id;
    ExpenseRecord record;
};

namespace ExpenseDefaults {
    inline const char* const kDateFormat = "yyyy-MM-dd";
    inline const char* const kOtherCategory = "Other";
    inline const char* const kDefaultFile = "expenses.csv";

    inline const std::vector<std::string>& suggestedCategories() {
        static const std::vector<std::string> categories = {
            "Rent", "Tuition", "Utilities", "Groceries", "Food", "Transport", "Shopping",
            "Entertainment", "Health", "Insurance", "Internet", "Subscriptions", "Gifts",
            "Travel", "Other"
        };
        return categories;
    }
}
