#pragma once

#include "ExpenseRecord.h"

#include <QDate>
#include <QString>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct DailyTotal {
    QDate date;
    Money total;
};

struct MonthlyTotal {
    QString month; // yyyy-MM
    Money total;
};

struct CategoryTotal {
    std::string category;
    Money total;
};

// Least-squares fit over (ordinal day position, daily total in dollars).
struct TrendLine {
    double slope = 0.0;
    double intercept = 0.0;
    std::vector<double> values;
};

struct SpendingReport {
    std::vector<DailyTotal> daily;
    TrendLine trend;
    std::vector<MonthlyTotal> monthly;
    std::vector<CategoryTotal> categories;
    Money grandTotal = 0;
    std::size_t recordCount = 0;
};

inline bool operator==(const DailyTotal& a, const DailyTotal& b) {
    return a.date == b.date && a.total == b.total;
}
inline bool operator==(const MonthlyTotal& a, const MonthlyTotal& b) {
    return a.month == b.month && a.total == b.total;
}
inline bool operator==(const CategoryTotal& a, const CategoryTotal& b) {
    return a.category == b.category && a.total == b.total;
}

class SpendingAnalyzer {
public:
    static constexpr std::size_t kTopCategories = 6;

    static std::vector<DailyTotal> dailyTotals(const std::vector<ExpenseRecord>& records);

    // Fewer than two days: values are the raw totals, no regression. Slope is
    // 0 and intercept is the single day's total (0 for no days).
    static TrendLine trendLine(const std::vector<DailyTotal>& daily);

    static std::vector<MonthlyTotal> monthlyTotals(const std::vector<DailyTotal>& daily);

    // Sorted by total descending, ties in first-seen order. Anything past topN
    // is folded into a trailing "Other" bucket.
    static std::vector<CategoryTotal> categoryTotals(const std::vector<ExpenseRecord>& records,
                                                     std::size_t topN = kTopCategories);

    // std::nullopt means there is nothing to chart.
    static std::optional<SpendingReport> analyze(const std::vector<ExpenseRecord>& records);
};
