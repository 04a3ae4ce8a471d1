#include "SpendingAnalyzer.h"

#include <algorithm>
#include <map>
#include <unordered_map>

std::vector<DailyTotal> SpendingAnalyzer::dailyTotals(const std::vector<ExpenseRecord>& records) {
    std::map<QDate, Money> byDate;
    for (const ExpenseRecord& record : records) {
        if (!record.getDate().isValid()) {
            continue;
        }
        byDate[record.getDate()] += record.getAmount();
    }

    std::vector<DailyTotal> result;
    result.reserve(byDate.size());
    for (const auto& [date, total] : byDate) {
        result.push_back(DailyTotal{date, total});
    }
    return result;
}

TrendLine SpendingAnalyzer::trendLine(const std::vector<DailyTotal>& daily) {
    TrendLine line;
    const std::size_t n = daily.size();
    line.values.reserve(n);

    if (n < 2) {
        for (const DailyTotal& day : daily) {
            line.values.push_back(MoneyUtils::toDollars(day.total));
        }
        line.intercept = line.values.empty() ? 0.0 : line.values.front();
        return line;
    }

    double sumX = 0.0, sumY = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        sumX += static_cast<double>(i);
        sumY += MoneyUtils::toDollars(daily[i].total);
    }
    const double meanX = sumX / static_cast<double>(n);
    const double meanY = sumY / static_cast<double>(n);

    double sxy = 0.0, sxx = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - meanX;
        sxy += dx * (MoneyUtils::toDollars(daily[i].total) - meanY);
        sxx += dx * dx;
    }

    line.slope = sxy / sxx;
    line.intercept = meanY - line.slope * meanX;
    for (std::size_t i = 0; i < n; ++i) {
        line.values.push_back(line.slope * static_cast<double>(i) + line.intercept);
    }
    return line;
}

std::vector<MonthlyTotal> SpendingAnalyzer::monthlyTotals(const std::vector<DailyTotal>& daily) {
    std::map<QString, Money> byMonth;
    for (const DailyTotal& day : daily) {
        byMonth[day.date.toString("yyyy-MM")] += day.total;
    }

    std::vector<MonthlyTotal> result;
    result.reserve(byMonth.size());
    for (const auto& [month, total] : byMonth) {
        result.push_back(MonthlyTotal{month, total});
    }
    return result;
}

std::vector<CategoryTotal> SpendingAnalyzer::categoryTotals(const std::vector<ExpenseRecord>& records,
                                                            std::size_t topN) {
    std::vector<CategoryTotal> totals;
    std::unordered_map<std::string, std::size_t> positions;
    for (const ExpenseRecord& record : records) {
        auto [it, inserted] = positions.emplace(record.getCategory(), totals.size());
        if (inserted) {
            totals.push_back(CategoryTotal{record.getCategory(), 0});
        }
        totals[it->second].total += record.getAmount();
    }

    std::stable_sort(totals.begin(), totals.end(),
                     [](const CategoryTotal& a, const CategoryTotal& b) {
                         return a.total > b.total;
                     });

    if (totals.size() <= topN) {
        return totals;
    }

    Money rest = 0;
    for (std::size_t i = topN; i < totals.size(); ++i) {
        rest += totals[i].total;
    }
    totals.resize(topN);
    totals.push_back(CategoryTotal{ExpenseDefaults::kOtherCategory, rest});
    return totals;
}

std::optional<SpendingReport> SpendingAnalyzer::analyze(const std::vector<ExpenseRecord>& records) {
    if (records.empty()) {
        return std::nullopt;
    }

    SpendingReport report;
    report.daily = dailyTotals(records);
    report.trend = trendLine(report.daily);
    report.monthly = monthlyTotals(report.daily);
    report.categories = categoryTotals(records);
    report.recordCount = records.size();
    for (const ExpenseRecord& record : records) {
        report.grandTotal += record.getAmount();
    }
    return report;
}
