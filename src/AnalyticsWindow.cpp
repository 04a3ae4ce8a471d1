#include "AnalyticsWindow.h"

#include "RecordStore.h"

#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPen>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>
#include <QtCharts/QBarCategoryAxis>
#include <QtCharts/QBarSeries>
#include <QtCharts/QBarSet>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QPieSeries>
#include <QtCharts/QPieSlice>
#include <QtCharts/QValueAxis>

namespace {

QChart* noDataChart(const QString& title) {
    QChart* chart = new QChart();
    chart->setTitle(title + " - No data");
    chart->legend()->hide();
    return chart;
}

QChart* buildTrendChart(const SpendingReport& report) {
    QLineSeries* dailySeries = new QLineSeries();
    dailySeries->setName("Daily Total");
    dailySeries->setPointsVisible(true);

    QLineSeries* trendSeries = new QLineSeries();
    trendSeries->setName("Trend");
    QPen pen = trendSeries->pen();
    pen.setStyle(Qt::DashLine);
    pen.setWidth(2);
    trendSeries->setPen(pen);

    QStringList labels;
    for (std::size_t i = 0; i < report.daily.size(); ++i) {
        dailySeries->append(static_cast<qreal>(i), MoneyUtils::toDollars(report.daily[i].total));
        trendSeries->append(static_cast<qreal>(i), report.trend.values[i]);
        labels << report.daily[i].date.toString(ExpenseDefaults::kDateFormat);
    }

    QChart* chart = new QChart();
    chart->addSeries(dailySeries);
    chart->addSeries(trendSeries);
    chart->setTitle("Daily Spending Trend");
    chart->legend()->setAlignment(Qt::AlignTop);

    QBarCategoryAxis* axisX = new QBarCategoryAxis();
    axisX->append(labels);
    axisX->setLabelsAngle(-45);
    chart->addAxis(axisX, Qt::AlignBottom);
    dailySeries->attachAxis(axisX);
    trendSeries->attachAxis(axisX);

    QValueAxis* axisY = new QValueAxis();
    axisY->setLabelFormat("%.2f");
    chart->addAxis(axisY, Qt::AlignLeft);
    dailySeries->attachAxis(axisY);
    trendSeries->attachAxis(axisY);
    return chart;
}

QChart* buildMonthlyChart(const SpendingReport& report) {
    QBarSet* set = new QBarSet("Total");
    QStringList months;
    for (const MonthlyTotal& month : report.monthly) {
        *set << MoneyUtils::toDollars(month.total);
        months << month.month;
    }

    QBarSeries* series = new QBarSeries();
    series->append(set);

    QChart* chart = new QChart();
    chart->addSeries(series);
    chart->setTitle("Monthly Spending");
    chart->legend()->hide();

    QBarCategoryAxis* axisX = new QBarCategoryAxis();
    axisX->append(months);
    axisX->setLabelsAngle(-45);
    chart->addAxis(axisX, Qt::AlignBottom);
    series->attachAxis(axisX);

    QValueAxis* axisY = new QValueAxis();
    axisY->setLabelFormat("%.2f");
    chart->addAxis(axisY, Qt::AlignLeft);
    series->attachAxis(axisY);
    return chart;
}

QChart* buildCategoryChart(const SpendingReport& report) {
    QPieSeries* series = new QPieSeries();
    for (const CategoryTotal& bucket : report.categories) {
        // A pie cannot show refunds or zero buckets
        if (bucket.total <= 0) {
            continue;
        }
        series->append(QString::fromStdString(bucket.category), MoneyUtils::toDollars(bucket.total));
    }

    if (series->count() == 0) {
        delete series;
        return noDataChart("Expenses by Category");
    }

    for (QPieSlice* slice : series->slices()) {
        slice->setLabel(sliceLabel(slice->label(), slice->percentage()));
    }
    series->setLabelsVisible(true);

    QChart* chart = new QChart();
    chart->addSeries(series);
    chart->setTitle("Expenses by Category");
    chart->legend()->setAlignment(Qt::AlignRight);
    return chart;
}

} // namespace

AnalyticsWindow::AnalyticsWindow(RecordStore* store, QWidget* parent)
    : QDialog(parent), store_(store) {
    setWindowTitle("Expense Analytics");
    setModal(false);
    setAttribute(Qt::WA_DeleteOnClose);
    resize(1000, 700);

    setupUI();
    connect(store_, &RecordStore::dataChanged, this, &AnalyticsWindow::drawCharts);
    drawCharts();
}

void AnalyticsWindow::setupUI() {
    QVBoxLayout* mainLayout = new QVBoxLayout(this);

    QHBoxLayout* filterLayout = new QHBoxLayout();
    yearEdit = new QLineEdit(this);
    yearEdit->setMaximumWidth(70);
    monthEdit = new QLineEdit(this);
    monthEdit->setMaximumWidth(50);

    QPushButton* applyBtn = new QPushButton("Apply", this);
    QPushButton* clearBtn = new QPushButton("Clear", this);
    connect(applyBtn, &QPushButton::clicked, this, &AnalyticsWindow::onApplyFilter);
    connect(clearBtn, &QPushButton::clicked, this, &AnalyticsWindow::onClearFilter);
    connect(yearEdit, &QLineEdit::returnPressed, this, &AnalyticsWindow::onApplyFilter);
    connect(monthEdit, &QLineEdit::returnPressed, this, &AnalyticsWindow::onApplyFilter);

    filterLayout->addWidget(new QLabel("Year:", this));
    filterLayout->addWidget(yearEdit);
    filterLayout->addWidget(new QLabel("Month:", this));
    filterLayout->addWidget(monthEdit);
    filterLayout->addWidget(applyBtn);
    filterLayout->addWidget(clearBtn);
    filterLayout->addStretch();
    mainLayout->addLayout(filterLayout);

    tabs = new QTabWidget(this);
    trendView = new QChartView(this);
    monthlyView = new QChartView(this);
    categoryView = new QChartView(this);
    for (QChartView* view : {trendView, monthlyView, categoryView}) {
        view->setRenderHint(QPainter::Antialiasing);
    }
    tabs->addTab(trendView, "Trend");
    tabs->addTab(monthlyView, "Monthly");
    tabs->addTab(categoryView, "Category");
    mainLayout->addWidget(tabs);

    summaryLabel = new QLabel("", this);
    summaryLabel->setStyleSheet("QLabel { color: gray; font-style: italic; }");
    mainLayout->addWidget(summaryLabel);
}

void AnalyticsWindow::replaceChart(QChartView* view, QChart* chart) {
    QChart* previous = view->chart();
    view->setChart(chart);
    delete previous;
}

void AnalyticsWindow::drawCharts() {
    auto rows = store_->fetchByMonth(filter_.year, filter_.month);
    auto report = SpendingAnalyzer::analyze(RecordStore::recordsOf(rows));

    if (!report) {
        replaceChart(trendView, noDataChart("Daily Spending Trend"));
        replaceChart(monthlyView, noDataChart("Monthly Spending"));
        replaceChart(categoryView, noDataChart("Expenses by Category"));
        summaryLabel->setText(QString("Filter: %1 | No data").arg(filter_.describe()));
        return;
    }

    qDebug() << "Drawing charts for" << filter_.describe() << "-" << report->daily.size() << "days,"
             << report->monthly.size() << "months," << report->categories.size() << "categories";

    replaceChart(trendView, buildTrendChart(*report));
    replaceChart(monthlyView, buildMonthlyChart(*report));
    replaceChart(categoryView, buildCategoryChart(*report));

    summaryLabel->setText(QString("Filter: %1 | %2 records | Total %3 | Trend slope %4 per day")
                              .arg(filter_.describe(),
                                   QString::number(report->recordCount),
                                   MoneyUtils::format(report->grandTotal),
                                   QString::number(report->trend.slope, 'f', 2)));
}

void AnalyticsWindow::onApplyFilter() {
    filter_ = FilterState::parse(yearEdit->text(), monthEdit->text());
    drawCharts();
}

void AnalyticsWindow::onClearFilter() {
    yearEdit->clear();
    monthEdit->clear();
    filter_ = FilterState{};
    drawCharts();
}
