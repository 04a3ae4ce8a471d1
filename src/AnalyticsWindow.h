#pragma once

#include "AppState.h"
#include "SpendingAnalyzer.h"

#include <QDialog>
#include <QtCharts/QChartView>

class QLabel;
class QLineEdit;
class QTabWidget;
class RecordStore;

QT_CHARTS_USE_NAMESPACE

// Trend / Monthly / Category tabs over the store, with its own year/month filter.
class AnalyticsWindow : public QDialog {
    Q_OBJECT

private:
    RecordStore* store_;
    FilterState filter_;

    QLineEdit* yearEdit;
    QLineEdit* monthEdit;
    QTabWidget* tabs;
    QChartView* trendView;
    QChartView* monthlyView;
    QChartView* categoryView;
    QLabel* summaryLabel;

public:
    explicit AnalyticsWindow(RecordStore* store, QWidget* parent = nullptr);

public slots:
    void drawCharts();

private:
    void setupUI();
    static void replaceChart(QChartView* view, QChart* chart);

private slots:
    void onApplyFilter();
    void onClearFilter();
};
