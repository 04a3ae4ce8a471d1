#pragma once

#include "AppState.h"
#include "ExpenseRecord.h"

#include <QMainWindow>
#include <QPointer>
#include <optional>

class AnalyticsWindow;
class QComboBox;
class QLabel;
class QLineEdit;
class QTableWidget;
class RecordStore;

class MainWindow : public QMainWindow {
    Q_OBJECT

private:
    RecordStore* store_;
    FilterState filter_;
    QPointer<AnalyticsWindow> analytics_;

    // Widgets
    QLineEdit* yearEdit;
    QLineEdit* monthEdit;
    QLineEdit* dateEdit;
    QComboBox* categoryCombo;
    QLineEdit* amountEdit;
    QLineEdit* noteEdit;
    QTableWidget* transactionsTable;
    QLabel* statusLabel;

public:
    explicit MainWindow(RecordStore* store, QWidget* parent = nullptr);

private:
    void setupMenuBar();
    void setupUI();
    void setupConnections();

    ExpenseForm readForm() const;
    void showForm(const ExpenseForm& form);
    std::optional<RecordId> selectedRecordId() const;

private slots:
    void refreshData();
    void onAddExpense();
    void onUpdateSelected();
    void onDeleteSelected();
    void onClearAll();
    void onSelectionChanged();
    void onApplyFilter();
    void onClearFilter();
    void onImportCsv();
    void onExportCsv();
    void onOpenAnalytics();
};
