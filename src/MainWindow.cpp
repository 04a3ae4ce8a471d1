#include "MainWindow.h"

#include "AnalyticsWindow.h"
#include "RecordStore.h"

#include <QAction>
#include <QComboBox>
#include <QDate>
#include <QDateTime>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QSplitter>
#include <QStatusBar>
#include <QTableWidget>
#include <QVBoxLayout>
#include <exception>

MainWindow::MainWindow(RecordStore* store, QWidget* parent)
    : QMainWindow(parent), store_(store) {

    setWindowTitle("Expense Tracker - Tabbed Analytics");
    resize(1100, 650);

    setupMenuBar();
    setupUI();
    setupConnections();
    showForm(ExpenseForm::blank(QDate::currentDate()));
    refreshData();

    statusBar()->showMessage("Ready");
}

void MainWindow::setupMenuBar() {
    QMenu* fileMenu = menuBar()->addMenu("&File");

    QAction* importAction = new QAction("&Import CSV...", this);
    importAction->setShortcut(QKeySequence::Open);
    connect(importAction, &QAction::triggered, this, &MainWindow::onImportCsv);
    fileMenu->addAction(importAction);

    QAction* exportAction = new QAction("&Export CSV...", this);
    exportAction->setShortcut(QKeySequence::SaveAs);
    connect(exportAction, &QAction::triggered, this, &MainWindow::onExportCsv);
    fileMenu->addAction(exportAction);

    fileMenu->addSeparator();

    QAction* exitAction = new QAction("E&xit", this);
    exitAction->setShortcut(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QMainWindow::close);
    fileMenu->addAction(exitAction);

    QMenu* viewMenu = menuBar()->addMenu("&View");

    QAction* analyticsAction = new QAction("&Analytics", this);
    connect(analyticsAction, &QAction::triggered, this, &MainWindow::onOpenAnalytics);
    viewMenu->addAction(analyticsAction);

    QAction* refreshAction = new QAction("&Refresh", this);
    refreshAction->setShortcut(QKeySequence::Refresh);
    connect(refreshAction, &QAction::triggered, this, &MainWindow::refreshData);
    viewMenu->addAction(refreshAction);
}

void MainWindow::setupUI() {
    QWidget* centralWidget = new QWidget(this);
    QVBoxLayout* mainLayout = new QVBoxLayout(centralWidget);

    // Header: title and file actions
    QHBoxLayout* headerLayout = new QHBoxLayout();
    QLabel* titleLabel = new QLabel("Expense Tracker", this);
    QFont font = titleLabel->font();
    font.setPointSize(18);
    font.setBold(true);
    titleLabel->setFont(font);
    headerLayout->addWidget(titleLabel);
    headerLayout->addStretch();

    QPushButton* importBtn = new QPushButton("Import CSV", this);
    QPushButton* exportBtn = new QPushButton("Export CSV", this);
    QPushButton* analyticsBtn = new QPushButton("Analytics", this);
    connect(importBtn, &QPushButton::clicked, this, &MainWindow::onImportCsv);
    connect(exportBtn, &QPushButton::clicked, this, &MainWindow::onExportCsv);
    connect(analyticsBtn, &QPushButton::clicked, this, &MainWindow::onOpenAnalytics);
    headerLayout->addWidget(importBtn);
    headerLayout->addWidget(exportBtn);
    headerLayout->addWidget(analyticsBtn);
    mainLayout->addLayout(headerLayout);

    // Filter bar (year/month)
    QHBoxLayout* filterLayout = new QHBoxLayout();
    yearEdit = new QLineEdit(this);
    yearEdit->setMaximumWidth(70);
    monthEdit = new QLineEdit(this);
    monthEdit->setMaximumWidth(50);
    QPushButton* applyBtn = new QPushButton("Apply Filter", this);
    QPushButton* clearFilterBtn = new QPushButton("Clear", this);
    connect(applyBtn, &QPushButton::clicked, this, &MainWindow::onApplyFilter);
    connect(clearFilterBtn, &QPushButton::clicked, this, &MainWindow::onClearFilter);

    filterLayout->addWidget(new QLabel("Year:", this));
    filterLayout->addWidget(yearEdit);
    filterLayout->addWidget(new QLabel("Month:", this));
    filterLayout->addWidget(monthEdit);
    filterLayout->addWidget(applyBtn);
    filterLayout->addWidget(clearFilterBtn);
    filterLayout->addStretch();
    mainLayout->addLayout(filterLayout);

    QSplitter* splitter = new QSplitter(Qt::Horizontal, this);

    // Left side: add/edit form
    QGroupBox* formGroup = new QGroupBox("Add / Edit Expense", this);
    QFormLayout* formLayout = new QFormLayout(formGroup);

    dateEdit = new QLineEdit(this);
    dateEdit->setPlaceholderText("YYYY-MM-DD");

    categoryCombo = new QComboBox(this);
    categoryCombo->setEditable(true);
    for (const std::string& category : ExpenseDefaults::suggestedCategories()) {
        categoryCombo->addItem(QString::fromStdString(category));
    }

    amountEdit = new QLineEdit(this);
    noteEdit = new QLineEdit(this);

    formLayout->addRow("Date (YYYY-MM-DD):", dateEdit);
    formLayout->addRow("Category:", categoryCombo);
    formLayout->addRow("Amount:", amountEdit);
    formLayout->addRow("Note:", noteEdit);

    QHBoxLayout* formButtonLayout = new QHBoxLayout();
    QPushButton* addBtn = new QPushButton("Add Expense", this);
    QPushButton* updateBtn = new QPushButton("Update Selected", this);
    connect(addBtn, &QPushButton::clicked, this, &MainWindow::onAddExpense);
    connect(updateBtn, &QPushButton::clicked, this, &MainWindow::onUpdateSelected);
    formButtonLayout->addWidget(addBtn);
    formButtonLayout->addWidget(updateBtn);
    formLayout->addRow(formButtonLayout);

    splitter->addWidget(formGroup);

    // Right side: transactions
    QGroupBox* tableGroup = new QGroupBox("Transactions", this);
    QVBoxLayout* tableLayout = new QVBoxLayout(tableGroup);

    transactionsTable = new QTableWidget(this);
    transactionsTable->setColumnCount(4);
    transactionsTable->setHorizontalHeaderLabels({"Date", "Category", "Amount", "Note"});
    transactionsTable->horizontalHeader()->setStretchLastSection(true);
    transactionsTable->setSelectionBehavior(QAbstractItemView::SelectRows);
    transactionsTable->setSelectionMode(QAbstractItemView::SingleSelection);
    transactionsTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    transactionsTable->setAlternatingRowColors(true);
    transactionsTable->verticalHeader()->hide();
    tableLayout->addWidget(transactionsTable);

    QHBoxLayout* tableButtonLayout = new QHBoxLayout();
    QPushButton* deleteBtn = new QPushButton("Delete Selected", this);
    QPushButton* clearAllBtn = new QPushButton("Clear All", this);
    connect(deleteBtn, &QPushButton::clicked, this, &MainWindow::onDeleteSelected);
    connect(clearAllBtn, &QPushButton::clicked, this, &MainWindow::onClearAll);
    tableButtonLayout->addWidget(deleteBtn);
    tableButtonLayout->addWidget(clearAllBtn);
    tableButtonLayout->addStretch();
    tableLayout->addLayout(tableButtonLayout);

    splitter->addWidget(tableGroup);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 3);
    mainLayout->addWidget(splitter);

    statusLabel = new QLabel("", this);
    statusLabel->setStyleSheet("QLabel { color: gray; font-style: italic; }");
    mainLayout->addWidget(statusLabel);

    setCentralWidget(centralWidget);
}

void MainWindow::setupConnections() {
    connect(store_, &RecordStore::dataChanged, this, &MainWindow::refreshData);
    connect(transactionsTable, &QTableWidget::itemSelectionChanged, this, &MainWindow::onSelectionChanged);
}

ExpenseForm MainWindow::readForm() const {
    ExpenseForm form;
    form.date = dateEdit->text();
    form.category = categoryCombo->currentText();
    form.amount = amountEdit->text();
    form.note = noteEdit->text();
    return form;
}

void MainWindow::showForm(const ExpenseForm& form) {
    dateEdit->setText(form.date);
    categoryCombo->setCurrentText(form.category);
    amountEdit->setText(form.amount);
    noteEdit->setText(form.note);
}

std::optional<RecordId> MainWindow::selectedRecordId() const {
    QList<QTableWidgetItem*> selected = transactionsTable->selectedItems();
    if (selected.isEmpty()) {
        return std::nullopt;
    }
    QTableWidgetItem* dateItem = transactionsTable->item(selected.first()->row(), 0);
    if (!dateItem) {
        return std::nullopt;
    }
    return static_cast<RecordId>(dateItem->data(Qt::UserRole).toULongLong());
}

void MainWindow::refreshData() {
    auto rows = store_->fetchByMonth(filter_.year, filter_.month);

    transactionsTable->clearSelection();
    transactionsTable->setRowCount(static_cast<int>(rows.size()));
    Money filteredTotal = 0;

    for (int i = 0; i < static_cast<int>(rows.size()); ++i) {
        const StoredRecord& row = rows[static_cast<std::size_t>(i)];
        const ExpenseRecord& record = row.record;

        QTableWidgetItem* dateItem = new QTableWidgetItem(record.getDateString());
        dateItem->setData(Qt::UserRole, QVariant::fromValue<qulonglong>(row.id));
        transactionsTable->setItem(i, 0, dateItem);

        transactionsTable->setItem(i, 1, new QTableWidgetItem(QString::fromStdString(record.getCategory())));

        QTableWidgetItem* amountItem = new QTableWidgetItem(MoneyUtils::format(record.getAmount()));
        amountItem->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
        if (record.getAmount() < 0) {
            amountItem->setForeground(QBrush(QColor("#2E7D32")));
        }
        transactionsTable->setItem(i, 2, amountItem);

        transactionsTable->setItem(i, 3, new QTableWidgetItem(QString::fromStdString(record.getNote())));

        filteredTotal += record.getAmount();
    }

    transactionsTable->resizeColumnsToContents();
    transactionsTable->horizontalHeader()->setStretchLastSection(true);

    statusLabel->setText(QString("Showing %1 of %2 records (%3) | Total %4 | Last updated: %5")
                             .arg(QString::number(rows.size()),
                                  QString::number(store_->size()),
                                  filter_.describe(),
                                  MoneyUtils::format(filteredTotal),
                                  QDateTime::currentDateTime().toString("hh:mm:ss")));
}

void MainWindow::onAddExpense() {
    RowValidation result = readForm().validate();
    if (!result.accepted()) {
        QMessageBox::warning(this, "Invalid", describe(result.status));
        return;
    }

    try {
        store_->add(result.record);
        showForm(ExpenseForm::blank(QDate::currentDate()));
        statusBar()->showMessage("Expense added", 3000);
    } catch (const std::exception& e) {
        QMessageBox::critical(this, "Error", QString("Failed to add expense: ") + e.what());
    }
}

void MainWindow::onUpdateSelected() {
    auto id = selectedRecordId();
    if (!id) {
        QMessageBox::information(this, "No selection", "Select a transaction");
        return;
    }

    RowValidation result = readForm().validate();
    if (!result.accepted()) {
        QMessageBox::warning(this, "Invalid", describe(result.status));
        return;
    }

    try {
        store_->updateById(*id, result.record);
        showForm(ExpenseForm::blank(QDate::currentDate()));
        statusBar()->showMessage("Expense updated", 3000);
    } catch (const std::exception& e) {
        QMessageBox::critical(this, "Error", QString("Failed to update expense: ") + e.what());
    }
}

void MainWindow::onDeleteSelected() {
    auto id = selectedRecordId();
    if (!id) {
        QMessageBox::information(this, "No selection", "Select a transaction");
        return;
    }

    if (QMessageBox::question(this, "Confirm", "Delete selected transaction?",
                              QMessageBox::Yes | QMessageBox::No) != QMessageBox::Yes) {
        return;
    }

    try {
        store_->removeById(*id);
        statusBar()->showMessage("Expense deleted", 3000);
    } catch (const std::exception& e) {
        QMessageBox::critical(this, "Error", QString("Failed to delete expense: ") + e.what());
    }
}

void MainWindow::onClearAll() {
    if (QMessageBox::question(this, "Confirm", "Delete all transactions?",
                              QMessageBox::Yes | QMessageBox::No) != QMessageBox::Yes) {
        return;
    }

    try {
        store_->clear();
        statusBar()->showMessage("All expenses deleted", 3000);
    } catch (const std::exception& e) {
        QMessageBox::critical(this, "Error", QString("Failed to clear expenses: ") + e.what());
    }
}

void MainWindow::onSelectionChanged() {
    auto id = selectedRecordId();
    if (!id) return;

    const StoredRecord* row = store_->find(*id);
    if (row) {
        showForm(ExpenseForm::fromRecord(row->record));
    }
}

void MainWindow::onApplyFilter() {
    filter_ = FilterState::parse(yearEdit->text(), monthEdit->text());
    refreshData();
}

void MainWindow::onClearFilter() {
    yearEdit->clear();
    monthEdit->clear();
    filter_ = FilterState{};
    refreshData();
}

void MainWindow::onImportCsv() {
    QString path = QFileDialog::getOpenFileName(this, "Import CSV", QString(),
                                                "CSV files (*.csv);;All files (*)");
    if (path.isEmpty()) return;

    try {
        ImportSummary summary = store_->importFrom(path);
        QString message = QString("Imported %1 records").arg(summary.accepted);
        if (summary.skipped > 0) {
            message += QString(" (%1 rows skipped)").arg(summary.skipped);
        }
        statusBar()->showMessage(message, 5000);
        QMessageBox::information(this, "Import", message);
    } catch (const std::exception& e) {
        QMessageBox::critical(this, "Error", QString("Failed to import: ") + e.what());
    }
}

void MainWindow::onExportCsv() {
    QString path = QFileDialog::getSaveFileName(this, "Export CSV", "expenses_export.csv",
                                                "CSV files (*.csv)");
    if (path.isEmpty()) return;
    if (QFileInfo(path).suffix().isEmpty()) {
        path += ".csv";
    }

    try {
        std::size_t count = store_->exportTo(path);
        QMessageBox::information(this, "Export", QString("Exported %1 records").arg(count));
    } catch (const std::exception& e) {
        QMessageBox::critical(this, "Error", QString("Failed to export: ") + e.what());
    }
}

void MainWindow::onOpenAnalytics() {
    if (!analytics_) {
        analytics_ = new AnalyticsWindow(store_, this);
    }
    analytics_->show();
    analytics_->raise();
    analytics_->activateWindow();
}
