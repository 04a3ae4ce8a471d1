#include "MainWindow.h"
#include "RecordStore.h"

#include <QApplication>
#include <QDebug>
#include <QMessageBox>
#include <exception>

//entry point
int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("ExpenseTracker");
    app.setOrganizationName("ExpenseTracker");

    // Set application style
    app.setStyle("Fusion");

    // Backing file
    QString csvPath = ExpenseDefaults::kDefaultFile;
    if (argc > 1) {
        csvPath = QString::fromLocal8Bit(argv[1]);
    }

    RecordStore store(csvPath);
    try {
        LoadSummary summary = store.load();
        if (summary.skipped > 0) {
            QMessageBox::warning(nullptr, "Load",
                                 QString("%1 malformed rows in %2 were skipped.")
                                     .arg(QString::number(summary.skipped), csvPath));
        }
    } catch (const std::exception& e) {
        qCritical() << "Failed to load expenses:" << e.what();
        QMessageBox::critical(nullptr, "File Error",
                              "Failed to load expenses from: " + csvPath + "\n" + e.what());
        return 1;
    }

    // Create and show main window
    MainWindow window(&store);
    window.show();

    return app.exec();
}
