#include "MainWindow.h"
#include "cli/CliParser.h"
#include "core/InkSettings.h"

#include <QApplication>
#include <QCoreApplication>
#include <QDebug>

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    // ========== Headless Commands ==========
    if (Cli::isCliMode(argc, argv)) {
        QCoreApplication app(argc, argv);
        app.setOrganizationName("VerseInk");
        app.setApplicationName("App");
        return Cli::run(app, argc, argv);
    }

    // ========== Launch Application ==========
    QApplication app(argc, argv);
    app.setOrganizationName("VerseInk");
    app.setApplicationName("App");

    InkSettings settings = InkSettings::load();
#if VERSEINK_DEBUG
    qDebug() << "VerseInk: annotations stored in" << settings.storageDirectory;
#endif
    // Write back so clamped or defaulted values become visible in the file
    settings.save();

    auto* w = new MainWindow(settings);
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();
    return app.exec();
}
