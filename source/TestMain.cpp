// ============================================================================
// VerseInk test runner
// ============================================================================
// Usage: verseink_tests [suite]
// Without an argument every suite runs. Suites: inkpath, pathstore,
// normalizer, session, renderer, scheduler, persistence, controller,
// settings, overlay, cli, window.
// ============================================================================

#include <QApplication>
#include <QDebug>

#include "strokes/InkPathTests.h"
#include "core/PathStoreTests.h"
#include "input/PointNormalizerTests.h"
#include "core/StrokeSessionTests.h"
#include "render/StrokeRendererTests.h"
#include "render/RenderSchedulerTests.h"
#include "persistence/PersistenceAdapterTests.h"
#include "core/SurfaceControllerTests.h"
#include "core/InkSettingsTests.h"
#include "viewport/AnnotationOverlayTests.h"
#include "cli/CliTests.h"
#include "MainWindowTests.h"

using SuiteRunner = int (*)();

struct Suite {
    const char* name;
    SuiteRunner run;
};

static const Suite SUITES[] = {
    { "inkpath",     runInkPathTests },
    { "pathstore",   runPathStoreTests },
    { "normalizer",  runPointNormalizerTests },
    { "session",     runStrokeSessionTests },
    { "renderer",    runStrokeRendererTests },
    { "scheduler",   runRenderSchedulerTests },
    { "persistence", runPersistenceAdapterTests },
    { "controller",  runSurfaceControllerTests },
    { "settings",    runInkSettingsTests },
    { "overlay",     runAnnotationOverlayTests },
    { "cli",         runCliTests },
    { "window",      runMainWindowTests },
};

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("VerseInkTests");
    app.setApplicationName("Tests");

    const QString only = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QString();

    int failures = 0;
    bool matched = false;
    for (const Suite& suite : SUITES) {
        if (!only.isEmpty() && only != QLatin1String(suite.name)) {
            continue;
        }
        matched = true;
        if (suite.run() != 0) {
            qWarning() << "Suite failed:" << suite.name;
            ++failures;
        }
    }

    if (!matched) {
        qWarning() << "Unknown test suite:" << only;
        return 2;
    }
    return failures == 0 ? 0 : 1;
}
