// ============================================================================
// ExamInk - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QTest>
#include <QDebug>

#include "core/CanvasSettings.h"
#include "core/DrawingEngine.h"
#include "sync/SnapshotFile.h"
#include "viewport/CanvasWidget.h"

// Test suites
#include "core/CommandHistoryTests.h"
#include "core/GestureStateMachineTests.h"
#include "core/DrawingEngineTests.h"
#include "strokes/StrokeBuilderTests.h"
#include "input/InputDispatcherTests.h"
#include "sync/SnapshotSyncTests.h"
#include "sync/SerializationTests.h"

// ============================================================================
// Test Runners
// ============================================================================

static const QStringList kTestSuites = {
    "history", "transform", "builder", "dispatcher", "sync", "engine", "serialization"
};

static int runTests(const QString& testType)
{
    // QTest treats argv as its own options; pass only the program name
    QStringList testArgs = {QCoreApplication::applicationFilePath()};

    if (testType == "history") {
        CommandHistoryTests tests;
        return QTest::qExec(&tests, testArgs);
    } else if (testType == "transform") {
        GestureStateMachineTests tests;
        return QTest::qExec(&tests, testArgs);
    } else if (testType == "builder") {
        StrokeBuilderTests tests;
        return QTest::qExec(&tests, testArgs);
    } else if (testType == "dispatcher") {
        InputDispatcherTests tests;
        return QTest::qExec(&tests, testArgs);
    } else if (testType == "sync") {
        SnapshotSyncTests tests;
        return QTest::qExec(&tests, testArgs);
    } else if (testType == "engine") {
        DrawingEngineTests tests;
        return QTest::qExec(&tests, testArgs);
    } else if (testType == "serialization") {
        SerializationTests tests;
        return QTest::qExec(&tests, testArgs);
    }

    qWarning() << "Unknown test suite:" << testType;
    return 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("ExamInk");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Touch drawing canvas for exam answers"));
    parser.addHelpOption();

    QCommandLineOption inputOption(QStringList() << "i" << "input",
        QCoreApplication::translate("main", "Load initial content from a snapshot JSON <file>."),
        QCoreApplication::translate("main", "file"));
    QCommandLineOption outputOption(QStringList() << "o" << "output",
        QCoreApplication::translate("main", "Save the exit snapshot to a JSON <file>."),
        QCoreApplication::translate("main", "file"));
    parser.addOption(inputOption);
    parser.addOption(outputOption);

    for (const QString& suite : kTestSuites) {
        parser.addOption(QCommandLineOption("test-" + suite,
            QCoreApplication::translate("main", "Run the %1 test suite and exit.").arg(suite)));
    }

    parser.process(app);

    // Handle test commands
    for (const QString& suite : kTestSuites) {
        if (parser.isSet("test-" + suite)) {
            return runTests(suite);
        }
    }

    // ========== Configure Engine ==========
    CanvasSettings settings;
    settings.load();
    EngineConfig config = settings.toEngineConfig();

    QSizeF loadedCanvasSize;
    if (parser.isSet(inputOption)) {
        CanvasSnapshot loaded;
        if (SnapshotFile::load(parser.value(inputOption), loaded)) {
            config.initialLines = loaded.lines;
            config.initialTextAnnotations = loaded.textAnnotations;
            loadedCanvasSize = QSizeF(loaded.canvasWidth, loaded.canvasHeight);
        } else {
            qWarning() << "Starting with an empty canvas";
        }
    }

    const QString outputPath = parser.value(outputOption);
    config.onExit = [&settings, outputPath](const CanvasSnapshot& snapshot) {
        settings.saveFromSnapshot(snapshot);
        if (!outputPath.isEmpty() && !SnapshotFile::save(snapshot, outputPath)) {
            qWarning() << "Exit snapshot was not saved";
        }
    };

    DrawingEngine engine(config);
    if (!loadedCanvasSize.isEmpty()) {
        engine.setLogicalSize(loadedCanvasSize);
    }

    // ========== Launch Application ==========
    CanvasWidget widget(&engine);
    widget.setWindowTitle("ExamInk");
    widget.show();

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &engine, [&engine]() {
        engine.exit();
    });

    return app.exec();
}
