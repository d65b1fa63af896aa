#ifndef CLITESTS_H
#define CLITESTS_H

#include <QObject>
#include <QTest>
#include <QTemporaryDir>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <vector>

#include "CliParser.h"
#include "../persistence/JsonFileAnnotationStore.h"
#include "../persistence/PersistenceAdapter.h"

/**
 * Unit tests for the headless commands and their exit codes.
 */
class CliTests : public QObject {
    Q_OBJECT

private:
    // argv[0] is supplied here; pass the command and its arguments
    static int runCli(const QStringList& arguments) {
        QList<QByteArray> storage;
        storage.append(QByteArrayLiteral("verseink"));
        for (const QString& arg : arguments) {
            storage.append(arg.toLocal8Bit());
        }
        std::vector<char*> argv;
        for (QByteArray& arg : storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return Cli::run(*QCoreApplication::instance(), static_cast<int>(storage.size()), argv.data());
    }

    static bool writeFile(const QString& path, const QByteArray& contents) {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }
        return file.write(contents) == contents.size();
    }

    static QJsonObject record(const QString& id) {
        QJsonObject obj;
        obj["id"] = id;
        obj["canvasData"] = "[]";
        obj["canvasHeight"] = 120.0;
        obj["lastModified"] = "2026-01-01T00:00:00.000Z";
        return obj;
    }

    static QJsonObject library(const QJsonArray& records) {
        QJsonObject lib;
        lib["type"] = PersistenceAdapter::LIBRARY_TYPE;
        lib["version"] = PersistenceAdapter::LIBRARY_VERSION;
        lib["records"] = records;
        return lib;
    }

private slots:
    void testCommandDetection() {
        char arg0[] = "verseink";
        char list[] = "list";
        char other[] = "notes.pdf";
        char* withCommand[] = { arg0, list, nullptr };
        char* withFile[] = { arg0, other, nullptr };

        QVERIFY(Cli::isCliMode(2, withCommand));
        QVERIFY(Cli::parseCommand(2, withCommand) == Cli::Command::List);
        QVERIFY(!Cli::isCliMode(2, withFile));
        QVERIFY(!Cli::isCliMode(1, withCommand));
    }

    void testListWithoutDocumentIsInvalid() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QCOMPARE(runCli({"list", "--storage", dir.path()}), Cli::ExitCode::InvalidArgs);
    }

    void testListDocument() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        {
            PersistenceAdapter adapter(std::make_unique<JsonFileAnnotationStore>(dir.path()));
            adapter.save(SurfaceKey{"john", 3, ""}, "[]", 0);
            QVERIFY(adapter.flush());
        }
        QCOMPARE(runCli({"list", "john", "--json", "--storage", dir.path()}), Cli::ExitCode::Success);
        QCOMPARE(runCli({"list", "ruth", "--storage", dir.path()}), Cli::ExitCode::Success);
    }

    void testExportRefusesExistingFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString output = dir.filePath("library.json");
        QVERIFY(writeFile(output, "keep"));

        QCOMPARE(runCli({"export", output, "--storage", dir.filePath("store")}),
                 Cli::ExitCode::InvalidArgs);
        QFile untouched(output);
        QVERIFY(untouched.open(QIODevice::ReadOnly));
        QCOMPARE(untouched.readAll(), QByteArray("keep"));
        untouched.close();

        QCOMPARE(runCli({"export", output, "--overwrite", "--storage", dir.filePath("store")}),
                 Cli::ExitCode::Success);
        QFile replaced(output);
        QVERIFY(replaced.open(QIODevice::ReadOnly));
        const QJsonObject lib = QJsonDocument::fromJson(replaced.readAll()).object();
        QCOMPARE(lib["type"].toString(), PersistenceAdapter::LIBRARY_TYPE);
    }

    void testImportWithMalformedRecordIsPartial() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QJsonObject malformed;
        malformed["id"] = "john:4";
        malformed["canvasHeight"] = 10.0;

        const QString input = dir.filePath("library.json");
        QVERIFY(writeFile(input, QJsonDocument(library({record("john:3"), malformed})).toJson()));

        const QString storage = dir.filePath("store");
        QCOMPARE(runCli({"import", input, "--storage", storage}), Cli::ExitCode::PartialFailure);

        JsonFileAnnotationStore store(storage);
        QCOMPARE(store.keys(), QStringList{"john:3"});
    }

    void testImportOfForeignLibraryFails() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QJsonObject foreign = library({record("john:3")});
        foreign["type"] = "SOMETHING_ELSE";

        const QString input = dir.filePath("library.json");
        QVERIFY(writeFile(input, QJsonDocument(foreign).toJson()));

        const QString storage = dir.filePath("store");
        QCOMPARE(runCli({"import", input, "--storage", storage}), Cli::ExitCode::TotalFailure);
        JsonFileAnnotationStore store(storage);
        QVERIFY(store.keys().isEmpty());
    }

    void testImportOfMissingFileIsIoError() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QCOMPARE(runCli({"import", dir.filePath("missing.json"), "--storage", dir.path()}),
                 Cli::ExitCode::IoError);
    }
};

inline int runCliTests() {
    CliTests tests;
    return QTest::qExec(&tests);
}

#endif // CLITESTS_H
