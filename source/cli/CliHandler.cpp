#include "CliHandler.h"
#include "../core/InkSettings.h"
#include "../core/PathStore.h"
#include "../persistence/JsonFileAnnotationStore.h"
#include "../persistence/PersistenceAdapter.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QTextStream>

#include <memory>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 * 
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

QString storageDirectory(const QCommandLineParser& parser)
{
    QString dir = parser.value(QStringLiteral("storage"));
    if (dir.isEmpty()) {
        dir = InkSettings::load().storageDirectory;
    }
    return QDir::cleanPath(QDir::current().absoluteFilePath(dir));
}

static std::unique_ptr<PersistenceAdapter> openAdapter(const QCommandLineParser& parser)
{
    return std::make_unique<PersistenceAdapter>(
        std::make_unique<JsonFileAnnotationStore>(storageDirectory(parser)));
}

static void reportError(const QString& message)
{
    QTextStream err(stderr);
    err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
}

// Malformed ink still lists, as 0 paths
static int pathCount(const SurfaceRecord& record)
{
    QVector<InkPath> paths;
    if (!PathStore::deserialize(record.canvasData.toUtf8(), paths)) {
        return 0;
    }
    return paths.size();
}

static QString singleArgument(const QCommandLineParser& parser)
{
    const QStringList positional = parser.positionalArguments();
    return positional.size() == 1 ? positional.first() : QString();
}

// =============================================================================
// List Handler
// =============================================================================

int handleList(const QCommandLineParser& parser)
{
    const QString documentId = singleArgument(parser);
    if (documentId.isEmpty()) {
        reportError(QCoreApplication::translate("CLI",
            "Expected exactly one document id. Use 'verseink list --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    
    auto adapter = openAdapter(parser);
    const QVector<SurfaceRecord> records = adapter->recordsForDocument(documentId);
    
    QTextStream out(stdout);
    if (parser.isSet(QStringLiteral("json"))) {
        QJsonArray array;
        for (const SurfaceRecord& record : records) {
            QJsonObject obj;
            obj["id"] = record.id;
            obj["page"] = record.page;
            obj["panelId"] = record.panelId;
            obj["paths"] = pathCount(record);
            obj["canvasHeight"] = record.canvasHeight;
            obj["lastModified"] = record.lastModified.toString(Qt::ISODate);
            array.append(obj);
        }
        out << QJsonDocument(array).toJson(QJsonDocument::Indented);
        return ExitCode::Success;
    }
    
    if (records.isEmpty()) {
        out << QCoreApplication::translate("CLI", "No annotations for %1").arg(documentId) << "\n";
        return ExitCode::Success;
    }
    
    for (const SurfaceRecord& record : records) {
        out << record.id
            << "  paths=" << pathCount(record)
            << "  height=" << record.canvasHeight
            << "  modified=" << record.lastModified.toString(Qt::ISODate) << "\n";
    }
    return ExitCode::Success;
}

// =============================================================================
// Export Handler
// =============================================================================

int handleExport(const QCommandLineParser& parser)
{
    QString outputPath = singleArgument(parser);
    if (outputPath.isEmpty()) {
        reportError(QCoreApplication::translate("CLI",
            "Expected exactly one output file. Use 'verseink export --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    outputPath = QDir::cleanPath(QDir::current().absoluteFilePath(outputPath));
    
    if (QFileInfo::exists(outputPath) && !parser.isSet(QStringLiteral("overwrite"))) {
        reportError(QCoreApplication::translate("CLI",
            "%1 already exists. Use --overwrite to replace it.").arg(outputPath));
        return ExitCode::InvalidArgs;
    }
    
    auto adapter = openAdapter(parser);
    const QJsonObject library = adapter->exportLibrary();
    
    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
            .arg(outputPath, file.errorString()));
        return ExitCode::IoError;
    }
    file.write(QJsonDocument(library).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        reportError(QCoreApplication::translate("CLI", "Cannot write %1: %2")
            .arg(outputPath, file.errorString()));
        return ExitCode::IoError;
    }
    
    QTextStream out(stdout);
    out << QCoreApplication::translate("CLI", "Exported %1 records to %2")
        .arg(library["records"].toArray().size()).arg(outputPath) << "\n";
    return ExitCode::Success;
}

// =============================================================================
// Import Handler
// =============================================================================

int handleImport(const QCommandLineParser& parser)
{
    const QString inputPath = singleArgument(parser);
    if (inputPath.isEmpty()) {
        reportError(QCoreApplication::translate("CLI",
            "Expected exactly one library file. Use 'verseink import --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    
    QFile file(inputPath);
    if (!file.open(QIODevice::ReadOnly)) {
        reportError(QCoreApplication::translate("CLI", "Cannot read %1: %2")
            .arg(inputPath, file.errorString()));
        return ExitCode::IoError;
    }
    
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        reportError(QCoreApplication::translate("CLI", "%1 is not valid JSON: %2")
            .arg(inputPath, parseError.errorString()));
        return ExitCode::TotalFailure;
    }
    
    auto adapter = openAdapter(parser);
    QString errorMessage;
    const int imported = adapter->importLibrary(doc.object(), &errorMessage);
    if (imported < 0) {
        reportError(errorMessage);
        return ExitCode::TotalFailure;
    }
    
    const int total = doc.object()["records"].toArray().size();
    QTextStream out(stdout);
    out << QCoreApplication::translate("CLI", "Imported %1 of %2 records").arg(imported).arg(total) << "\n";
    
    if (imported == total) {
        return ExitCode::Success;
    }
    return imported == 0 ? ExitCode::TotalFailure : ExitCode::PartialFailure;
}

} // namespace Cli
