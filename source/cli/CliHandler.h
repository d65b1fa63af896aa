#ifndef VERSEINK_CLIHANDLER_H
#define VERSEINK_CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for headless annotation commands.
 * 
 * Each handler resolves the storage directory, opens a
 * JsonFileAnnotationStore through a PersistenceAdapter, runs the command
 * and reports results on stdout/stderr.
 */

#include "CliParser.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the list command.
 * 
 * Prints one line per annotated surface of the document: key, number of
 * paths, expanded height and last modification time. With --json, prints
 * a JSON array instead.
 * 
 * @return Exit code (see ExitCode namespace)
 */
int handleList(const QCommandLineParser& parser);

/**
 * @brief Handle the export command.
 * @return Success, InvalidArgs, or IoError if the file can't be written
 */
int handleExport(const QCommandLineParser& parser);

/**
 * @brief Handle the import command.
 * @return Success, PartialFailure if some records were skipped,
 *         TotalFailure if the library was rejected, or IoError
 */
int handleImport(const QCommandLineParser& parser);

/**
 * @brief Storage directory from --storage, else from InkSettings.
 */
QString storageDirectory(const QCommandLineParser& parser);

} // namespace Cli

#endif // VERSEINK_CLIHANDLER_H
