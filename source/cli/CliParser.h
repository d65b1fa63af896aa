#ifndef VERSEINK_CLIPARSER_H
#define VERSEINK_CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for VerseInk headless commands.
 * 
 * When a known command is the first argument, the application runs without
 * the GUI against the annotation storage directory.
 * 
 * Supported commands:
 * - list: List the annotated surfaces of one document
 * - export: Write every stored annotation record to a library file
 * - import: Upsert the records of a library file
 */

#include <QString>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command - launch GUI
    Help,           ///< Show help message
    Version,        ///< Show version information
    List,           ///< List annotated surfaces of a document
    Export,         ///< Export the annotation library
    Import          ///< Import an annotation library
};

// =============================================================================
// Exit Codes
// =============================================================================

namespace ExitCode {
    constexpr int Success = 0;        ///< Operation succeeded
    constexpr int PartialFailure = 1; ///< Some records were skipped
    constexpr int TotalFailure = 2;   ///< Nothing could be processed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
}

// =============================================================================
// CLI Detection
// =============================================================================

/**
 * @brief Quick check if the application should run in CLI mode.
 * 
 * Should be called before creating any Qt application object.
 * 
 * @return true if a CLI command was detected, false for GUI mode
 */
bool isCliMode(int argc, char* argv[]);

/**
 * @brief Parse the command keyword from argv[1].
 * @return The detected command, or Command::None for GUI mode
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Command name as typed on the command line (e.g., "list").
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

void showHelp(const QCommandLineParser& parser, Command cmd);
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // VERSEINK_CLIPARSER_H
