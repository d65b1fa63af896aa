#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 * 
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "0.3.0";

// =============================================================================
// CLI Detection
// =============================================================================

bool isCliMode(int argc, char* argv[])
{
    return parseCommand(argc, argv) != Command::None;
}

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }
    
    const char* arg1 = argv[1];
    
    if (std::strcmp(arg1, "list") == 0) {
        return Command::List;
    }
    if (std::strcmp(arg1, "export") == 0) {
        return Command::Export;
    }
    if (std::strcmp(arg1, "import") == 0) {
        return Command::Import;
    }
    
    // Global flags at position 1 (e.g., "verseink --help")
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }
    
    return Command::None;  // Unknown argument - launch GUI
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::List:    return QStringLiteral("list");
        case Command::Export:  return QStringLiteral("export");
        case Command::Import:  return QStringLiteral("import");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "VerseInk - Ink annotations for study texts"));
    
    parser.addHelpOption();
    parser.addVersionOption();
    
    // Every command works against a storage directory
    if (cmd == Command::List || cmd == Command::Export || cmd == Command::Import) {
        parser.addOption(QCommandLineOption(
            {QStringLiteral("s"), QStringLiteral("storage")},
            QCoreApplication::translate("CLI", "Annotation storage directory (default: from settings)"),
            QStringLiteral("dir")));
    }
    
    switch (cmd) {
        case Command::List:
            parser.addPositionalArgument(
                QStringLiteral("document"),
                QCoreApplication::translate("CLI", "Document identifier"),
                QStringLiteral("<document>"));
            parser.addOption(QCommandLineOption(
                QStringLiteral("json"),
                QCoreApplication::translate("CLI", "Output results as JSON")));
            break;
            
        case Command::Export:
            parser.addPositionalArgument(
                QStringLiteral("file"),
                QCoreApplication::translate("CLI", "Library file to write"),
                QStringLiteral("<file>"));
            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite an existing file")));
            break;
            
        case Command::Import:
            parser.addPositionalArgument(
                QStringLiteral("file"),
                QCoreApplication::translate("CLI", "Library file to read"),
                QStringLiteral("<file>"));
            break;
            
        default:
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);
    
    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: verseink [command] [options] [arguments]\n"
            "\n"
            "VerseInk - Freehand ink annotations layered over study texts.\n"
            "\n"
            "COMMANDS:\n"
            "  list <document>   List annotated surfaces of a document\n"
            "  export <file>     Export all annotations to a library file\n"
            "  import <file>     Import annotations from a library file\n"
            "  (no command)      Launch GUI application\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help        Show this help message\n"
            "  -v, --version     Show version information\n"
            "  -s, --storage     Annotation storage directory\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Success\n"
            "  1   Some records were skipped\n"
            "  2   Nothing could be imported\n"
            "  3   Invalid arguments\n"
            "  4   File could not be read or written\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "VerseInk " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)
    
    Command cmd = parseCommand(argc, argv);
    
    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }
    
    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }
    
    QCommandLineParser parser;
    setupParser(parser, cmd);
    
    // QCommandLineParser doesn't understand subcommands: drop the command name
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }
    
    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ") 
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }
    
    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }
    
    switch (cmd) {
        case Command::List:
            return handleList(parser);
        case Command::Export:
            return handleExport(parser);
        case Command::Import:
            return handleImport(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
