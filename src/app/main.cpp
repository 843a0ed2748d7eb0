#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>

#include <KAboutData>
#include <KLocalizedString>

#include <cstdio>

#include "cli/commandrunner.h"
#include "cli/dokumentorconfig.h"
#include "cli/messagehandler.h"
#include "generate/sectionmanifest.h"
#include "storage/filedocumentstorage.h"

namespace {

int usageError(const QString &message)
{
    qCritical().noquote() << message;
    return CommandRunner::UsageError;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("dokumentor");

    KAboutData aboutData(
        QStringLiteral("dokumentor"),
        i18n("Dokumentor"),
        QStringLiteral("0.1.0"),
        i18n("Keeps generated sections of Markdown documentation up to date"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"),
        QString(),
        QString()
    );
    aboutData.setOrganizationDomain("dokumentor.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.setApplicationDescription(aboutData.shortDescription());
    parser.addPositionalArgument(
        QStringLiteral("command"),
        i18n("generate, migrate or tools"),
        QStringLiteral("<command>"));

    const QCommandLineOption sectionsOption(
        QStringLiteral("sections"), i18n("Section manifest (JSON) to render."), i18n("file"));
    const QCommandLineOption destinationOption(
        {QStringLiteral("d"), QStringLiteral("destination")},
        i18n("Markdown file to update. May be given more than once."), i18n("file"));
    const QCommandLineOption dryRunOption(
        QStringLiteral("dry-run"), i18n("Print the resulting document instead of writing it."));
    const QCommandLineOption linkFormatOption(
        QStringLiteral("link-format"), i18n("How bare URLs are linked: auto, full or none."),
        i18n("format"));
    const QCommandLineOption toolOption(
        QStringLiteral("tool"), i18n("Migration tool to convert from. Detected when omitted."),
        i18n("name"));
    const QCommandLineOption configOption(
        QStringLiteral("config"), i18n("Configuration file (default: %1).", DokumentorConfig::defaultPath()),
        i18n("file"));
    const QCommandLineOption verboseOption(
        {QStringLiteral("v"), QStringLiteral("verbose")}, i18n("Print debug messages."));
    const QCommandLineOption logFormatOption(
        QStringLiteral("log-format"), i18n("Message format: text or github-action."), i18n("format"));
    const QCommandLineOption concurrencyOption(
        QStringLiteral("concurrency"), i18n("Number of destinations processed at once."), i18n("n"));
    parser.addOptions({sectionsOption, destinationOption, dryRunOption, linkFormatOption,
                       toolOption, configOption, verboseOption, logFormatOption,
                       concurrencyOption});

    // parse() instead of process() so usage errors get their own exit code.
    if (!parser.parse(app.arguments())) {
        std::fprintf(stderr, "%s\n", qPrintable(parser.errorText()));
        return CommandRunner::UsageError;
    }
    if (parser.isSet(QStringLiteral("help")))
        parser.showHelp(CommandRunner::Success);
    if (parser.isSet(QStringLiteral("version")))
        parser.showVersion();
    aboutData.processCommandLine(&parser);

    const bool verbose = parser.isSet(verboseOption);
    std::optional<MessageHandler::Format> logFormat;
    if (parser.isSet(logFormatOption)) {
        logFormat = MessageHandler::formatFromName(parser.value(logFormatOption));
        if (!logFormat) {
            MessageHandler::install(MessageHandler::Format::Text, verbose);
            return usageError(i18n("Unknown log format \"%1\".", parser.value(logFormatOption)));
        }
    }
    MessageHandler::install(logFormat.value_or(MessageHandler::Format::Text), verbose);

    DokumentorConfig config;
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption)
                                                          : DokumentorConfig::defaultPath();
    if (parser.isSet(configOption) && !QFileInfo::exists(configPath))
        return usageError(i18n("Configuration file %1 does not exist.", configPath));
    config.load(configPath);
    if (!logFormat)
        MessageHandler::install(config.logFormat(), verbose);

    int concurrency = config.concurrency();
    if (parser.isSet(concurrencyOption)) {
        bool ok = false;
        concurrency = parser.value(concurrencyOption).toInt(&ok);
        if (!ok || concurrency < 1)
            return usageError(i18n("--concurrency expects a positive number."));
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1)
        return usageError(i18n("Expected exactly one command: generate, migrate or tools."));
    const QString command = positional.first();

    QFile output;
    if (!output.open(stdout, QIODevice::WriteOnly))
        return usageError(i18n("Cannot write to standard output."));

    FileDocumentStorage storage;
    CommandRunner runner(&storage, &output);
    runner.setConcurrency(concurrency);

    if (command == QLatin1String("tools"))
        return runner.listTools();

    if (command == QLatin1String("generate")) {
        if (!parser.isSet(sectionsOption))
            return usageError(i18n("generate needs --sections <file>."));
        LinkFormat linkFormat = config.linkFormat();
        if (parser.isSet(linkFormatOption)) {
            const auto format = LinkTransformer::linkFormatFromName(parser.value(linkFormatOption));
            if (!format)
                return usageError(i18n("Unknown link format \"%1\".", parser.value(linkFormatOption)));
            linkFormat = *format;
        }
        const SectionManifest::Result manifest = SectionManifest::load(parser.value(sectionsOption));
        if (!manifest.valid) {
            qCritical().noquote() << manifest.errorMessage;
            return CommandRunner::ProcessingFailure;
        }
        const QStringList destinations = parser.isSet(destinationOption)
            ? parser.values(destinationOption)
            : QStringList{config.generateDestination()};
        return runner.generate(manifest.manifest, linkFormat, destinations, parser.isSet(dryRunOption));
    }

    if (command == QLatin1String("migrate")) {
        const QString tool = parser.isSet(toolOption) ? parser.value(toolOption) : config.migrateTool();
        const QStringList destinations = parser.isSet(destinationOption)
            ? parser.values(destinationOption)
            : QStringList{config.migrateDestination()};
        return runner.migrate(tool, destinations, parser.isSet(dryRunOption));
    }

    return usageError(i18n("Unknown command \"%1\".", command));
}
