#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include <cstdio>

#include "contentrtfexporter.h"
#include "designdocsettings.h"
#include "documentcomposer.h"
#include "documentstyle.h"

static DocumentStyle styleFromSettings()
{
    auto *settings = DesignDocSettings::self();
    DocumentStyle style;
    style.setBodyFontFamily(settings->bodyFontFamily());
    style.setBodyFontSize(settings->bodyFontSize());
    style.setHeadingFontFamily(settings->headingFontFamily());
    style.setHeadingColor(settings->headingColor());
    style.setHeadingFontSize(1, settings->headingFontSize1());
    style.setHeadingFontSize(2, settings->headingFontSize2());
    style.setHeadingFontSize(3, settings->headingFontSize3());
    return style;
}

static RtfExportOptions exportOptionsFromSettings()
{
    auto *settings = DesignDocSettings::self();
    RtfExportOptions opts;
    opts.includeTableOfContents = settings->includeTableOfContents();
    opts.tableOfContentsTitle = settings->tableOfContentsTitle();
    opts.tocMaxLevel = settings->tableOfContentsMaxLevel();
    return opts;
}

// Reads the analysis text from a file, or from stdin for "-" or no file.
static bool readAnalysisText(const QString &path, QString *text, QString *errorMessage)
{
    QFile file;
    bool opened = false;
    if (path.isEmpty() || path == QLatin1String("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        *errorMessage = file.errorString();
        return false;
    }
    *text = QString::fromUtf8(file.readAll());
    return true;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("designdoc");

    KAboutData aboutData(
        QStringLiteral("designdoc"),
        i18n("DesignDoc"),
        QStringLiteral("0.1.0"),
        i18n("Turns code change analyses into styled design documents"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("designdoc.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("analysis"),
        i18n("Analysis text to convert (default: standard input)"),
        QStringLiteral("[analysis]"));

    const QCommandLineOption nameOption(
        {QStringLiteral("n"), QStringLiteral("name")},
        i18n("User story name"), i18n("name"));
    const QCommandLineOption descriptionOption(
        {QStringLiteral("d"), QStringLiteral("description")},
        i18n("User story description"), i18n("text"));
    const QCommandLineOption contextOption(
        {QStringLiteral("c"), QStringLiteral("context")},
        i18n("Additional context and instructions given to the analysis"), i18n("text"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        i18n("Output file (default: derived from the story name)"), i18n("file"));
    const QCommandLineOption noTocOption(
        QStringLiteral("no-toc"),
        i18n("Do not write a table of contents"));
    const QCommandLineOption printTocOption(
        QStringLiteral("print-toc"),
        i18n("Print the table of contents entries and exit"));
    parser.addOptions({nameOption, descriptionOption, contextOption,
                       outputOption, noTocOption, printTocOption});

    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.size() > 1) {
        qCritical().noquote() << i18n("Only one analysis file can be converted at a time.");
        return 1;
    }

    QString analysisText;
    QString error;
    const QString inputPath = args.value(0);
    if (!readAnalysisText(inputPath, &analysisText, &error)) {
        qCritical().noquote() << i18n("Cannot read %1: %2",
                                      inputPath.isEmpty() ? QStringLiteral("-") : inputPath,
                                      error);
        return 1;
    }

    StoryDetails story;
    story.name = parser.value(nameOption);
    story.description = parser.value(descriptionOption);
    story.additionalContext = parser.value(contextOption);

    const Content::Document doc = DocumentComposer::compose(story, analysisText);

    if (parser.isSet(printTocOption)) {
        QTextStream out(stdout);
        for (const Content::TocEntry &entry : doc.toc)
            out << QString(2 * (entry.level - 2), QLatin1Char(' ')) << entry.text << '\n';
        return 0;
    }

    auto *settings = DesignDocSettings::self();
    QString outputPath = parser.value(outputOption);
    if (outputPath.isEmpty()) {
        const QString fileName = DocumentComposer::suggestedFileName(
            story.name, QStringLiteral("rtf"), settings->fallbackFileName());
        const QString dir = settings->outputDirectory();
        outputPath = dir.isEmpty() ? fileName : QDir(dir).filePath(fileName);
    }

    RtfExportOptions options = exportOptionsFromSettings();
    if (parser.isSet(noTocOption))
        options.includeTableOfContents = false;

    ContentRtfExporter exporter(styleFromSettings());
    if (!exporter.exportToFile(doc, outputPath, options, &error)) {
        qCritical().noquote() << i18n("Cannot write %1: %2", outputPath, error);
        return 1;
    }

    QTextStream(stdout) << outputPath << '\n';
    return 0;
}
