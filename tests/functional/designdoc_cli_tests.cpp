#include <QDir>
#include <QFile>
#include <QProcess>
#include <QProcessEnvironment>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include <memory>

namespace
{
QString designdocBinary()
{
#ifdef DESIGNDOC_BINARY
    return QString::fromUtf8(DESIGNDOC_BINARY);
#else
    return QString();
#endif
}

const char analysisText[] =
    "# Code Change Analysis\n"
    "## Solution\n"
    "Add a **token** check.\n"
    "### How It Works\n"
    "- validate input\n";

struct RunResult {
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
};

} // namespace

class DesignDocCliTests : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void writesToConfiguredOutputDirectory();
    void printTocListsEntriesWithoutWriting();
    void unreadableInputExitsWithError();

private:
    void writeConfig(const QString &contents);
    QString writeAnalysis();
    RunResult run(const QStringList &arguments);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void DesignDocCliTests::init()
{
    QVERIFY2(!designdocBinary().isEmpty(), "DESIGNDOC_BINARY is not defined");
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    QVERIFY(QDir(m_dir->path()).mkpath(QStringLiteral("config")));
}

void DesignDocCliTests::writeConfig(const QString &contents)
{
    QFile rc(m_dir->filePath(QStringLiteral("config/designdocrc")));
    QVERIFY(rc.open(QIODevice::WriteOnly | QIODevice::Text));
    rc.write(contents.toUtf8());
}

QString DesignDocCliTests::writeAnalysis()
{
    const QString path = m_dir->filePath(QStringLiteral("analysis.md"));
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
        file.write(analysisText);
    return path;
}

RunResult DesignDocCliTests::run(const QStringList &arguments)
{
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("XDG_CONFIG_HOME"), m_dir->filePath(QStringLiteral("config")));

    QProcess process;
    process.setProcessEnvironment(env);
    process.setWorkingDirectory(m_dir->path());
    process.setProgram(designdocBinary());
    process.setArguments(arguments);
    process.start();

    RunResult result;
    if (!process.waitForStarted() || !process.waitForFinished(30000))
        return result;
    result.exitCode = process.exitCode();
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    return result;
}

void DesignDocCliTests::writesToConfiguredOutputDirectory()
{
    const QString outDir = m_dir->filePath(QStringLiteral("out"));
    QVERIFY(QDir().mkpath(outDir));
    writeConfig(QStringLiteral("[Style]\nHeadingFontSize1=20\n\n[Export]\nOutputDirectory=%1\n")
                    .arg(outDir));

    const RunResult result = run({QStringLiteral("--name"), QStringLiteral("Login Flow"),
                                  writeAnalysis()});
    QCOMPARE(result.exitCode, 0);

    const QString expected = QDir(outDir).filePath(QStringLiteral("Login_Flow.rtf"));
    QVERIFY2(result.stdoutText.contains(QStringLiteral("Login_Flow.rtf")),
             qPrintable(result.stdoutText));

    QFile rtf(expected);
    QVERIFY2(rtf.open(QIODevice::ReadOnly), qPrintable(expected));
    const QByteArray content = rtf.readAll();
    QVERIFY(content.startsWith("{\\rtf1"));
    QVERIFY(content.contains("Login Flow}"));
    QVERIFY(content.contains("\\fs40\\b0\\cf2 Code Change Analysis}"));
}

void DesignDocCliTests::printTocListsEntriesWithoutWriting()
{
    writeConfig(QString());

    const RunResult result = run({QStringLiteral("--print-toc"), writeAnalysis()});
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.stdoutText, QStringLiteral("Solution\n  How It Works\n"));

    const QStringList written = QDir(m_dir->path()).entryList({QStringLiteral("*.rtf")}, QDir::Files);
    QVERIFY2(written.isEmpty(), qPrintable(written.join(QLatin1Char(' '))));
}

void DesignDocCliTests::unreadableInputExitsWithError()
{
    writeConfig(QString());

    const RunResult result = run({m_dir->filePath(QStringLiteral("no-such-analysis.md"))});
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.stderrText.contains(QStringLiteral("no-such-analysis.md")));
    QVERIFY(QDir(m_dir->path()).entryList({QStringLiteral("*.rtf")}, QDir::Files).isEmpty());
}

QTEST_GUILESS_MAIN(DesignDocCliTests)
#include "designdoc_cli_tests.moc"
