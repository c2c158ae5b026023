#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include "documenteditor.h"
#include "documentio.h"
#include "fontconfig.h"
#include "pdfexporter.h"
#include "postscriptwriter.h"
#include "preferencesstore.h"
#include "printformatter.h"

// Custom message handler to add timestamps
void customMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString formattedMsg = QString("[%1] %2").arg(timestamp, msg);

    QByteArray localMsg = formattedMsg.toLocal8Bit();
    switch (type) {
    case QtDebugMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtInfoMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtWarningMsg:
        fprintf(stderr, "Warning: %s\n", localMsg.constData());
        break;
    case QtCriticalMsg:
        fprintf(stderr, "Critical: %s\n", localMsg.constData());
        break;
    case QtFatalMsg:
        fprintf(stderr, "Fatal: %s\n", localMsg.constData());
        abort();
    }
}

namespace {

bool writeText(const QString &text, const QString &filePath)
{
    QFile out;
    bool opened = false;
    if (filePath.isEmpty()) {
        opened = out.open(stdout, QIODevice::WriteOnly);
    } else {
        out.setFileName(filePath);
        opened = out.open(QIODevice::WriteOnly);
    }
    if (!opened) {
        qWarning() << "[Main] Cannot open" << (filePath.isEmpty() ? QStringLiteral("stdout") : filePath);
        return false;
    }
    const QByteArray data = text.toUtf8() + '\n';
    return out.write(data) == data.size();
}

QString outputFormat(const QString &requested, const QString &outputPath)
{
    if (!requested.isEmpty()) {
        return requested.toLower();
    }
    const QString suffix = QFileInfo(outputPath).suffix().toLower();
    if (suffix == QStringLiteral("pdf")) {
        return QStringLiteral("pdf");
    }
    if (suffix == QStringLiteral("ps")) {
        return QStringLiteral("ps");
    }
    return QStringLiteral("text");
}

} // namespace

int main(int argc, char *argv[])
{
    qInstallMessageHandler(customMessageHandler);
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName(QStringLiteral("platen"));
    QGuiApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Formats an overstrike-encoded document into printable pages."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("document"), QStringLiteral("Document to format."));

    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Write pages to <file> instead of stdout."),
                                          QStringLiteral("file"));
    const QCommandLineOption formatOption(QStringLiteral("format"),
                                          QStringLiteral("Output format: pdf, ps or text."),
                                          QStringLiteral("format"));
    const QCommandLineOption fontOption(QStringLiteral("font"), QStringLiteral("Print font name."),
                                        QStringLiteral("name"));
    const QCommandLineOption doubleSpacedOption(QStringLiteral("double-spaced"),
                                                QStringLiteral("Leave a blank line after every text line."));
    const QCommandLineOption singleSpacedOption(QStringLiteral("single-spaced"), QStringLiteral("Single spacing."));
    const QCommandLineOption doubleSidedOption(QStringLiteral("double-sided"),
                                               QStringLiteral("Shift margins for duplex binding."));
    const QCommandLineOption singleSidedOption(QStringLiteral("single-sided"), QStringLiteral("Symmetric margins."));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Preferences file (default: per-user config)."),
                                            QStringLiteral("file"));
    const QCommandLineOption listFontsOption(QStringLiteral("list-fonts"), QStringLiteral("List print fonts."));
    const QCommandLineOption wordCountOption(QStringLiteral("word-count"), QStringLiteral("Print the word count."));
    parser.addOptions({outputOption, formatOption, fontOption, doubleSpacedOption, singleSpacedOption,
                       doubleSidedOption, singleSidedOption, settingsOption, listFontsOption, wordCountOption});
    parser.process(app);

    if (parser.isSet(listFontsOption)) {
        return writeText(FontConfig::catalogNames().join(QLatin1Char('\n')), QString()) ? 0 : 1;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(2);
    }
    const QString documentPath = positional.first();
    qDebug() << "[Main] Formatting" << documentPath;

    PreferencesStore store(parser.isSet(settingsOption) ? parser.value(settingsOption)
                                                        : PreferencesStore::defaultFilePath());
    Preferences preferences = store.loadPreferences(documentPath);

    if (parser.isSet(fontOption)) {
        preferences.fontName = parser.value(fontOption);
    }
    if (parser.isSet(doubleSpacedOption)) {
        preferences.doubleSpaced = true;
    } else if (parser.isSet(singleSpacedOption)) {
        preferences.doubleSpaced = false;
    }
    if (parser.isSet(doubleSidedOption)) {
        preferences.doubleSided = true;
    } else if (parser.isSet(singleSidedOption)) {
        preferences.doubleSided = false;
    }

    DocumentEditor editor;
    int paragraphCount = 0;
    if (!DocumentIO::loadDocument(&editor, documentPath, paragraphCount)) {
        qCritical() << "[Main] Failed to load" << documentPath;
        return 1;
    }
    qDebug() << "[Main] Loaded" << paragraphCount << "paragraphs";

    if (parser.isSet(wordCountOption)) {
        return writeText(QString::number(editor.wordCount()), QString()) ? 0 : 1;
    }

    PrintOptions options;
    options.doubleSided = preferences.doubleSided;
    options.doubleSpaced = preferences.doubleSpaced;

    QVector<PageDescription> pages;
    FontConfig font;
    const EditorError formatError = PrintFormatter::formatWithFont(editor.buffer(), preferences.fontName,
                                                                   options, &pages, &font);
    if (formatError == EditorError::FontLoadError) {
        qWarning() << "[Main]" << editorErrorString(formatError) << "- printing in" << font.name();
    } else if (formatError != EditorError::None) {
        qCritical() << "[Main] Formatting failed:" << editorErrorString(formatError);
        return 1;
    }

    const QString outputPath = parser.value(outputOption);
    const QString format = outputFormat(parser.value(formatOption), outputPath);

    bool written = false;
    if (format == QStringLiteral("pdf") || format == QStringLiteral("ps")) {
        if (outputPath.isEmpty()) {
            qCritical() << "[Main]" << format << "output needs --output";
            return 2;
        }
        if (format == QStringLiteral("pdf")) {
            PdfExporter::Settings settings;
            settings.title = QFileInfo(documentPath).completeBaseName();
            EditorError fontError = EditorError::None;
            written = PdfExporter::exportPages(pages, font, outputPath, settings, &fontError);
            if (fontError != EditorError::None) {
                qWarning() << "[Main]" << editorErrorString(fontError) << "- PDF drawn in Courier";
            }
        } else {
            written = PostScriptWriter::write(pages, font, outputPath);
        }
    } else if (format == QStringLiteral("text")) {
        written = writeText(PrintFormatter::toPlainText(pages), outputPath);
    } else {
        qCritical() << "[Main] Unknown format" << format;
        return 2;
    }

    if (!written) {
        qCritical() << "[Main] Failed to write output";
        return 1;
    }
    qDebug() << "[Main] Wrote" << pages.size() << "pages as" << format;

    // Remember what was used for this document.
    preferences.fontName = font.name();
    if (!outputPath.isEmpty()) {
        preferences.lastSavePath = QFileInfo(outputPath).absoluteFilePath();
    }
    if (!store.savePreferences(documentPath, preferences)) {
        qWarning() << "[Main] Could not save preferences";
    }
    return 0;
}
