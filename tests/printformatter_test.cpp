#include <QTest>
#include <QObject>
#include <QFile>
#include <QFontDatabase>
#include <QTemporaryDir>
#include "documentbuffer.h"
#include "fontconfig.h"
#include "pdfexporter.h"
#include "postscriptwriter.h"
#include "printformatter.h"

class PrintFormatterTests : public QObject {
    Q_OBJECT

private:
    DocumentBuffer paragraphs(int count, const QString &text = QStringLiteral("line")) {
        QStringList lines;
        for (int i = 0; i < count; ++i) {
            lines.append(text);
        }
        return DocumentBuffer(StyledText::plain(lines.join(QLatin1Char('\n'))));
    }

    QVector<PageDescription> format(const DocumentBuffer &document, const PrintOptions &options = PrintOptions(),
                                    const FontConfig &font = FontConfig::defaultFont()) {
        QVector<PageDescription> pages;
        const EditorError error = PrintFormatter::format(document, font, options, &pages);
        Q_UNUSED(error);
        return pages;
    }

    FontConfig prestigeElite() {
        FontConfig font;
        const EditorError error = FontConfig::fromName(QStringLiteral("Prestige Elite Std"), &font);
        Q_UNUSED(error);
        return font;
    }

private slots:
    void fontCatalogDescribesGeometry() {
        const FontConfig courier = FontConfig::defaultFont();
        QCOMPARE(courier.name(), QString("Courier"));
        QCOMPARE(courier.pitch(), 10);
        QCOMPARE(courier.pointSize(), 12);
        QCOMPARE(courier.fullPageWidth(), 85);
        QCOMPARE(courier.leftMarginChars(), 10);
        QCOMPARE(courier.textWidth(), 65);
        QCOMPARE(courier.pageHeightLines(), 66);
        QCOMPARE(courier.topMarginLines(), 6);
        QCOMPARE(courier.textHeightLines(), 54);
        QVERIFY(!courier.isEmbedded());

        const FontConfig elite = prestigeElite();
        QCOMPARE(elite.pitch(), 12);
        QCOMPARE(elite.pointSize(), 10);
        QCOMPARE(elite.fullPageWidth(), 102);
        QCOMPARE(elite.leftMarginChars(), 15);
        QCOMPARE(elite.textWidth(), 72);
        QCOMPARE(elite.charWidthPoints(), 6.0);
        QVERIFY(elite.isEmbedded());

        QCOMPARE(FontConfig::catalogNames().size(), 2);
        FontConfig unknown;
        QCOMPARE(FontConfig::fromName("No Such Font", &unknown), EditorError::FontLoadError);
    }

    void customDimensionsAreValidated() {
        FontConfig font;
        QCOMPARE(FontConfig::fromDimensions(12, 8.5, 11.0, 1.0, 1.0, &font), EditorError::None);
        QCOMPARE(font.fullPageWidth(), 102);
        QCOMPARE(font.textWidth(), 78);

        QCOMPARE(FontConfig::fromDimensions(0, 8.5, 11.0, 1.0, 1.0, &font), EditorError::InvalidConfiguration);
        QCOMPARE(FontConfig::fromDimensions(10, 2.0, 11.0, 1.0, 1.0, &font), EditorError::InvalidConfiguration);
        QCOMPARE(FontConfig::fromDimensions(10, 8.5, 11.0, -1.0, 1.0, &font), EditorError::InvalidConfiguration);
        QCOMPARE(font.textWidth(), 78);
    }

    void singleLinePlacement() {
        const QVector<PageDescription> pages = format(DocumentBuffer(StyledText::plain("Hello")));

        QCOMPARE(pages.size(), 1);
        const PageDescription &page = pages.first();
        QCOMPARE(page.pageNumber, 1);
        QVERIFY(page.pageNumberText.isEmpty());
        QCOMPARE(page.pageSize, QSizeF(612, 792));
        QCOMPARE(page.margins.left(), 72.0);
        QCOMPARE(page.margins.top(), 72.0);
        QCOMPARE(page.margins.right(), 72.0);
        QCOMPARE(page.margins.bottom(), 72.0);

        QCOMPARE(page.runs.size(), 1);
        const TextRun &run = page.runs.first();
        QCOMPARE(run.text, QString("Hello"));
        QCOMPARE(run.line, 6);
        QCOMPARE(run.column, 0);
        QCOMPARE(run.position, QPointF(72, 84));
    }

    void emptyDocumentGivesOneBlankPage() {
        const QVector<PageDescription> pages = format(DocumentBuffer());
        QCOMPARE(pages.size(), 1);
        QVERIFY(pages.first().runs.isEmpty());
    }

    void stylesSplitRunsAndBlankRunsAreSkipped() {
        DocumentBuffer document(StyledText::plain("x   y __"));
        document.setAttribute(0, 1, TextStyle::Bold, true);
        document.setAttribute(4, 1, TextStyle::Bold, true);
        document.setAttribute(5, 1, TextStyle::Underline, true);

        const QVector<PageDescription> pages = format(document);
        const QVector<TextRun> runs = pages.first().runs;

        QCOMPARE(runs.size(), 4);
        QCOMPARE(runs.at(0).text, QString("x"));
        QVERIFY(runs.at(0).style.testFlag(TextStyle::Bold));
        QCOMPARE(runs.at(1).text, QString("y"));
        QCOMPARE(runs.at(1).column, 4);
        // An underlined space still prints.
        QCOMPARE(runs.at(2).text, QString(" "));
        QVERIFY(runs.at(2).style.testFlag(TextStyle::Underline));
        QCOMPARE(runs.at(3).text, QString("__"));
        QCOMPARE(runs.at(3).column, 6);
    }

    void doubleSpacingSkipsLines() {
        PrintOptions options;
        options.doubleSpaced = true;
        const QVector<PageDescription> pages = format(paragraphs(60), options);

        QCOMPARE(pages.size(), 3);
        QCOMPARE(pages.first().runs.size(), 27);
        QCOMPARE(pages.first().runs.at(0).line, 6);
        QCOMPARE(pages.first().runs.at(1).line, 8);
        QCOMPARE(pages.last().runs.size(), 6);
    }

    void doubleSidedShiftsBindingMargin() {
        PrintOptions options;
        options.doubleSided = true;
        const QVector<PageDescription> pages = format(paragraphs(60), options);

        QCOMPARE(pages.size(), 2);
        QCOMPARE(pages.at(0).margins.left(), 90.0);
        QCOMPARE(pages.at(0).margins.right(), 54.0);
        QCOMPARE(pages.at(1).margins.left(), 54.0);
        QCOMPARE(pages.at(1).margins.right(), 90.0);
        QCOMPARE(pages.at(0).runs.first().position.x(), 90.0);
        QCOMPARE(pages.at(1).runs.first().position.x(), 54.0);
    }

    void laterPagesCarryCenteredNumber() {
        const QVector<PageDescription> pages = format(paragraphs(60));

        QCOMPARE(pages.size(), 2);
        QCOMPARE(pages.at(0).runs.size(), 54);
        QCOMPARE(pages.at(1).runs.size(), 6);
        QCOMPARE(pages.at(1).pageNumberText, QString("2"));
        QCOMPARE(pages.at(1).pageNumberLine, 3);
        QCOMPARE(pages.at(1).pageNumberColumn, 42);
        QCOMPARE(pages.at(1).pageNumberPosition, QPointF(42 * 7.2, 48));
    }

    void hangingIndentShiftsContinuationRuns() {
        QStringList words;
        for (int i = 0; i < 20; ++i) {
            words.append(QStringLiteral("word"));
        }
        const DocumentBuffer document(StyledText::plain("- " + words.join(QLatin1Char(' '))));
        const QVector<TextRun> runs = format(document).first().runs;

        QCOMPARE(runs.size(), 2);
        QCOMPARE(runs.at(1).line, 7);
        QCOMPARE(runs.at(1).column, 2);
        QCOMPARE(runs.at(1).position.x(), 72 + 2 * 7.2);
    }

    void fontPitchChangesWrapping() {
        QStringList words;
        for (int i = 0; i < 14; ++i) {
            words.append(QStringLiteral("abcd"));
        }
        const DocumentBuffer document(StyledText::plain(words.join(QLatin1Char(' '))));

        QCOMPARE(format(document).first().runs.size(), 2);

        const QVector<PageDescription> elite = format(document, PrintOptions(), prestigeElite());
        QCOMPARE(elite.first().runs.size(), 1);
        QCOMPARE(elite.first().runs.first().position.x(), 90.0);
        QCOMPARE(elite.first().charWidth, 6.0);
        QCOMPARE(elite.first().columns, 102);
    }

    void unknownFontFallsBackToCourier() {
        QVector<PageDescription> pages;
        FontConfig used = prestigeElite();
        QCOMPARE(PrintFormatter::formatWithFont(DocumentBuffer(StyledText::plain("Hello")), "No Such Font",
                                                PrintOptions(), &pages, &used),
                 EditorError::FontLoadError);
        QVERIFY(used == FontConfig::defaultFont());
        QCOMPARE(pages.size(), 1);
        QCOMPARE(pages.first().runs.first().position, QPointF(72, 84));

        QCOMPARE(PrintFormatter::formatWithFont(DocumentBuffer(), "Prestige Elite Std", PrintOptions(), &pages, &used),
                 EditorError::None);
        QCOMPARE(used.pitch(), 12);
    }

    void characterGridMatchesLayout() {
        const QVector<PageDescription> pages = format(paragraphs(60, QStringLiteral("Hello")));
        const QStringList first = pages.at(0).toCharacterGrid();
        const QStringList second = pages.at(1).toCharacterGrid();

        QCOMPARE(first.size(), 66);
        QCOMPARE(first.at(0).size(), 85);
        QCOMPARE(first.at(6).mid(10, 5), QString("Hello"));
        QVERIFY(first.at(5).trimmed().isEmpty());
        QVERIFY(first.at(3).trimmed().isEmpty());
        QCOMPARE(second.at(3).trimmed(), QString("2"));
        QCOMPARE(second.at(3).indexOf('2'), 42);

        const QString text = PrintFormatter::toPlainText(pages);
        const QStringList lines = text.split(QLatin1Char('\n'));
        QCOMPARE(lines.size(), 66 + 1 + 66);
        QCOMPARE(lines.at(66), QString("\f"));
    }

    void postScriptEscapesStrings() {
        QCOMPARE(PostScriptWriter::escape("(a)\\"), QByteArray("\\(a\\)\\\\"));
        QCOMPARE(PostScriptWriter::escape(QString::fromUtf8("café")), QByteArray("caf\\351"));
        QCOMPARE(PostScriptWriter::escape(QString::fromUtf8("€5")), QByteArray("?5"));
        QCOMPARE(PostScriptWriter::escape("a\tb"), QByteArray("a\\tb"));
    }

    void postScriptDocumentStructure() {
        DocumentBuffer document = paragraphs(60, QStringLiteral("Hello"));
        document.setAttribute(0, 5, TextStyle::Bold, true);
        document.setAttribute(0, 5, TextStyle::Underline, true);
        const QVector<PageDescription> pages = format(document);

        const QByteArray ps = PostScriptWriter::generate(pages, FontConfig::defaultFont());
        QVERIFY(ps.startsWith("%!PS-Adobe-3.0\n"));
        QVERIFY(ps.contains("%%Pages: 2\n"));
        QVERIFY(ps.contains("%%BoundingBox: 0 0 612 792\n"));
        QVERIFY(ps.contains("/Courier-ISOLatin1 /Courier findfont"));
        QVERIFY(ps.contains("/Courier-Bold-ISOLatin1 /Courier-Bold findfont"));
        QVERIFY(ps.contains("B 72.00 708.00 (Hello) U\n"));
        QVERIFY(ps.contains("R 72.00 696.00 (Hello) S\n"));
        QVERIFY(ps.contains("%%Page: 2 2\n"));
        QVERIFY(ps.contains("R 302.40 744.00 (2) S\n"));
        QCOMPARE(ps.count("showpage"), 2);
        QVERIFY(ps.endsWith("%%EOF\n"));

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("out.ps");
        QVERIFY(PostScriptWriter::write(pages, FontConfig::defaultFont(), path));
        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), ps);
    }

    void pdfExportWritesFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("out.pdf");
        const QVector<PageDescription> pages = format(paragraphs(60, QStringLiteral("Hello")));

        EditorError fontError = EditorError::OutOfRange;
        QVERIFY(PdfExporter::exportPages(pages, FontConfig::defaultFont(), path, PdfExporter::Settings(), &fontError));
        QCOMPARE(fontError, EditorError::None);

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QVERIFY(file.readAll().startsWith("%PDF"));

        QVERIFY(!PdfExporter::exportPages(QVector<PageDescription>(), FontConfig::defaultFont(),
                                          dir.filePath("empty.pdf")));
    }

    void missingEmbeddedFontFallsBackForPdf() {
        const FontConfig elite = prestigeElite();
        if (QFontDatabase::families().contains(elite.name())) {
            QSKIP("Prestige Elite is installed on this machine");
        }

        EditorError error = EditorError::None;
        const QFont font = PdfExporter::resolveFont(elite, &error);
        QCOMPARE(error, EditorError::FontLoadError);
        QCOMPARE(font.family(), QString("Courier"));
        QCOMPARE(font.pointSize(), 10);
    }
};

QTEST_MAIN(PrintFormatterTests)
#include "printformatter_test.moc"
