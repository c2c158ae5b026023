#include "printformatter.h"

#include "paginator.h"
#include "platenconstants.h"
#include "reflowengine.h"

#include <QDebug>

namespace {

bool isBlankRun(const QString &text, TextStyles style)
{
    if (style.testFlag(TextStyle::Underline)) {
        return false;
    }
    for (const QChar ch : text) {
        if (!ch.isSpace()) {
            return false;
        }
    }
    return true;
}

PageDescription describePage(const DocumentBuffer &document, const QVector<VisualLine> &lines, const Page &page,
                             const FontConfig &font, const PrintOptions &options)
{
    PageDescription desc;
    desc.pageNumber = page.number;
    desc.pageSize = QSizeF(font.pageWidthPoints(), font.pageHeightPoints());
    desc.charWidth = font.charWidthPoints();
    desc.lineHeight = font.lineHeightPoints();
    desc.columns = font.fullPageWidth();
    desc.lines = font.pageHeightLines();

    double left = font.leftMarginChars() * desc.charWidth;
    double right = font.rightMarginChars() * desc.charWidth;
    if (options.doubleSided) {
        // Shift text away from the binding edge: left edge on odd pages, right edge on even pages.
        const double offset = PlatenConstants::BindingOffsetInches * PlatenConstants::PointsPerInch;
        const bool odd = (page.number % 2) == 1;
        left += odd ? offset : -offset;
        right += odd ? -offset : offset;
    }
    desc.margins = QMarginsF(left, font.topMarginLines() * desc.lineHeight,
                             right, font.bottomMarginLines() * desc.lineHeight);

    if (page.showsPageNumber()) {
        desc.pageNumberText = QString::number(page.number);
        desc.pageNumberLine = PlatenConstants::PageNumberLine;
        desc.pageNumberColumn = (font.fullPageWidth() - desc.pageNumberText.size()) / 2;
        desc.pageNumberPosition = QPointF(desc.pageNumberColumn * desc.charWidth,
                                          (desc.pageNumberLine + 1) * desc.lineHeight);
    }

    const QString &text = document.text();
    for (int i = 0; i < page.lineCount; ++i) {
        const VisualLine &line = lines.at(page.firstLine + i);
        const int slot = font.topMarginLines() + (options.doubleSpaced ? 2 * i : i);
        for (const StyleRun &styleRun : document.runs(line.start, line.length)) {
            TextRun run;
            run.text = text.mid(styleRun.start, styleRun.length);
            run.style = styleRun.style;
            if (isBlankRun(run.text, run.style)) {
                continue;
            }
            run.line = slot;
            run.column = line.indent + (styleRun.start - line.start);
            run.position = QPointF(left + run.column * desc.charWidth, (slot + 1) * desc.lineHeight);
            desc.runs.append(run);
        }
    }
    return desc;
}

} // namespace

QStringList PageDescription::toCharacterGrid() const
{
    QStringList grid;
    for (int i = 0; i < lines; ++i) {
        grid.append(QString(columns, QLatin1Char(' ')));
    }

    auto place = [&](int line, int column, const QString &text) {
        if (line < 0 || line >= grid.size()) {
            return;
        }
        QString &row = grid[line];
        for (int i = 0; i < text.size(); ++i) {
            if (column + i >= 0 && column + i < row.size()) {
                row[column + i] = text.at(i);
            }
        }
    };

    if (!pageNumberText.isEmpty()) {
        place(pageNumberLine, pageNumberColumn, pageNumberText);
    }
    for (const TextRun &run : runs) {
        place(run.line, qRound(run.position.x() / charWidth), run.text);
    }
    return grid;
}

namespace PrintFormatter {

EditorError format(const DocumentBuffer &document, const FontConfig &font, const PrintOptions &options,
                   QVector<PageDescription> *pages)
{
    QVector<VisualLine> lines;
    EditorError error = ReflowEngine::reflow(document.text(), font.textWidth(), &lines);
    if (error != EditorError::None) {
        return error;
    }

    QVector<Page> layout;
    error = Paginator::paginate(lines, font.textHeightLines(), options.doubleSpaced, &layout);
    if (error != EditorError::None) {
        return error;
    }

    qDebug() << "[PrintFormatter] Formatting" << lines.size() << "lines into" << layout.size()
             << "pages with" << font.name() << "doubleSided=" << options.doubleSided
             << "doubleSpaced=" << options.doubleSpaced;

    if (pages) {
        pages->clear();
        pages->reserve(layout.size());
        for (const Page &page : layout) {
            pages->append(describePage(document, lines, page, font, options));
        }
    }
    return EditorError::None;
}

EditorError formatWithFont(const DocumentBuffer &document, const QString &fontName, const PrintOptions &options,
                           QVector<PageDescription> *pages, FontConfig *usedFont)
{
    FontConfig font;
    const EditorError fontError = FontConfig::fromName(fontName, &font);
    if (fontError != EditorError::None) {
        font = FontConfig::defaultFont();
        qWarning() << "[PrintFormatter] Font" << fontName << "unavailable, falling back to" << font.name();
    }
    if (usedFont) {
        *usedFont = font;
    }

    const EditorError error = format(document, font, options, pages);
    if (error != EditorError::None) {
        return error;
    }
    return fontError;
}

QString toPlainText(const QVector<PageDescription> &pages)
{
    QStringList output;
    for (int i = 0; i < pages.size(); ++i) {
        output.append(pages.at(i).toCharacterGrid());
        if (i < pages.size() - 1) {
            output.append(QStringLiteral("\f"));
        }
    }
    return output.join(QLatin1Char('\n'));
}

} // namespace PrintFormatter
