#pragma once

#include "documentbuffer.h"
#include "editorerror.h"
#include "fontconfig.h"

#include <QMarginsF>
#include <QPointF>
#include <QSizeF>
#include <QStringList>
#include <QVector>

struct PrintOptions {
    bool doubleSided = false;
    bool doubleSpaced = false;
};

// A maximal stretch of one visual line sharing the same bold/underline flags.
struct TextRun {
    int line = 0;           // Physical line slot from the top of the page
    int column = 0;         // Column inside the text area, indent included
    QString text;
    TextStyles style;
    QPointF position;       // Left end of the baseline, in points from the top-left corner
};

struct PageDescription {
    int pageNumber = 1;
    QString pageNumberText;         // Empty on page 1
    int pageNumberLine = 0;
    int pageNumberColumn = 0;
    QPointF pageNumberPosition;

    QSizeF pageSize;                // Points
    QMarginsF margins;              // Points
    double charWidth = 0.0;
    double lineHeight = 0.0;
    int columns = 0;                // Full page width in characters
    int lines = 0;                  // Physical lines on the page
    QVector<TextRun> runs;

    // The page as `lines` strings of `columns` characters.
    QStringList toCharacterGrid() const;
};

namespace PrintFormatter {

EditorError format(const DocumentBuffer &document, const FontConfig &font, const PrintOptions &options,
                   QVector<PageDescription> *pages);

// Resolves `fontName` from the catalog first. An unknown font falls back to
// FontConfig::defaultFont(); the pages are still produced and FontLoadError
// is returned so the caller can tell the user.
EditorError formatWithFont(const DocumentBuffer &document, const QString &fontName, const PrintOptions &options,
                           QVector<PageDescription> *pages, FontConfig *usedFont = nullptr);

// Character grids of all pages joined by newlines, with a form feed between pages.
QString toPlainText(const QVector<PageDescription> &pages);

} // namespace PrintFormatter
