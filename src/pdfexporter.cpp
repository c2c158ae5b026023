#include "pdfexporter.h"

#include <QDebug>
#include <QFontDatabase>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>

namespace PdfExporter {

QFont resolveFont(const FontConfig &font, EditorError *error)
{
    if (error) {
        *error = EditorError::None;
    }

    QString family = font.name();
    if (font.isEmbedded() && !QFontDatabase::families().contains(family)) {
        qWarning() << "[PdfExporter] Font" << family << "is not installed, falling back to Courier";
        family = FontConfig::defaultFont().name();
        if (error) {
            *error = EditorError::FontLoadError;
        }
    }

    QFont qfont(family);
    qfont.setStyleHint(QFont::TypeWriter);
    qfont.setFixedPitch(true);
    qfont.setKerning(false);
    qfont.setPointSizeF(font.pointSize());
    return qfont;
}

bool exportPages(const QVector<PageDescription> &pages, const FontConfig &font, const QString &filePath,
                 const Settings &settings, EditorError *fontError)
{
    if (pages.isEmpty() || settings.resolutionDpi <= 0) {
        qWarning() << "[PdfExporter] Nothing to export to" << filePath;
        return false;
    }

    const QSizeF pageSize = pages.first().pageSize;
    QPdfWriter writer(filePath);
    writer.setResolution(settings.resolutionDpi);
    writer.setTitle(settings.title);
    writer.setCreator(settings.creator);
    writer.setPageSize(QPageSize(pageSize, QPageSize::Point, QString(), QPageSize::ExactMatch));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0), QPageLayout::Point);

    const QFont baseFont = resolveFont(font, fontError);

    QPainter painter;
    if (!painter.begin(&writer)) {
        qWarning() << "[PdfExporter] Cannot open" << filePath << "for writing";
        return false;
    }
    painter.setPen(Qt::black);

    // Page descriptions are in points; the writer paints in device pixels.
    const qreal scale = static_cast<qreal>(settings.resolutionDpi) / 72.0;
    auto toDevice = [scale](const QPointF &point) { return QPointF(point.x() * scale, point.y() * scale); };

    for (int i = 0; i < pages.size(); ++i) {
        const PageDescription &page = pages.at(i);
        if (i > 0) {
            writer.newPage();
        }

        if (!page.pageNumberText.isEmpty()) {
            painter.setFont(baseFont);
            painter.drawText(toDevice(page.pageNumberPosition), page.pageNumberText);
        }

        for (const TextRun &run : page.runs) {
            QFont runFont = baseFont;
            runFont.setBold(run.style.testFlag(TextStyle::Bold));
            runFont.setUnderline(run.style.testFlag(TextStyle::Underline));
            painter.setFont(runFont);
            painter.drawText(toDevice(run.position), run.text);
        }
    }

    painter.end();
    qDebug() << "[PdfExporter] Wrote" << pages.size() << "pages to" << filePath;
    return true;
}

} // namespace PdfExporter
