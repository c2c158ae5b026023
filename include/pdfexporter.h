#pragma once

#include "editorerror.h"
#include "fontconfig.h"
#include "printformatter.h"

#include <QFont>
#include <QString>
#include <QVector>

namespace PdfExporter {

struct Settings {
    int resolutionDpi = 300;
    QString title;
    QString creator = QStringLiteral("platen");
};

// Font used to draw `font`. A face that must be embedded but is not
// installed falls back to Courier and sets *error to FontLoadError.
QFont resolveFont(const FontConfig &font, EditorError *error = nullptr);

bool exportPages(const QVector<PageDescription> &pages, const FontConfig &font, const QString &filePath,
                 const Settings &settings = Settings(), EditorError *fontError = nullptr);

} // namespace PdfExporter
