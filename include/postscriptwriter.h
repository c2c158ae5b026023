#pragma once

#include "fontconfig.h"
#include "printformatter.h"

#include <QByteArray>
#include <QString>
#include <QVector>

namespace PostScriptWriter {

// DSC-conforming PostScript for the pages, drawn in the font's ISOLatin1
// re-encoded regular and bold faces.
QByteArray generate(const QVector<PageDescription> &pages, const FontConfig &font);

bool write(const QVector<PageDescription> &pages, const FontConfig &font, const QString &filePath);

// Escapes a string for a PostScript literal. Latin-1 characters become octal
// escapes; anything outside Latin-1 becomes '?'.
QByteArray escape(const QString &text);

} // namespace PostScriptWriter
