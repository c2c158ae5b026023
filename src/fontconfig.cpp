#include "fontconfig.h"

#include "platenconstants.h"

#include <QDebug>

using namespace PlatenConstants;

namespace {

const char *const CourierName = "Courier";
const char *const PrestigeEliteName = "Prestige Elite Std";

} // namespace

FontConfig::FontConfig()
    : FontConfig(defaultFont())
{
}

FontConfig::FontConfig(const QString &name, const QString &postScriptName, const QString &postScriptBoldName,
                       int pitch, bool embedded, double pageWidthInches, double pageHeightInches,
                       double horizontalMarginInches, double verticalMarginInches)
    : m_name(name),
      m_postScriptName(postScriptName),
      m_postScriptBoldName(postScriptBoldName),
      m_pitch(pitch),
      m_pointSize(120 / pitch),     // 10 pitch -> 12 pt, 12 pitch -> 10 pt
      m_embedded(embedded),
      m_pageWidthInches(pageWidthInches),
      m_pageHeightInches(pageHeightInches)
{
    m_fullPageWidth = static_cast<int>(pageWidthInches * pitch);
    m_leftMarginChars = static_cast<int>(horizontalMarginInches * pitch);
    m_textWidth = m_fullPageWidth - 2 * m_leftMarginChars;
    m_pageHeightLines = static_cast<int>(pageHeightInches * LinesPerInch);
    m_topMarginLines = static_cast<int>(verticalMarginInches * LinesPerInch);
    m_textHeightLines = m_pageHeightLines - 2 * m_topMarginLines;
}

FontConfig FontConfig::defaultFont()
{
    // Built-in PostScript/PDF font, referenced rather than embedded.
    static const FontConfig courier(QString::fromLatin1(CourierName), QStringLiteral("Courier"),
                                    QStringLiteral("Courier-Bold"), 10, false,
                                    LetterWidthInches, LetterHeightInches,
                                    StandardMarginInches, VerticalMarginInches);
    return courier;
}

QStringList FontConfig::catalogNames()
{
    return {QString::fromLatin1(CourierName), QString::fromLatin1(PrestigeEliteName)};
}

EditorError FontConfig::fromName(const QString &name, FontConfig *out)
{
    if (name == QLatin1String(CourierName)) {
        if (out) {
            *out = defaultFont();
        }
        return EditorError::None;
    }
    if (name == QLatin1String(PrestigeEliteName)) {
        if (out) {
            *out = FontConfig(name, QStringLiteral("PrestigeEliteStd"), QStringLiteral("PrestigeEliteStd-Bold"),
                              12, true, LetterWidthInches, LetterHeightInches,
                              NarrowMarginInches, VerticalMarginInches);
        }
        return EditorError::None;
    }
    qWarning() << "[FontConfig] Unknown font:" << name;
    return EditorError::FontLoadError;
}

EditorError FontConfig::fromDimensions(int pitch, double pageWidthInches, double pageHeightInches,
                                       double horizontalMarginInches, double verticalMarginInches,
                                       FontConfig *out)
{
    if (pitch <= 0 || pitch > 120 || pageWidthInches <= 0.0 || pageHeightInches <= 0.0
        || horizontalMarginInches < 0.0 || verticalMarginInches < 0.0) {
        qWarning() << "[FontConfig] Rejected dimensions: pitch=" << pitch << "page=" << pageWidthInches
                   << "x" << pageHeightInches << "margins=" << horizontalMarginInches << verticalMarginInches;
        return EditorError::InvalidConfiguration;
    }

    const FontConfig config(QStringLiteral("Custom %1-pitch").arg(pitch), QStringLiteral("Courier"),
                            QStringLiteral("Courier-Bold"), pitch, false, pageWidthInches, pageHeightInches,
                            horizontalMarginInches, verticalMarginInches);
    if (config.textWidth() <= 0 || config.textHeightLines() <= 0) {
        qWarning() << "[FontConfig] Page has no text area:" << config.textWidth() << "x" << config.textHeightLines();
        return EditorError::InvalidConfiguration;
    }
    if (out) {
        *out = config;
    }
    return EditorError::None;
}

double FontConfig::charWidthPoints() const
{
    return PointsPerInch / m_pitch;
}

double FontConfig::lineHeightPoints() const
{
    return LineHeightPoints;
}

double FontConfig::pageWidthPoints() const
{
    return m_pageWidthInches * PointsPerInch;
}

double FontConfig::pageHeightPoints() const
{
    return m_pageHeightInches * PointsPerInch;
}

bool FontConfig::operator==(const FontConfig &other) const
{
    return m_name == other.m_name && m_pitch == other.m_pitch
        && m_fullPageWidth == other.m_fullPageWidth && m_leftMarginChars == other.m_leftMarginChars
        && m_textWidth == other.m_textWidth && m_pageHeightLines == other.m_pageHeightLines
        && m_topMarginLines == other.m_topMarginLines && m_embedded == other.m_embedded;
}
