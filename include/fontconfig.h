#pragma once

#include "editorerror.h"

#include <QString>
#include <QStringList>

// Immutable description of a fixed-pitch font and the page geometry it gives.
// Horizontal values are in characters, vertical values in 6-lpi lines.
class FontConfig {
public:
    FontConfig();

    static FontConfig defaultFont();
    static QStringList catalogNames();
    static EditorError fromName(const QString &name, FontConfig *out);
    static EditorError fromDimensions(int pitch, double pageWidthInches, double pageHeightInches,
                                      double horizontalMarginInches, double verticalMarginInches,
                                      FontConfig *out);

    const QString &name() const { return m_name; }
    const QString &postScriptName() const { return m_postScriptName; }
    const QString &postScriptBoldName() const { return m_postScriptBoldName; }
    int pitch() const { return m_pitch; }
    int pointSize() const { return m_pointSize; }
    bool isEmbedded() const { return m_embedded; }

    int fullPageWidth() const { return m_fullPageWidth; }
    int leftMarginChars() const { return m_leftMarginChars; }
    int rightMarginChars() const { return m_fullPageWidth - m_leftMarginChars - m_textWidth; }
    int textWidth() const { return m_textWidth; }

    int pageHeightLines() const { return m_pageHeightLines; }
    int topMarginLines() const { return m_topMarginLines; }
    int bottomMarginLines() const { return m_pageHeightLines - m_topMarginLines - m_textHeightLines; }
    int textHeightLines() const { return m_textHeightLines; }

    double charWidthPoints() const;
    double lineHeightPoints() const;
    double pageWidthPoints() const;
    double pageHeightPoints() const;

    bool operator==(const FontConfig &other) const;
    bool operator!=(const FontConfig &other) const { return !(*this == other); }

private:
    FontConfig(const QString &name, const QString &postScriptName, const QString &postScriptBoldName,
               int pitch, bool embedded, double pageWidthInches, double pageHeightInches,
               double horizontalMarginInches, double verticalMarginInches);

    QString m_name;
    QString m_postScriptName;
    QString m_postScriptBoldName;
    int m_pitch = 10;
    int m_pointSize = 12;
    bool m_embedded = false;
    double m_pageWidthInches = 8.5;
    double m_pageHeightInches = 11.0;
    int m_fullPageWidth = 85;
    int m_leftMarginChars = 10;
    int m_textWidth = 65;
    int m_pageHeightLines = 66;
    int m_topMarginLines = 6;
    int m_textHeightLines = 54;
};
