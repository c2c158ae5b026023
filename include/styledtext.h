#pragma once

#include <QFlags>
#include <QString>
#include <QVector>

enum class TextStyle : unsigned char {
    Bold = 0x1,
    Underline = 0x2
};
Q_DECLARE_FLAGS(TextStyles, TextStyle)
Q_DECLARE_OPERATORS_FOR_FLAGS(TextStyles)

// Text with one style entry per QChar. Styles are per character, so runs are
// reconstructed by scanning (see styleRuns()).
struct StyledText {
    QString text;
    QVector<TextStyles> styles;

    static StyledText plain(const QString &text);
    static StyledText uniform(const QString &text, TextStyles style);

    int length() const { return text.size(); }
    bool isEmpty() const { return text.isEmpty(); }

    void append(QChar ch, TextStyles style = {});
    void append(const StyledText &other);
    StyledText mid(int pos, int length = -1) const;

    bool operator==(const StyledText &other) const;
    bool operator!=(const StyledText &other) const { return !(*this == other); }
};

struct StyleRun {
    int start = 0;
    int length = 0;
    TextStyles style;
};

// Maximal runs of equal style inside [pos, pos + length).
QVector<StyleRun> styleRuns(const StyledText &text, int pos = 0, int length = -1);
