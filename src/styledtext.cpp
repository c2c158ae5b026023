#include "styledtext.h"

StyledText StyledText::plain(const QString &text)
{
    return uniform(text, TextStyles());
}

StyledText StyledText::uniform(const QString &text, TextStyles style)
{
    StyledText result;
    result.text = text;
    result.styles.fill(style, text.size());
    return result;
}

void StyledText::append(QChar ch, TextStyles style)
{
    text.append(ch);
    styles.append(style);
}

void StyledText::append(const StyledText &other)
{
    text.append(other.text);
    styles.append(other.styles);
}

StyledText StyledText::mid(int pos, int length) const
{
    StyledText result;
    result.text = text.mid(pos, length);
    result.styles = styles.mid(pos, length);
    return result;
}

bool StyledText::operator==(const StyledText &other) const
{
    return text == other.text && styles == other.styles;
}

QVector<StyleRun> styleRuns(const StyledText &text, int pos, int length)
{
    QVector<StyleRun> runs;
    const int end = (length < 0) ? text.length() : qMin(text.length(), pos + length);
    for (int i = qMax(0, pos); i < end; ++i) {
        const TextStyles style = text.styles.at(i);
        if (!runs.isEmpty() && runs.last().style == style) {
            runs.last().length++;
            continue;
        }
        StyleRun run;
        run.start = i;
        run.length = 1;
        run.style = style;
        runs.append(run);
    }
    return runs;
}
