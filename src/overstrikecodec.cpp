#include "overstrikecodec.h"

namespace {

const QChar BackspaceChar(OverstrikeCodec::Backspace);
const QChar Underscore(QLatin1Char('_'));

void appendOverstrike(QString &out, QStringView ch)
{
    out.append(BackspaceChar);
    out.append(ch);
}

// Code units of the character at `pos`: 2 for a surrogate pair, else 1.
int characterSize(const QString &text, int pos)
{
    if (pos + 1 < text.size() && text.at(pos).isHighSurrogate() && text.at(pos + 1).isLowSurrogate()) {
        return 2;
    }
    return 1;
}

int underscoreOverstrikes(TextStyles style)
{
    const bool bold = style.testFlag(TextStyle::Bold);
    const bool underline = style.testFlag(TextStyle::Underline);
    if (bold && underline) {
        return 3;
    }
    if (underline) {
        return 2;
    }
    return bold ? 1 : 0;
}

TextStyles underscoreStyle(int overstrikes)
{
    switch (overstrikes) {
    case 1:
        return TextStyle::Bold;
    case 2:
        return TextStyle::Underline;
    case 3:
        return TextStyles(TextStyle::Bold) | TextStyle::Underline;
    default:
        return {};
    }
}

// Number of "BS <ch>" groups directly after `pos` (at most `limit`).
int countOverstrikes(const QString &text, int pos, QStringView ch, int limit)
{
    const int step = 1 + int(ch.size());
    int count = 0;
    while (count < limit && pos + step * count + step <= text.size()
           && text.at(pos + step * count) == BackspaceChar
           && QStringView(text).mid(pos + step * count + 1, ch.size()) == ch) {
        ++count;
    }
    return count;
}

} // namespace

namespace OverstrikeCodec {

QByteArray encode(const DocumentBuffer &document)
{
    const StyledText &content = document.content();
    QString out;
    out.reserve(content.length() * 2);

    const QStringView underscore(&Underscore, 1);
    int i = 0;
    while (i < content.length()) {
        const int size = characterSize(content.text, i);
        const QStringView ch = QStringView(content.text).mid(i, size);
        const TextStyles style = content.styles.at(i);
        i += size;
        out.append(ch);
        if (!style || ch.front() == QLatin1Char('\n') || ch.front() == BackspaceChar) {
            continue;
        }
        if (ch.front() == Underscore) {
            for (int n = underscoreOverstrikes(style); n > 0; --n) {
                appendOverstrike(out, underscore);
            }
            continue;
        }
        if (style.testFlag(TextStyle::Bold)) {
            appendOverstrike(out, ch);
        }
        if (style.testFlag(TextStyle::Underline)) {
            appendOverstrike(out, underscore);
        }
    }
    return out.toUtf8();
}

DocumentBuffer decode(const QByteArray &bytes)
{
    const QString text = QString::fromUtf8(bytes);
    StyledText content;
    content.text.reserve(text.size());
    content.styles.reserve(text.size());

    const QStringView underscore(&Underscore, 1);
    int i = 0;
    while (i < text.size()) {
        const int size = characterSize(text, i);
        const QStringView ch = QStringView(text).mid(i, size);
        i += size;
        if (ch.front() == BackspaceChar || ch.front() == QLatin1Char('\n')) {
            content.append(ch.front());
            continue;
        }

        TextStyles style;
        if (ch.front() == Underscore) {
            const int count = countOverstrikes(text, i, underscore, 3);
            style = underscoreStyle(count);
            i += 2 * count;
        } else {
            if (countOverstrikes(text, i, ch, 1) == 1) {
                style |= TextStyle::Bold;
                i += 1 + size;
            }
            if (countOverstrikes(text, i, underscore, 1) == 1) {
                style |= TextStyle::Underline;
                i += 2;
            }
        }
        for (const QChar unit : ch) {
            content.append(unit, style);
        }
    }
    return DocumentBuffer(content);
}

} // namespace OverstrikeCodec
