#include "documentbuffer.h"

#include <QDebug>

DocumentBuffer::DocumentBuffer(const StyledText &content)
    : m_content(content)
{
    if (m_content.styles.size() != m_content.text.size()) {
        m_content.styles.resize(m_content.text.size());
    }
    normalizeStyles(m_content);
}

TextStyles DocumentBuffer::styleAt(int pos) const
{
    if (pos < 0 || pos >= length()) {
        return {};
    }
    return m_content.styles.at(pos);
}

int DocumentBuffer::paragraphCount() const
{
    return m_content.text.count(QLatin1Char('\n')) + 1;
}

EditorError DocumentBuffer::insert(int pos, const QString &text, TextStyles styles)
{
    return insert(pos, StyledText::uniform(text, styles));
}

EditorError DocumentBuffer::insert(int pos, const StyledText &text)
{
    if (pos < 0 || pos > length()) {
        qWarning() << "[DocumentBuffer] insert out of range: pos=" << pos << "length=" << length();
        return EditorError::OutOfRange;
    }
    if (text.isEmpty()) {
        return EditorError::None;
    }

    StyledText normalized = text;
    if (normalized.styles.size() != normalized.text.size()) {
        normalized.styles.resize(normalized.text.size());
    }
    m_content.text.insert(pos, normalized.text);
    m_content.styles.insert(pos, normalized.length(), TextStyles());
    for (int i = 0; i < normalized.length(); ++i) {
        m_content.styles[pos + i] = normalized.styles.at(i);
    }
    // One extra unit each side: the insert may complete a surrogate pair.
    normalizeStyles(m_content, pos - 1, pos + normalized.length() + 1);
    return EditorError::None;
}

EditorError DocumentBuffer::remove(int pos, int length, StyledText *removed)
{
    if (!isValidRange(pos, length)) {
        qWarning() << "[DocumentBuffer] remove out of range: pos=" << pos << "len=" << length
                   << "length=" << this->length();
        return EditorError::OutOfRange;
    }
    if (removed) {
        *removed = m_content.mid(pos, length);
    }
    m_content.text.remove(pos, length);
    m_content.styles.remove(pos, length);
    return EditorError::None;
}

EditorError DocumentBuffer::setAttribute(int pos, int length, TextStyle attribute, bool on)
{
    if (!isValidRange(pos, length)) {
        qWarning() << "[DocumentBuffer] setAttribute out of range: pos=" << pos << "len=" << length;
        return EditorError::OutOfRange;
    }
    widenToCharacters(&pos, &length);
    const int start = pos;
    const int end = pos + length;
    for (int i = start; i < end; ++i) {
        m_content.styles[i].setFlag(attribute, on);
    }
    normalizeStyles(m_content, start, end);
    return EditorError::None;
}

EditorError DocumentBuffer::slice(int pos, int length, StyledText *out) const
{
    if (!isValidRange(pos, length)) {
        return EditorError::OutOfRange;
    }
    if (out) {
        *out = m_content.mid(pos, length);
    }
    return EditorError::None;
}

QVector<StyleRun> DocumentBuffer::runs(int pos, int length) const
{
    if (!isValidRange(pos, length)) {
        return {};
    }
    return styleRuns(m_content, pos, length);
}

void DocumentBuffer::clear()
{
    m_content = StyledText();
}

void DocumentBuffer::widenToCharacters(int *pos, int *length) const
{
    if (!isValidRange(*pos, *length) || *length == 0) {
        return;
    }
    const QString &text = m_content.text;
    int start = *pos;
    int end = start + *length;
    if (start > 0 && text.at(start).isLowSurrogate() && text.at(start - 1).isHighSurrogate()) {
        --start;
    }
    if (end < text.size() && text.at(end).isLowSurrogate() && text.at(end - 1).isHighSurrogate()) {
        ++end;
    }
    *pos = start;
    *length = end - start;
}

bool DocumentBuffer::isValidRange(int pos, int length) const
{
    return pos >= 0 && length >= 0 && pos <= this->length() && length <= this->length() - pos;
}

void DocumentBuffer::normalizeStyles(StyledText &text, int from, int to)
{
    from = qMax(from, 0);
    to = (to < 0 || to > text.length()) ? text.length() : to;
    for (int i = from; i < to; ++i) {
        const QChar ch = text.text.at(i);
        if (ch == QLatin1Char('\n') || ch == QLatin1Char('\b')) {
            text.styles[i] = TextStyles();
        } else if (ch.isLowSurrogate() && i > 0 && text.text.at(i - 1).isHighSurrogate()) {
            text.styles[i] = text.styles.at(i - 1);
        }
    }
}
