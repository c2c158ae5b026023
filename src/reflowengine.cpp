#include "reflowengine.h"

#include <QDebug>
#include <QRegularExpression>

bool VisualLine::operator==(const VisualLine &other) const
{
    return start == other.start && end == other.end && length == other.length
        && width == other.width && indent == other.indent && paragraph == other.paragraph
        && lastInParagraph == other.lastInParagraph;
}

ReflowEngine::ReflowEngine(int width)
    : m_width(width)
{
    if (m_width <= 0) {
        qWarning() << "[ReflowEngine] Invalid width" << width << "- using" << PlatenConstants::DocumentWidth;
        m_width = PlatenConstants::DocumentWidth;
    }
}

EditorError ReflowEngine::setWidth(int width)
{
    if (width <= 0) {
        qWarning() << "[ReflowEngine] setWidth rejected:" << width;
        return EditorError::InvalidConfiguration;
    }
    if (width == m_width) {
        return EditorError::None;
    }
    m_width = width;
    for (Paragraph &paragraph : m_paragraphs) {
        paragraph.dirty = true;
    }
    m_linesDirty = true;
    return EditorError::None;
}

EditorError ReflowEngine::reflow(const QString &text)
{
    rebuildParagraphs(text);
    lines(text);
    return EditorError::None;
}

void ReflowEngine::invalidate(const QString &text, int pos, int removed, int inserted)
{
    if (m_paragraphs.isEmpty()) {
        rebuildParagraphs(text);
        return;
    }

    const int first = paragraphIndexAt(pos);
    const int last = paragraphIndexAt(pos + removed);
    const int delta = inserted - removed;
    const int regionStart = m_paragraphs.at(first).start;
    const int regionEnd = m_paragraphs.at(last).start + m_paragraphs.at(last).length + delta;

    if (regionEnd < regionStart || regionEnd > text.size()
        || (regionEnd < text.size() && text.at(regionEnd) != QLatin1Char('\n'))) {
        qWarning() << "[ReflowEngine] Edit does not match paragraph table, rebuilding";
        rebuildParagraphs(text);
        return;
    }

    QVector<Paragraph> replacement;
    int start = regionStart;
    while (true) {
        const int newline = text.indexOf(QLatin1Char('\n'), start);
        Paragraph paragraph;
        paragraph.start = start;
        if (newline < 0 || newline >= regionEnd) {
            paragraph.length = regionEnd - start;
            replacement.append(paragraph);
            break;
        }
        paragraph.length = newline - start;
        replacement.append(paragraph);
        start = newline + 1;
    }

    for (int i = last + 1; i < m_paragraphs.size(); ++i) {
        m_paragraphs[i].start += delta;
    }
    m_paragraphs.remove(first, last - first + 1);
    for (int i = 0; i < replacement.size(); ++i) {
        m_paragraphs.insert(first + i, replacement.at(i));
    }
    m_linesDirty = true;
}

const QVector<VisualLine> &ReflowEngine::lines(const QString &text)
{
    if (m_paragraphs.isEmpty()) {
        rebuildParagraphs(text);
    }

    for (Paragraph &paragraph : m_paragraphs) {
        if (!paragraph.dirty) {
            continue;
        }
        layoutParagraph(QStringView(text).mid(paragraph.start, paragraph.length), m_width, &paragraph.lines);
        paragraph.dirty = false;
        ++m_relayoutCount;
        m_linesDirty = true;
    }

    if (m_linesDirty) {
        m_lines.clear();
        for (int i = 0; i < m_paragraphs.size(); ++i) {
            const Paragraph &paragraph = m_paragraphs.at(i);
            for (VisualLine line : paragraph.lines) {
                line.start += paragraph.start;
                line.end += paragraph.start;
                line.paragraph = i;
                m_lines.append(line);
            }
        }
        m_linesDirty = false;
    }
    return m_lines;
}

EditorError ReflowEngine::reflow(const QString &text, int width, QVector<VisualLine> *lines)
{
    if (width <= 0) {
        qWarning() << "[ReflowEngine] reflow rejected width" << width;
        return EditorError::InvalidConfiguration;
    }
    ReflowEngine engine(width);
    if (lines) {
        *lines = engine.lines(text);
    }
    return EditorError::None;
}

int ReflowEngine::hangingIndentWidth(QStringView paragraph)
{
    // Bullet ("- ", "* ") or number ("12. ", "3) ") followed by text.
    static const QRegularExpression listMarker(QStringLiteral("^(\\s*)(?:([-*]) (?=\\S)|(\\d+[.)]) (?=\\S))"));
    const QRegularExpressionMatch match = listMarker.match(paragraph.toString());
    if (!match.hasMatch()) {
        return 0;
    }
    const int leading = match.capturedLength(1);
    if (match.capturedLength(2) > 0) {
        return leading + match.capturedLength(2) + 1;
    }
    return leading + match.capturedLength(3) + 1;
}

void ReflowEngine::layoutParagraph(QStringView paragraph, int width, QVector<VisualLine> *lines)
{
    lines->clear();
    if (paragraph.isEmpty()) {
        lines->append(VisualLine());
        return;
    }

    int hanging = hangingIndentWidth(paragraph);
    if (hanging >= width) {
        hanging = 0;
    }

    int lineStart = 0;
    int lineIndex = 0;
    int current = -1;

    auto available = [&]() { return lineIndex == 0 ? width : width - hanging; };

    auto commit = [&](int length, bool consumesSpace) {
        VisualLine line;
        line.start = lineStart;
        line.length = length;
        line.end = lineStart + length + (consumesSpace ? 1 : 0);
        line.indent = lineIndex == 0 ? 0 : hanging;
        int trimmed = length;
        while (trimmed > 0 && paragraph.at(lineStart + trimmed - 1).isSpace()) {
            --trimmed;
        }
        line.width = trimmed > 0 ? line.indent + trimmed : 0;
        line.lastInParagraph = false;
        lines->append(line);
        lineStart = line.end;
        ++lineIndex;
    };

    // Words at least as wide as the line are hard-broken into full chunks.
    auto placeWord = [&](int wordLength) {
        while (wordLength >= available()) {
            const int chunk = available();
            commit(chunk, false);
            wordLength -= chunk;
        }
        current = wordLength;
    };

    int wordStart = 0;
    while (true) {
        const int space = paragraph.indexOf(QLatin1Char(' '), wordStart);
        const int wordEnd = space < 0 ? paragraph.size() : space;
        const int wordLength = wordEnd - wordStart;

        if (current < 0) {
            placeWord(wordLength);
        } else if (current + 1 + wordLength < available()) {
            current += 1 + wordLength;
        } else {
            commit(current, true);
            placeWord(wordLength);
        }

        if (space < 0) {
            break;
        }
        wordStart = space + 1;
    }

    commit(current, false);
    lines->last().lastInParagraph = true;
}

void ReflowEngine::rebuildParagraphs(const QString &text)
{
    m_paragraphs.clear();
    int start = 0;
    while (true) {
        const int newline = text.indexOf(QLatin1Char('\n'), start);
        Paragraph paragraph;
        paragraph.start = start;
        paragraph.length = (newline < 0 ? text.size() : newline) - start;
        m_paragraphs.append(paragraph);
        if (newline < 0) {
            break;
        }
        start = newline + 1;
    }
    m_linesDirty = true;
}

int ReflowEngine::paragraphIndexAt(int pos) const
{
    int low = 0;
    int high = m_paragraphs.size() - 1;
    while (low < high) {
        const int mid = (low + high + 1) / 2;
        if (m_paragraphs.at(mid).start <= pos) {
            low = mid;
        } else {
            high = mid - 1;
        }
    }
    return low;
}
