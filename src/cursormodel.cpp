#include "cursormodel.h"

void CursorModel::setPosition(int position, const QString &text, const QVector<VisualLine> &lines)
{
    setPositionKeepColumn(position, text);
    updatePreferredColumn(lines);
}

void CursorModel::setPositionKeepColumn(int position, const QString &text)
{
    m_position = qBound(0, position, static_cast<int>(text.size()));
}

void CursorModel::moveLeft(const QString &text, const QVector<VisualLine> &lines)
{
    setPosition(m_position - 1, text, lines);
}

void CursorModel::moveRight(const QString &text, const QVector<VisualLine> &lines)
{
    setPosition(m_position + 1, text, lines);
}

void CursorModel::moveWordForward(const QString &text, const QVector<VisualLine> &lines)
{
    setPosition(wordBoundaryForward(text, m_position), text, lines);
}

void CursorModel::moveWordBackward(const QString &text, const QVector<VisualLine> &lines)
{
    setPosition(wordBoundaryBackward(text, m_position), text, lines);
}

void CursorModel::moveToVisualLineStart(const QString &text, const QVector<VisualLine> &lines)
{
    if (lines.isEmpty()) {
        return;
    }
    const VisualLine &line = lines.at(lineIndexForOffset(lines, m_position));
    setPosition(line.start, text, lines);
}

void CursorModel::moveToVisualLineEnd(const QString &text, const QVector<VisualLine> &lines)
{
    if (lines.isEmpty()) {
        return;
    }
    const VisualLine &line = lines.at(lineIndexForOffset(lines, m_position));
    setPosition(line.endOffset(), text, lines);
}

void CursorModel::moveUp(const QVector<VisualLine> &lines, int rows)
{
    if (lines.isEmpty()) {
        return;
    }
    const int row = lineIndexForOffset(lines, m_position);
    if (row == 0) {
        m_position = 0;
        return;
    }
    m_position = fromRowColumn(lines, row - rows, m_preferredColumn);
}

void CursorModel::moveDown(const QVector<VisualLine> &lines, int rows)
{
    if (lines.isEmpty()) {
        return;
    }
    const int row = lineIndexForOffset(lines, m_position);
    if (row == lines.size() - 1) {
        m_position = lines.last().endOffset();
        return;
    }
    m_position = fromRowColumn(lines, row + rows, m_preferredColumn);
}

CursorModel::CharClass CursorModel::classify(QChar ch)
{
    if (ch.isSpace()) {
        return CharClass::Whitespace;
    }
    if (ch.isLetterOrNumber() || ch == QLatin1Char('_')) {
        return CharClass::Word;
    }
    return CharClass::Punctuation;
}

int CursorModel::wordBoundaryForward(const QString &text, int pos)
{
    const int length = text.size();
    if (pos >= length) {
        return length;
    }
    const CharClass start = classify(text.at(pos));
    if (start != CharClass::Whitespace) {
        while (pos < length && classify(text.at(pos)) == start) {
            ++pos;
        }
    }
    while (pos < length && classify(text.at(pos)) == CharClass::Whitespace) {
        ++pos;
    }
    return pos;
}

int CursorModel::wordBoundaryBackward(const QString &text, int pos)
{
    if (pos <= 0) {
        return 0;
    }
    pos = qMin(pos, static_cast<int>(text.size())) - 1;
    while (pos > 0 && classify(text.at(pos)) == CharClass::Whitespace) {
        --pos;
    }
    const CharClass target = classify(text.at(pos));
    if (target == CharClass::Whitespace) {
        return pos;
    }
    while (pos > 0 && classify(text.at(pos - 1)) == target) {
        --pos;
    }
    return pos;
}

int CursorModel::lineIndexForOffset(const QVector<VisualLine> &lines, int offset)
{
    // Last line starting at or before the offset. An offset on a soft-wrap
    // boundary therefore belongs to the start of the following line.
    int low = 0;
    int high = lines.size() - 1;
    while (low < high) {
        const int mid = (low + high + 1) / 2;
        if (lines.at(mid).start <= offset) {
            low = mid;
        } else {
            high = mid - 1;
        }
    }
    return qMax(0, low);
}

RowColumn CursorModel::toRowColumn(const QVector<VisualLine> &lines, int offset)
{
    RowColumn result;
    if (lines.isEmpty()) {
        return result;
    }
    result.row = lineIndexForOffset(lines, offset);
    const VisualLine &line = lines.at(result.row);
    result.column = line.indent + qBound(0, offset - line.start, line.endOffset() - line.start);
    return result;
}

int CursorModel::fromRowColumn(const QVector<VisualLine> &lines, int row, int column)
{
    if (lines.isEmpty()) {
        return 0;
    }
    const VisualLine &line = lines.at(qBound(0, row, static_cast<int>(lines.size()) - 1));
    const int contentColumn = qMax(0, column - line.indent);
    return qMin(line.start + contentColumn, line.endOffset());
}

void CursorModel::updatePreferredColumn(const QVector<VisualLine> &lines)
{
    m_preferredColumn = toRowColumn(lines, m_position).column;
}
