#include "documenteditor.h"

#include "documenteditor_undo.h"
#include "overstrikecodec.h"
#include "platenconstants.h"

#include <QDebug>
#include <QRegularExpression>

using DocumentEditorUndo::AttributeCommand;
using DocumentEditorUndo::CompoundCommand;
using DocumentEditorUndo::DeleteTextCommand;
using DocumentEditorUndo::InsertTextCommand;

DocumentEditor::DocumentEditor(QObject *parent)
    : QObject(parent)
{
    m_undoStack.setUndoLimit(PlatenConstants::UndoLimit);
    connect(&m_undoStack, &QUndoStack::canUndoChanged, this, &DocumentEditor::undoAvailable);
    connect(&m_undoStack, &QUndoStack::canRedoChanged, this, &DocumentEditor::redoAvailable);
    m_reflow.reflow(m_buffer.text());
}

const QVector<VisualLine> &DocumentEditor::visualLines()
{
    return m_reflow.lines(m_buffer.text());
}

const QVector<Page> &DocumentEditor::pages()
{
    if (m_pagesDirty) {
        const EditorError error = Paginator::paginate(visualLines(), PlatenConstants::LinesPerPage,
                                                      m_doubleSpaced, &m_pages);
        if (error != EditorError::None) {
            qWarning() << "[DocumentEditor] Pagination failed:" << error;
            m_pages.clear();
        }
        m_pagesDirty = false;
    }
    return m_pages;
}

RowColumn DocumentEditor::cursorRowColumn()
{
    return CursorModel::toRowColumn(visualLines(), m_cursor.position());
}

int DocumentEditor::wordCount() const
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return m_buffer.text().split(whitespace, Qt::SkipEmptyParts).size();
}

EditorError DocumentEditor::setWidth(int width)
{
    const EditorError error = m_reflow.setWidth(width);
    if (error != EditorError::None) {
        return error;
    }
    m_pagesDirty = true;
    m_cursor.setPosition(m_cursor.position(), m_buffer.text(), visualLines());
    emit contentsChanged();
    return EditorError::None;
}

void DocumentEditor::setDoubleSpaced(bool doubleSpaced)
{
    if (m_doubleSpaced == doubleSpaced) {
        return;
    }
    m_doubleSpaced = doubleSpaced;
    m_pagesDirty = true;
    emit contentsChanged();
}

EditorError DocumentEditor::insert(int pos, const QString &text, TextStyles styles)
{
    return insert(pos, StyledText::uniform(text, styles));
}

EditorError DocumentEditor::insert(int pos, const StyledText &text)
{
    if (pos < 0 || pos > m_buffer.length()) {
        qWarning() << "[DocumentEditor] insert out of range: pos=" << pos << "length=" << m_buffer.length();
        return EditorError::OutOfRange;
    }
    if (text.isEmpty()) {
        return EditorError::None;
    }
    pushCommand(new InsertTextCommand(this, pos, text, UndoGroupType::Bulk, false));
    return EditorError::None;
}

EditorError DocumentEditor::remove(int pos, int length)
{
    StyledText removed;
    const EditorError error = m_buffer.slice(pos, length, &removed);
    if (error != EditorError::None) {
        qWarning() << "[DocumentEditor] remove out of range: pos=" << pos << "len=" << length;
        return error;
    }
    if (removed.isEmpty()) {
        return EditorError::None;
    }
    pushCommand(new DeleteTextCommand(this, pos, removed, UndoGroupType::Bulk, false, false));
    return EditorError::None;
}

EditorError DocumentEditor::setAttribute(int pos, int length, TextStyle attribute, bool on)
{
    StyledText before;
    m_buffer.widenToCharacters(&pos, &length);
    const EditorError error = m_buffer.slice(pos, length, &before);
    if (error != EditorError::None) {
        qWarning() << "[DocumentEditor] setAttribute out of range: pos=" << pos << "len=" << length;
        return error;
    }

    StyledText after = before;
    for (int i = 0; i < after.length(); ++i) {
        const QChar ch = after.text.at(i);
        if (ch != QLatin1Char('\n') && ch != QChar(OverstrikeCodec::Backspace)) {
            after.styles[i].setFlag(attribute, on);
        }
    }
    if (after == before) {
        return EditorError::None;
    }
    pushCommand(new AttributeCommand(this, pos, before, after));
    return EditorError::None;
}

void DocumentEditor::move(MoveOperation operation, bool extendSelection)
{
    const int oldPosition = m_cursor.position();
    if (extendSelection) {
        if (m_anchor < 0) {
            m_anchor = oldPosition;
        }
    } else {
        m_anchor = -1;
    }

    const QString &text = m_buffer.text();
    const QVector<VisualLine> &lines = visualLines();
    const int pageRows = Paginator::effectiveLinesPerPage(PlatenConstants::LinesPerPage, m_doubleSpaced)
                         - PlatenConstants::PageContextLines;

    switch (operation) {
    case MoveOperation::Left:
        m_cursor.moveLeft(text, lines);
        break;
    case MoveOperation::Right:
        m_cursor.moveRight(text, lines);
        break;
    case MoveOperation::WordForward:
        m_cursor.moveWordForward(text, lines);
        break;
    case MoveOperation::WordBackward:
        m_cursor.moveWordBackward(text, lines);
        break;
    case MoveOperation::LineStart:
        m_cursor.moveToVisualLineStart(text, lines);
        break;
    case MoveOperation::LineEnd:
        m_cursor.moveToVisualLineEnd(text, lines);
        break;
    case MoveOperation::Up:
        m_cursor.moveUp(lines);
        break;
    case MoveOperation::Down:
        m_cursor.moveDown(lines);
        break;
    case MoveOperation::PageUp:
        m_cursor.moveUp(lines, qMax(1, pageRows));
        break;
    case MoveOperation::PageDown:
        m_cursor.moveDown(lines, qMax(1, pageRows));
        break;
    case MoveOperation::DocumentStart:
        m_cursor.setPosition(0, text, lines);
        break;
    case MoveOperation::DocumentEnd:
        m_cursor.setPosition(text.size(), text, lines);
        break;
    }

    if (m_cursor.position() != oldPosition) {
        emit cursorPositionChanged(m_cursor.position());
    }
}

EditorError DocumentEditor::setCursorPosition(int pos)
{
    if (pos < 0 || pos > m_buffer.length()) {
        qWarning() << "[DocumentEditor] setCursorPosition out of range:" << pos;
        return EditorError::OutOfRange;
    }
    m_anchor = -1;
    updateCursor(pos);
    return EditorError::None;
}

void DocumentEditor::setCursorRowColumn(int row, int column)
{
    m_anchor = -1;
    updateCursor(CursorModel::fromRowColumn(visualLines(), row, column));
}

void DocumentEditor::typeText(const QString &text)
{
    if (text.isEmpty()) {
        return;
    }
    const StyledText styled = StyledText::uniform(text, m_caretStyle);

    if (hasSelection()) {
        const int start = selectionStart();
        QUndoCommand *cmdParent = new CompoundCommand(QStringLiteral("replace"));
        new DeleteTextCommand(this, start, selectedText(), UndoGroupType::Bulk, false, false, cmdParent);
        new InsertTextCommand(this, start, styled, UndoGroupType::Bulk, false, cmdParent);
        pushCommand(cmdParent);
        return;
    }

    const int pos = m_cursor.position();
    if (text.size() == 1 && text.at(0) != QLatin1Char('\n')) {
        pushCommand(new InsertTextCommand(this, pos, styled, classifyChar(text.at(0)), true));
        return;
    }
    pushCommand(new InsertTextCommand(this, pos, styled, UndoGroupType::Bulk, false));
}

void DocumentEditor::backspace()
{
    if (hasSelection()) {
        deleteSelection();
        return;
    }
    const int pos = m_cursor.position();
    if (pos == 0) {
        return;
    }
    StyledText removed;
    if (m_buffer.slice(pos - 1, 1, &removed) != EditorError::None) {
        return;
    }
    const UndoGroupType type = classifyChar(removed.text.at(0));
    const bool allowMerge = (type == UndoGroupType::Word);
    pushCommand(new DeleteTextCommand(this, pos - 1, removed, type, allowMerge, true));
}

void DocumentEditor::deleteChar()
{
    if (hasSelection()) {
        deleteSelection();
        return;
    }
    const int pos = m_cursor.position();
    if (pos >= m_buffer.length()) {
        return;
    }
    StyledText removed;
    if (m_buffer.slice(pos, 1, &removed) != EditorError::None) {
        return;
    }
    const UndoGroupType type = classifyChar(removed.text.at(0));
    const bool allowMerge = (type == UndoGroupType::Word);
    pushCommand(new DeleteTextCommand(this, pos, removed, type, allowMerge, false));
}

void DocumentEditor::backwardKillWord()
{
    const int pos = m_cursor.position();
    if (pos == 0) {
        return;
    }

    int start = pos - 1;
    if (m_buffer.text().at(start) != QLatin1Char('\n')) {
        int paragraphStart = 0;
        int paragraphEnd = 0;
        paragraphBounds(pos, &paragraphStart, &paragraphEnd);
        start = qMax(paragraphStart, CursorModel::wordBoundaryBackward(m_buffer.text(), pos));
    }

    StyledText removed;
    if (m_buffer.slice(start, pos - start, &removed) != EditorError::None) {
        return;
    }
    pushCommand(new DeleteTextCommand(this, start, removed, UndoGroupType::Bulk, false, true));
}

void DocumentEditor::killLine()
{
    const int pos = m_cursor.position();
    const QVector<VisualLine> &lines = visualLines();
    const VisualLine &line = lines.at(CursorModel::lineIndexForOffset(lines, pos));
    const int visualEnd = line.lastInParagraph ? line.start + line.length : line.end;

    int end = pos;
    if (pos < visualEnd) {
        end = visualEnd;
    } else if (pos < m_buffer.length()) {
        // At the paragraph end: join with the next paragraph.
        end = pos + 1;
    } else {
        return;
    }

    StyledText removed;
    if (m_buffer.slice(pos, end - pos, &removed) != EditorError::None) {
        return;
    }
    pushCommand(new DeleteTextCommand(this, pos, removed, UndoGroupType::Bulk, false, false));
}

bool DocumentEditor::centerLine()
{
    const int pos = m_cursor.position();
    int start = 0;
    int end = 0;
    paragraphBounds(pos, &start, &end);
    const QString &text = m_buffer.text();

    int leading = 0;
    while (start + leading < end && text.at(start + leading).isSpace()) {
        ++leading;
    }
    int trailing = 0;
    while (end - trailing > start + leading && text.at(end - trailing - 1).isSpace()) {
        ++trailing;
    }
    const int contentLength = end - start - leading - trailing;

    if (contentLength == 0) {
        StyledText removed;
        if (end > start && m_buffer.slice(start, end - start, &removed) == EditorError::None) {
            pushCommand(new DeleteTextCommand(this, start, removed, UndoGroupType::Bulk, false, false));
        }
        return true;
    }
    if (contentLength >= m_reflow.width()) {
        qDebug() << "[DocumentEditor] centerLine: paragraph too wide to center";
        return false;
    }

    const int spaces = (m_reflow.width() - contentLength) / 2;
    StyledText centered = StyledText::plain(QString(spaces, QLatin1Char(' ')));
    StyledText content;
    StyledText original;
    if (m_buffer.slice(start + leading, contentLength, &content) != EditorError::None
        || m_buffer.slice(start, end - start, &original) != EditorError::None) {
        return false;
    }
    centered.append(content);

    if (centered != original) {
        QUndoCommand *cmdParent = new CompoundCommand(QStringLiteral("center"));
        new DeleteTextCommand(this, start, original, UndoGroupType::Bulk, false, false, cmdParent);
        new InsertTextCommand(this, start, centered, UndoGroupType::Bulk, false, cmdParent);
        pushCommand(cmdParent);
    }

    const int offset = pos - start;
    const int newOffset = offset <= leading ? spaces : qMin(offset - leading + spaces, centered.length());
    updateCursor(start + newOffset);
    return true;
}

void DocumentEditor::toggleBold()
{
    toggleAttribute(TextStyle::Bold);
}

void DocumentEditor::toggleUnderline()
{
    toggleAttribute(TextStyle::Underline);
}

void DocumentEditor::toggleAttribute(TextStyle attribute)
{
    if (!hasSelection()) {
        m_caretStyle.setFlag(attribute, !m_caretStyle.testFlag(attribute));
        return;
    }

    // Turn the attribute on unless every character already carries it.
    const StyledText selected = selectedText();
    bool allSet = true;
    for (int i = 0; i < selected.length(); ++i) {
        if (selected.text.at(i) != QLatin1Char('\n') && !selected.styles.at(i).testFlag(attribute)) {
            allSet = false;
            break;
        }
    }

    const int anchor = m_anchor;
    const int position = m_cursor.position();
    setAttribute(selectionStart(), selected.length(), attribute, !allSet);
    m_anchor = anchor;
    updateCursor(position);
}

bool DocumentEditor::hasSelection() const
{
    return m_anchor >= 0 && m_anchor != m_cursor.position();
}

int DocumentEditor::selectionStart() const
{
    return hasSelection() ? qMin(m_anchor, m_cursor.position()) : m_cursor.position();
}

int DocumentEditor::selectionEnd() const
{
    return hasSelection() ? qMax(m_anchor, m_cursor.position()) : m_cursor.position();
}

StyledText DocumentEditor::selectedText() const
{
    StyledText selected;
    if (hasSelection() && m_buffer.slice(selectionStart(), selectionEnd() - selectionStart(), &selected)
                              != EditorError::None) {
        qWarning() << "[DocumentEditor] Selection outside the buffer";
    }
    return selected;
}

void DocumentEditor::setSelection(int anchor, int position)
{
    const int length = m_buffer.length();
    m_anchor = qBound(0, anchor, length);
    updateCursor(qBound(0, position, length));
}

void DocumentEditor::selectAll()
{
    setSelection(0, m_buffer.length());
}

void DocumentEditor::deleteSelection()
{
    if (!hasSelection()) {
        return;
    }
    pushCommand(new DeleteTextCommand(this, selectionStart(), selectedText(), UndoGroupType::Bulk, false, false));
}

EditorError DocumentEditor::undo()
{
    qDebug() << "[DocumentEditor] Undo called, canUndo:" << m_undoStack.canUndo();
    if (!m_undoStack.canUndo()) {
        return EditorError::NothingToUndo;
    }
    m_undoStack.undo();
    return EditorError::None;
}

EditorError DocumentEditor::redo()
{
    qDebug() << "[DocumentEditor] Redo called, canRedo:" << m_undoStack.canRedo();
    if (!m_undoStack.canRedo()) {
        return EditorError::NothingToRedo;
    }
    m_undoStack.redo();
    return EditorError::None;
}

EditorError DocumentEditor::find(const QString &query, SearchDirection direction, const SearchOptions &options)
{
    const int from = direction == SearchDirection::Forward ? selectionEnd() : selectionStart();
    int match = -1;
    const EditorError error = SearchEngine::search(m_buffer.text(), query, from, direction, &match, options);
    if (error != EditorError::None) {
        return error;
    }
    setSelection(match, match + query.size());
    return EditorError::None;
}

int DocumentEditor::matchCount(const QString &query, const SearchOptions &options) const
{
    return SearchEngine::findAll(m_buffer.text(), query, options).size();
}

void DocumentEditor::load(const QByteArray &bytes)
{
    m_buffer = OverstrikeCodec::decode(bytes);
    m_undoStack.clear();
    m_reflow.reflow(m_buffer.text());
    m_pagesDirty = true;
    m_anchor = -1;
    m_caretStyle = TextStyles();
    m_cursor.setPosition(0, m_buffer.text(), visualLines());
    qDebug() << "[DocumentEditor] Loaded" << m_buffer.length() << "characters in"
             << m_buffer.paragraphCount() << "paragraphs";
    emit contentsChanged();
    emit cursorPositionChanged(0);
}

QByteArray DocumentEditor::save()
{
    m_undoStack.setClean();
    return OverstrikeCodec::encode(m_buffer);
}

void DocumentEditor::replaceRange(int pos, int removeLength, const StyledText &inserted, int cursor)
{
    EditorError error = EditorError::None;
    if (removeLength > 0) {
        error = m_buffer.remove(pos, removeLength);
    }
    if (error == EditorError::None && !inserted.isEmpty()) {
        error = m_buffer.insert(pos, inserted);
    }
    if (error != EditorError::None) {
        qWarning() << "[DocumentEditor] replaceRange failed at" << pos << ":" << error;
        m_reflow.reflow(m_buffer.text());
    } else {
        m_reflow.invalidate(m_buffer.text(), pos, removeLength, inserted.length());
    }
    m_pagesDirty = true;
    m_anchor = -1;
    emit contentsChanged();
    updateCursor(cursor);
}

DocumentEditor::UndoGroupType DocumentEditor::classifyChar(QChar ch) const
{
    switch (CursorModel::classify(ch)) {
    case CursorModel::CharClass::Word:
        return UndoGroupType::Word;
    case CursorModel::CharClass::Whitespace:
        return UndoGroupType::Whitespace;
    case CursorModel::CharClass::Punctuation:
        break;
    }
    return UndoGroupType::Punctuation;
}

void DocumentEditor::pushCommand(QUndoCommand *command)
{
    m_undoStack.push(command);
}

void DocumentEditor::updateCursor(int position)
{
    const int oldPosition = m_cursor.position();
    m_cursor.setPosition(position, m_buffer.text(), visualLines());
    if (m_cursor.position() != oldPosition) {
        emit cursorPositionChanged(m_cursor.position());
    }
}

void DocumentEditor::paragraphBounds(int pos, int *start, int *end) const
{
    const QString &text = m_buffer.text();
    *start = pos > 0 ? text.lastIndexOf(QLatin1Char('\n'), pos - 1) + 1 : 0;
    const int newline = text.indexOf(QLatin1Char('\n'), pos);
    *end = newline < 0 ? text.size() : newline;
}
