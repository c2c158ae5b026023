#pragma once

#include "cursormodel.h"
#include "documentbuffer.h"
#include "editorerror.h"
#include "paginator.h"
#include "reflowengine.h"
#include "searchengine.h"

#include <QByteArray>
#include <QObject>
#include <QUndoStack>

class QUndoCommand;

// One open document: the buffer, its undo history, the wrapped lines, the
// cursor and the page set the rendering collaborator draws from.
class DocumentEditor : public QObject {
    Q_OBJECT

public:
    enum class UndoGroupType {
        Word,
        Punctuation,
        Whitespace,
        Bulk
    };

    enum class MoveOperation {
        Left,
        Right,
        WordForward,
        WordBackward,
        LineStart,
        LineEnd,
        Up,
        Down,
        PageUp,
        PageDown,
        DocumentStart,
        DocumentEnd
    };

    explicit DocumentEditor(QObject *parent = nullptr);

    const QString &text() const { return m_buffer.text(); }
    const StyledText &styledText() const { return m_buffer.content(); }
    const DocumentBuffer &buffer() const { return m_buffer; }
    int length() const { return m_buffer.length(); }

    const QVector<VisualLine> &visualLines();
    const QVector<Page> &pages();
    RowColumn cursorRowColumn();
    int cursorPosition() const { return m_cursor.position(); }
    int preferredColumn() const { return m_cursor.preferredColumn(); }
    int wordCount() const;

    int width() const { return m_reflow.width(); }
    EditorError setWidth(int width);
    bool isDoubleSpaced() const { return m_doubleSpaced; }
    void setDoubleSpaced(bool doubleSpaced);

    // The four logical mutations. Each pushes exactly one undo command.
    EditorError insert(int pos, const QString &text, TextStyles styles = {});
    EditorError insert(int pos, const StyledText &text);
    EditorError remove(int pos, int length);
    EditorError setAttribute(int pos, int length, TextStyle attribute, bool on);
    void move(MoveOperation operation, bool extendSelection = false);

    EditorError setCursorPosition(int pos);
    void setCursorRowColumn(int row, int column);

    // Keyboard editing at the cursor.
    void typeText(const QString &text);
    void backspace();
    void deleteChar();
    void backwardKillWord();
    void killLine();
    bool centerLine();

    TextStyles caretStyle() const { return m_caretStyle; }
    void setCaretStyle(TextStyles style) { m_caretStyle = style; }
    void toggleBold();
    void toggleUnderline();

    bool hasSelection() const;
    int selectionStart() const;
    int selectionEnd() const;
    StyledText selectedText() const;
    void setSelection(int anchor, int position);
    void selectAll();
    void clearSelection() { m_anchor = -1; }
    void deleteSelection();

    bool canUndo() const { return m_undoStack.canUndo(); }
    bool canRedo() const { return m_undoStack.canRedo(); }
    EditorError undo();
    EditorError redo();

    // Selects the next match of `query` from the cursor.
    EditorError find(const QString &query, SearchDirection direction = SearchDirection::Forward,
                     const SearchOptions &options = SearchOptions());
    int matchCount(const QString &query, const SearchOptions &options = SearchOptions()) const;

    void load(const QByteArray &bytes);
    QByteArray save();
    bool isModified() const { return !m_undoStack.isClean(); }

    // Applied by DocumentEditorUndo commands on redo/undo.
    void replaceRange(int pos, int removeLength, const StyledText &inserted, int cursor);

signals:
    void contentsChanged();
    void cursorPositionChanged(int position);
    void undoAvailable(bool available);
    void redoAvailable(bool available);

private:
    UndoGroupType classifyChar(QChar ch) const;
    void pushCommand(QUndoCommand *command);
    void toggleAttribute(TextStyle attribute);
    void updateCursor(int position);
    void paragraphBounds(int pos, int *start, int *end) const;

    DocumentBuffer m_buffer;
    QUndoStack m_undoStack;
    ReflowEngine m_reflow;
    CursorModel m_cursor;
    QVector<Page> m_pages;
    bool m_pagesDirty = true;
    bool m_doubleSpaced = false;
    int m_anchor = -1;
    TextStyles m_caretStyle;
};
