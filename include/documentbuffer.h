#pragma once

#include "editorerror.h"
#include "styledtext.h"

// Logical document text with per-character bold/underline attributes.
// Paragraph separators ('\n') never carry attributes.
class DocumentBuffer {
public:
    DocumentBuffer() = default;
    explicit DocumentBuffer(const StyledText &content);

    int length() const { return m_content.length(); }
    bool isEmpty() const { return m_content.isEmpty(); }
    const QString &text() const { return m_content.text; }
    const StyledText &content() const { return m_content; }
    TextStyles styleAt(int pos) const;
    int paragraphCount() const;

    EditorError insert(int pos, const QString &text, TextStyles styles = {});
    EditorError insert(int pos, const StyledText &text);
    EditorError remove(int pos, int length, StyledText *removed = nullptr);
    EditorError setAttribute(int pos, int length, TextStyle attribute, bool on);
    EditorError slice(int pos, int length, StyledText *out) const;
    QVector<StyleRun> runs(int pos, int length) const;
    void clear();

    // Grows a valid range so it never splits a surrogate pair.
    void widenToCharacters(int *pos, int *length) const;

    bool operator==(const DocumentBuffer &other) const { return m_content == other.m_content; }
    bool operator!=(const DocumentBuffer &other) const { return !(*this == other); }

private:
    bool isValidRange(int pos, int length) const;
    // Clears styles on separators and backspaces, and gives the low half of a
    // surrogate pair the style of its high half, inside [from, to).
    static void normalizeStyles(StyledText &text, int from = 0, int to = -1);

    StyledText m_content;
};
