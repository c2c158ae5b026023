#pragma once

#include "editorerror.h"
#include "platenconstants.h"

#include <QString>
#include <QStringView>
#include <QVector>

// One wrapped line. Offsets are logical buffer offsets.
struct VisualLine {
    int start = 0;
    int end = 0;            // Exclusive, includes a space consumed by a soft break
    int length = 0;         // Rendered characters, without the consumed space
    int width = 0;          // Indent plus content, trailing whitespace trimmed
    int indent = 0;         // Hanging indent columns on wrapped list lines
    int paragraph = 0;
    bool lastInParagraph = true;

    // Offset the cursor lands on for "end of line".
    int endOffset() const { return lastInParagraph ? start + length : end - 1; }

    bool operator==(const VisualLine &other) const;
    bool operator!=(const VisualLine &other) const { return !(*this == other); }
};

class ReflowEngine {
public:
    explicit ReflowEngine(int width = PlatenConstants::DocumentWidth);

    int width() const { return m_width; }
    EditorError setWidth(int width);

    // Relayout everything from scratch.
    EditorError reflow(const QString &text);

    // Record that [pos, pos + removed) of the previous text was replaced by
    // `inserted` characters, giving `text`. Only touched paragraphs relayout.
    void invalidate(const QString &text, int pos, int removed, int inserted);

    // Current lines for `text`, laying out dirty paragraphs first.
    const QVector<VisualLine> &lines(const QString &text);
    int relayoutCount() const { return m_relayoutCount; }

    static EditorError reflow(const QString &text, int width, QVector<VisualLine> *lines);
    static int hangingIndentWidth(QStringView paragraph);

private:
    struct Paragraph {
        int start = 0;
        int length = 0;
        bool dirty = true;
        QVector<VisualLine> lines;  // Relative to the paragraph start
    };

    static void layoutParagraph(QStringView paragraph, int width, QVector<VisualLine> *lines);
    void rebuildParagraphs(const QString &text);
    int paragraphIndexAt(int pos) const;

    int m_width;
    QVector<Paragraph> m_paragraphs;
    QVector<VisualLine> m_lines;
    bool m_linesDirty = true;
    int m_relayoutCount = 0;
};
