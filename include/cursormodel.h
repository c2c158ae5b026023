#pragma once

#include "reflowengine.h"

#include <QString>
#include <QVector>

struct RowColumn {
    int row = 0;
    int column = 0;

    bool operator==(const RowColumn &other) const { return row == other.row && column == other.column; }
    bool operator!=(const RowColumn &other) const { return !(*this == other); }
};

// A logical offset plus the column vertical movement tries to return to.
// Operations take the current text and its visual lines; the model keeps no
// reference to either.
class CursorModel {
public:
    enum class CharClass {
        Word,
        Punctuation,
        Whitespace
    };

    int position() const { return m_position; }
    int preferredColumn() const { return m_preferredColumn; }

    void setPosition(int position, const QString &text, const QVector<VisualLine> &lines);
    void setPositionKeepColumn(int position, const QString &text);

    void moveLeft(const QString &text, const QVector<VisualLine> &lines);
    void moveRight(const QString &text, const QVector<VisualLine> &lines);
    void moveWordForward(const QString &text, const QVector<VisualLine> &lines);
    void moveWordBackward(const QString &text, const QVector<VisualLine> &lines);
    void moveToVisualLineStart(const QString &text, const QVector<VisualLine> &lines);
    void moveToVisualLineEnd(const QString &text, const QVector<VisualLine> &lines);
    void moveUp(const QVector<VisualLine> &lines, int rows = 1);
    void moveDown(const QVector<VisualLine> &lines, int rows = 1);

    static CharClass classify(QChar ch);
    static int wordBoundaryForward(const QString &text, int pos);
    static int wordBoundaryBackward(const QString &text, int pos);

    static int lineIndexForOffset(const QVector<VisualLine> &lines, int offset);
    static RowColumn toRowColumn(const QVector<VisualLine> &lines, int offset);
    static int fromRowColumn(const QVector<VisualLine> &lines, int row, int column);

private:
    void updatePreferredColumn(const QVector<VisualLine> &lines);

    int m_position = 0;
    int m_preferredColumn = 0;
};
