#pragma once

#include "editorerror.h"
#include "reflowengine.h"

#include <QVector>

struct Page {
    int number = 1;
    int firstLine = 0;
    int lineCount = 0;
    bool breaksBefore = false;  // Set on every page after the first

    int endLine() const { return firstLine + lineCount; }
    bool showsPageNumber() const { return number > 1; }

    bool operator==(const Page &other) const;
};

namespace Paginator {

// Content lines that fit on one page; double spacing halves it (rounded down).
int effectiveLinesPerPage(int linesPerPage, bool doubleSpaced);

EditorError paginate(int lineCount, int linesPerPage, bool doubleSpaced, QVector<Page> *pages);
EditorError paginate(const QVector<VisualLine> &lines, int linesPerPage, bool doubleSpaced, QVector<Page> *pages);

// Index into `pages` of the page holding visual line `line`, or -1.
int pageIndexForLine(const QVector<Page> &pages, int line);

} // namespace Paginator
