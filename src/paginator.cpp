#include "paginator.h"

#include <QDebug>

bool Page::operator==(const Page &other) const
{
    return number == other.number && firstLine == other.firstLine
        && lineCount == other.lineCount && breaksBefore == other.breaksBefore;
}

namespace Paginator {

int effectiveLinesPerPage(int linesPerPage, bool doubleSpaced)
{
    return doubleSpaced ? linesPerPage / 2 : linesPerPage;
}

EditorError paginate(int lineCount, int linesPerPage, bool doubleSpaced, QVector<Page> *pages)
{
    const int capacity = effectiveLinesPerPage(linesPerPage, doubleSpaced);
    if (capacity <= 0 || lineCount < 0) {
        qWarning() << "[Paginator] Invalid configuration: linesPerPage=" << linesPerPage
                   << "doubleSpaced=" << doubleSpaced << "lineCount=" << lineCount;
        return EditorError::InvalidConfiguration;
    }
    if (!pages) {
        return EditorError::None;
    }

    pages->clear();
    pages->reserve((lineCount + capacity - 1) / capacity);
    for (int first = 0; first < lineCount; first += capacity) {
        Page page;
        page.number = pages->size() + 1;
        page.firstLine = first;
        page.lineCount = qMin(capacity, lineCount - first);
        page.breaksBefore = page.number > 1;
        pages->append(page);
    }
    return EditorError::None;
}

EditorError paginate(const QVector<VisualLine> &lines, int linesPerPage, bool doubleSpaced, QVector<Page> *pages)
{
    return paginate(static_cast<int>(lines.size()), linesPerPage, doubleSpaced, pages);
}

int pageIndexForLine(const QVector<Page> &pages, int line)
{
    for (int i = 0; i < pages.size(); ++i) {
        if (line >= pages.at(i).firstLine && line < pages.at(i).endLine()) {
            return i;
        }
    }
    return -1;
}

} // namespace Paginator
