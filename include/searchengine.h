#pragma once

#include "editorerror.h"

#include <QString>
#include <QVector>

enum class SearchDirection {
    Forward,
    Backward
};

struct SearchOptions {
    bool caseSensitive = false;
    bool wholeWord = false;
};

struct SearchMatch {
    int start = 0;
    int length = 0;
};

namespace SearchEngine {

// Next match of `query` from `fromOffset`, wrapping around the end of `text`
// once. Forward finds matches starting at or after fromOffset; backward finds
// matches starting before it.
EditorError search(const QString &text, const QString &query, int fromOffset,
                   SearchDirection direction, int *matchOffset,
                   const SearchOptions &options = SearchOptions());

// All non-overlapping matches in document order.
QVector<SearchMatch> findAll(const QString &text, const QString &query,
                             const SearchOptions &options = SearchOptions());

} // namespace SearchEngine
