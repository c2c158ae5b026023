#include "searchengine.h"

#include "cursormodel.h"

namespace {

bool isWordChar(const QString &text, int pos)
{
    return pos >= 0 && pos < text.size()
        && CursorModel::classify(text.at(pos)) == CursorModel::CharClass::Word;
}

bool acceptMatch(const QString &text, int start, int length, const SearchOptions &options)
{
    if (!options.wholeWord) {
        return true;
    }
    return !isWordChar(text, start - 1) && !isWordChar(text, start + length);
}

Qt::CaseSensitivity sensitivity(const SearchOptions &options)
{
    return options.caseSensitive ? Qt::CaseSensitive : Qt::CaseInsensitive;
}

// First accepted match starting in [from, limit).
int scanForward(const QString &text, const QString &query, int from, int limit, const SearchOptions &options)
{
    int pos = text.indexOf(query, from, sensitivity(options));
    while (pos >= 0 && pos < limit) {
        if (acceptMatch(text, pos, query.size(), options)) {
            return pos;
        }
        pos = text.indexOf(query, pos + 1, sensitivity(options));
    }
    return -1;
}

// Last accepted match starting in [limit, from].
int scanBackward(const QString &text, const QString &query, int from, int limit, const SearchOptions &options)
{
    if (from < 0) {
        return -1;
    }
    int pos = text.lastIndexOf(query, from, sensitivity(options));
    while (pos >= limit && pos >= 0) {
        if (acceptMatch(text, pos, query.size(), options)) {
            return pos;
        }
        if (pos == 0) {
            break;
        }
        pos = text.lastIndexOf(query, pos - 1, sensitivity(options));
    }
    return -1;
}

} // namespace

namespace SearchEngine {

EditorError search(const QString &text, const QString &query, int fromOffset,
                   SearchDirection direction, int *matchOffset, const SearchOptions &options)
{
    if (query.isEmpty() || query.size() > text.size()) {
        return EditorError::NoMatch;
    }

    const int from = qBound(0, fromOffset, static_cast<int>(text.size()));
    int found = -1;
    if (direction == SearchDirection::Forward) {
        found = scanForward(text, query, from, text.size(), options);
        if (found < 0) {
            found = scanForward(text, query, 0, from, options);
        }
    } else {
        found = scanBackward(text, query, from - 1, 0, options);
        if (found < 0) {
            found = scanBackward(text, query, text.size() - 1, from, options);
        }
    }

    if (found < 0) {
        return EditorError::NoMatch;
    }
    if (matchOffset) {
        *matchOffset = found;
    }
    return EditorError::None;
}

QVector<SearchMatch> findAll(const QString &text, const QString &query, const SearchOptions &options)
{
    QVector<SearchMatch> matches;
    if (query.isEmpty()) {
        return matches;
    }
    int pos = scanForward(text, query, 0, text.size(), options);
    while (pos >= 0) {
        SearchMatch match;
        match.start = pos;
        match.length = query.size();
        matches.append(match);
        pos = scanForward(text, query, pos + query.size(), text.size(), options);
    }
    return matches;
}

} // namespace SearchEngine
