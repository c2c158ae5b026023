#include <QObject>
#include <QTest>

#include "documenteditor.h"
#include "searchengine.h"

class SearchEngineTests : public QObject {
    Q_OBJECT

private:
    int searchAt(const QString &text, const QString &query, int from,
                 SearchDirection direction = SearchDirection::Forward) {
        int match = -1;
        if (SearchEngine::search(text, query, from, direction, &match) != EditorError::None) {
            return -1;
        }
        return match;
    }

private slots:
    void findsSuccessiveOccurrencesAndWraps() {
        const QString text = "the fox jumps, the fox runs";

        QCOMPARE(searchAt(text, "fox", 0), 4);
        QCOMPARE(searchAt(text, "fox", 5), 19);
        QCOMPARE(searchAt(text, "fox", 20), 4);
        QCOMPARE(searchAt(text, "fox", static_cast<int>(text.size())), 4);
    }

    void backwardSearchFindsMatchesBeforeOffset() {
        const QString text = "the fox jumps, the fox runs";

        QCOMPARE(searchAt(text, "fox", 19, SearchDirection::Backward), 4);
        QCOMPARE(searchAt(text, "fox", 4, SearchDirection::Backward), 19);
        QCOMPARE(searchAt(text, "fox", 0, SearchDirection::Backward), 19);
    }

    void searchIsCaseInsensitiveByDefault() {
        QCOMPARE(searchAt("Hello world\nhello again\nHELLO there", "hello", 1), 12);
        QCOMPARE(searchAt("Hello world", "WORLD", 0), 6);
    }

    void missingQueryReportsNoMatch() {
        int match = 42;
        QCOMPARE(SearchEngine::search("abc", "x", 0, SearchDirection::Forward, &match), EditorError::NoMatch);
        QCOMPARE(SearchEngine::search("abc", QString(), 0, SearchDirection::Forward, &match), EditorError::NoMatch);
        QCOMPARE(SearchEngine::search("ab", "abc", 0, SearchDirection::Forward, &match), EditorError::NoMatch);
        QCOMPARE(SearchEngine::search(QString(), "a", 0, SearchDirection::Backward, &match), EditorError::NoMatch);
        QCOMPARE(match, 42);
    }

    void findAllHonorsCaseSensitivityAndWholeWord() {
        const QString text = "he HE hero the\nHE";
        SearchOptions options;
        QCOMPARE(SearchEngine::findAll(text, "he", options).size(), 5);

        options.caseSensitive = true;
        QCOMPARE(SearchEngine::findAll(text, "he", options).size(), 3);

        options.wholeWord = true;
        QCOMPARE(SearchEngine::findAll(text, "he", options).size(), 1);

        options.caseSensitive = false;
        QCOMPARE(SearchEngine::findAll(text, "he", options).size(), 3);

        QCOMPARE(searchAt(text, "he", 1), 3);
    }

    void findAllReturnsNonOverlappingMatches() {
        const QVector<SearchMatch> matches = SearchEngine::findAll("aaaa", "aa");
        QCOMPARE(matches.size(), 2);
        QCOMPARE(matches.at(0).start, 0);
        QCOMPARE(matches.at(1).start, 2);
        QCOMPARE(matches.at(1).length, 2);
        QVERIFY(SearchEngine::findAll("aaaa", QString()).isEmpty());
    }

    void editorFindSelectsMatches() {
        DocumentEditor editor;
        editor.load("alpha beta alpha gamma alpha");
        QCOMPARE(editor.matchCount("alpha"), 3);

        QCOMPARE(editor.find("alpha"), EditorError::None);
        QVERIFY(editor.hasSelection());
        QCOMPARE(editor.selectionStart(), 0);
        QCOMPARE(editor.selectionEnd(), 5);

        QCOMPARE(editor.find("alpha"), EditorError::None);
        QCOMPARE(editor.selectionStart(), 11);

        QCOMPARE(editor.find("alpha"), EditorError::None);
        QCOMPARE(editor.selectionStart(), 23);

        QCOMPARE(editor.find("alpha"), EditorError::None);
        QCOMPARE(editor.selectionStart(), 0);

        QCOMPARE(editor.find("alpha", SearchDirection::Backward), EditorError::None);
        QCOMPARE(editor.selectionStart(), 23);
        QCOMPARE(editor.find("alpha", SearchDirection::Backward), EditorError::None);
        QCOMPARE(editor.selectionStart(), 11);

        QCOMPARE(editor.find("delta"), EditorError::NoMatch);
        QCOMPARE(editor.selectionStart(), 11);
        QCOMPARE(editor.selectedText().text, QString("alpha"));
    }

    void incrementalQueryNarrowsMatches() {
        DocumentEditor editor;
        editor.load("cat catalog category cab");

        QCOMPARE(editor.matchCount("c"), 4);
        QCOMPARE(editor.matchCount("ca"), 4);
        QCOMPARE(editor.matchCount("cat"), 3);
        QCOMPARE(editor.matchCount("cate"), 1);
        QCOMPARE(editor.matchCount("cat"), 3);
    }
};

QTEST_MAIN(SearchEngineTests)
#include "searchengine_test.moc"
