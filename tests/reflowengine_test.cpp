#include <QTest>
#include <QObject>
#include <QDebug>
#include <QRandomGenerator>
#include "reflowengine.h"

class ReflowEngineTests : public QObject {
    Q_OBJECT

private:
    QVector<VisualLine> layout(const QString &text, int width) {
        QVector<VisualLine> lines;
        const EditorError error = ReflowEngine::reflow(text, width, &lines);
        Q_UNUSED(error);
        return lines;
    }

    QString lineText(const QString &text, const VisualLine &line) {
        return text.mid(line.start, line.length);
    }

    QString randomText(QRandomGenerator &rng, int length) {
        static const QStringList pieces = {
            "a", "bb", "word", "longerword", " ", " ", "  ", "\n", "- ", "12. ", "x,y"
        };
        QString text;
        while (text.size() < length) {
            text += pieces.at(rng.bounded(static_cast<int>(pieces.size())));
        }
        return text;
    }

    // Lines must tile the text: within a paragraph each line starts where the
    // previous one ended, and paragraphs are separated by exactly one '\n'.
    void verifyLossless(const QString &text, const QVector<VisualLine> &lines, int width) {
        QVERIFY(!lines.isEmpty());
        QCOMPARE(lines.first().start, 0);
        QCOMPARE(lines.last().end, static_cast<int>(text.size()));

        QString rebuilt;
        for (int i = 0; i < lines.size(); ++i) {
            const VisualLine &line = lines.at(i);
            QVERIFY2(line.width <= width,
                     QString("line %1 has width %2 > %3").arg(i).arg(line.width).arg(width).toUtf8().constData());
            QVERIFY(line.end == line.start + line.length || line.end == line.start + line.length + 1);
            if (line.lastInParagraph) {
                QCOMPARE(line.end, line.start + line.length);
            }
            if (i > 0) {
                const VisualLine &previous = lines.at(i - 1);
                if (previous.lastInParagraph) {
                    QCOMPARE(line.start, previous.end + 1);
                    QCOMPARE(text.at(previous.end), QChar('\n'));
                    QCOMPARE(line.paragraph, previous.paragraph + 1);
                } else {
                    QCOMPARE(line.start, previous.end);
                    QCOMPARE(line.paragraph, previous.paragraph);
                }
                if (previous.lastInParagraph) {
                    rebuilt += QChar('\n');
                }
            }
            rebuilt += text.mid(line.start, line.end - line.start);
        }
        QCOMPARE(rebuilt, text);
    }

private slots:
    void wrapsAtWhitespace() {
        const QString text = "The quick brown fox";
        const QVector<VisualLine> lines = layout(text, 10);

        QCOMPARE(lines.size(), 2);
        QCOMPARE(lineText(text, lines.at(0)), QString("The quick"));
        QCOMPARE(lineText(text, lines.at(1)), QString("brown fox"));
        QCOMPARE(lines.at(0).start, 0);
        QCOMPARE(lines.at(0).end, 10);
        QCOMPARE(lines.at(1).start, 10);
        QCOMPARE(lines.at(1).end, 19);
        QVERIFY(!lines.at(0).lastInParagraph);
        QVERIFY(lines.at(1).lastInParagraph);
    }

    void hardBreaksOverlongWord() {
        const QString text = "Supercalifragilisticexpialidocious";
        const QVector<VisualLine> lines = layout(text, 10);

        QCOMPARE(lines.size(), 4);
        QCOMPARE(lines.at(0).length, 10);
        QCOMPARE(lines.at(1).length, 10);
        QCOMPARE(lines.at(2).length, 10);
        QCOMPARE(lines.at(3).length, 4);
        QCOMPARE(lineText(text, lines.at(0)), QString("Supercalif"));
        QCOMPARE(lineText(text, lines.at(3)), QString("ious"));
    }

    void exactWidthWordLeavesEmptyContinuation() {
        const QVector<VisualLine> lines = layout("abcde", 5);

        QCOMPARE(lines.size(), 2);
        QCOMPARE(lines.at(0).length, 5);
        QCOMPARE(lines.at(1).start, 5);
        QCOMPARE(lines.at(1).length, 0);
    }

    void emptyTextAndEmptyParagraphsGetOneLine() {
        QVector<VisualLine> lines = layout(QString(), 65);
        QCOMPARE(lines.size(), 1);
        QCOMPARE(lines.at(0), VisualLine());

        lines = layout("a\n\nb", 65);
        QCOMPARE(lines.size(), 3);
        QCOMPARE(lines.at(1).start, 2);
        QCOMPARE(lines.at(1).length, 0);
        QCOMPARE(lines.at(2).paragraph, 2);
    }

    void listItemsGetHangingIndent() {
        const QString text = "- alpha beta gamma delta";
        const QVector<VisualLine> lines = layout(text, 12);

        QCOMPARE(lines.size(), 4);
        QCOMPARE(lines.at(0).indent, 0);
        QCOMPARE(lineText(text, lines.at(0)), QString("- alpha"));
        QCOMPARE(lines.at(1).start, 8);
        QCOMPARE(lines.at(1).indent, 2);
        QCOMPARE(lines.at(1).width, 6);
        QCOMPARE(lineText(text, lines.at(1)), QString("beta"));
        for (const VisualLine &line : lines) {
            QVERIFY(line.width <= 12);
        }
    }

    void hangingIndentWidthRecognizesMarkers() {
        QCOMPARE(ReflowEngine::hangingIndentWidth(u"12. item"), 4);
        QCOMPARE(ReflowEngine::hangingIndentWidth(u"3) item"), 3);
        QCOMPARE(ReflowEngine::hangingIndentWidth(u"  * x"), 4);
        QCOMPARE(ReflowEngine::hangingIndentWidth(u"-x"), 0);
        QCOMPARE(ReflowEngine::hangingIndentWidth(u"1.5 apples"), 0);
        QCOMPARE(ReflowEngine::hangingIndentWidth(u"plain text"), 0);
    }

    void rejectsNonPositiveWidth() {
        QVector<VisualLine> lines;
        QCOMPARE(ReflowEngine::reflow("abc", 0, &lines), EditorError::InvalidConfiguration);
        QCOMPARE(ReflowEngine::reflow("abc", -3, &lines), EditorError::InvalidConfiguration);

        ReflowEngine engine(10);
        QCOMPARE(engine.setWidth(0), EditorError::InvalidConfiguration);
        QCOMPARE(engine.width(), 10);
    }

    void randomTextIsLosslessAndWidthBound() {
        QRandomGenerator rng(1337);
        for (int round = 0; round < 150; ++round) {
            const QString text = randomText(rng, rng.bounded(200));
            const int width = 1 + rng.bounded(40);
            const QVector<VisualLine> lines = layout(text, width);
            verifyLossless(text, lines, width);
            if (QTest::currentTestFailed()) {
                qWarning() << "Failed for width" << width << "text" << text;
                return;
            }
        }
    }

    void onlyEditedParagraphsRelayout() {
        QString text = "first paragraph\nsecond one here\nthird";
        ReflowEngine engine(10);
        QCOMPARE(engine.reflow(text), EditorError::None);
        QCOMPARE(engine.relayoutCount(), 3);

        text.insert(20, "X");
        engine.invalidate(text, 20, 0, 1);
        QCOMPARE(engine.lines(text), layout(text, 10));
        QCOMPARE(engine.relayoutCount(), 4);

        // Asking again without an edit lays out nothing.
        engine.lines(text);
        QCOMPARE(engine.relayoutCount(), 4);

        // Joining two paragraphs relayouts the merged one only.
        const int newline = text.indexOf('\n');
        text.remove(newline, 1);
        engine.invalidate(text, newline, 1, 0);
        QCOMPARE(engine.lines(text), layout(text, 10));
        QCOMPARE(engine.relayoutCount(), 5);

        QCOMPARE(engine.setWidth(20), EditorError::None);
        QCOMPARE(engine.lines(text), layout(text, 20));
        QCOMPARE(engine.relayoutCount(), 7);
    }

    void incrementalLayoutMatchesFullLayout() {
        QRandomGenerator rng(99);
        QString text = randomText(rng, 120);
        ReflowEngine engine(12);
        engine.reflow(text);

        for (int step = 0; step < 300; ++step) {
            const int pos = rng.bounded(static_cast<int>(text.size()) + 1);
            const int removed = qMin(static_cast<int>(text.size()) - pos, static_cast<int>(rng.bounded(6)));
            const QString inserted = rng.bounded(3) == 0 ? QString() : randomText(rng, rng.bounded(8));
            text.replace(pos, removed, inserted);
            engine.invalidate(text, pos, removed, inserted.size());

            if (step % 7 == 0) {
                QVERIFY2(engine.lines(text) == layout(text, 12),
                         QString("incremental layout diverged at step %1").arg(step).toUtf8().constData());
            }
        }
        QVERIFY(engine.lines(text) == layout(text, 12));
    }
};

QTEST_MAIN(ReflowEngineTests)
#include "reflowengine_test.moc"
