#include "postscriptwriter.h"

#include <QDebug>
#include <QSaveFile>

namespace {

QByteArray number(double value)
{
    return QByteArray::number(value, 'f', 2);
}

QByteArray reencodedName(const QString &postScriptName)
{
    return postScriptName.toLatin1() + "-ISOLatin1";
}

QByteArray reencodeFont(const QString &postScriptName)
{
    QByteArray out;
    out += "/" + reencodedName(postScriptName) + " /" + postScriptName.toLatin1() + " findfont\n";
    out += "dup length dict begin\n";
    out += "  {1 index /FID ne {def} {pop pop} ifelse} forall\n";
    out += "  /Encoding ISOLatin1Encoding def\n";
    out += "  currentdict\n";
    out += "end\n";
    out += "definefont pop\n";
    return out;
}

} // namespace

namespace PostScriptWriter {

QByteArray escape(const QString &text)
{
    QByteArray out;
    out.reserve(text.size());
    for (const QChar ch : text) {
        const ushort code = ch.unicode();
        switch (code) {
        case '\\':
            out += "\\\\";
            break;
        case '(':
            out += "\\(";
            break;
        case ')':
            out += "\\)";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\b':
            out += "\\b";
            break;
        default:
            if (code < 128) {
                out += static_cast<char>(code);
            } else if (code < 256) {
                out += '\\';
                out += QByteArray::number(code, 8).rightJustified(3, '0');
            } else {
                out += '?';
            }
            break;
        }
    }
    return out;
}

QByteArray generate(const QVector<PageDescription> &pages, const FontConfig &font)
{
    const QByteArray regular = reencodedName(font.postScriptName());
    const QByteArray bold = reencodedName(font.postScriptBoldName());
    const QByteArray size = QByteArray::number(font.pointSize());
    const int widthPoints = qRound(font.pageWidthPoints());
    const int heightPoints = qRound(font.pageHeightPoints());

    QByteArray ps;
    ps += "%!PS-Adobe-3.0\n";
    ps += "%%Creator: platen\n";
    ps += "%%Pages: " + QByteArray::number(pages.size()) + "\n";
    ps += "%%PageOrder: Ascend\n";
    ps += "%%BoundingBox: 0 0 " + QByteArray::number(widthPoints) + " " + QByteArray::number(heightPoints) + "\n";
    ps += "%%DocumentNeededResources: font " + font.postScriptName().toLatin1() + "\n";
    ps += "%%+ font " + font.postScriptBoldName().toLatin1() + "\n";
    ps += "%%EndComments\n\n";

    ps += "%%BeginProlog\n";
    ps += reencodeFont(font.postScriptName());
    ps += reencodeFont(font.postScriptBoldName());
    ps += "/R { /" + regular + " findfont " + size + " scalefont setfont } def\n";
    ps += "/B { /" + bold + " findfont " + size + " scalefont setfont } def\n";
    // x y (text) U: show text with an underline 2 pt below the baseline.
    ps += "/U { 3 1 roll moveto currentpoint 3 -1 roll show currentpoint\n";
    ps += "     gsave newpath 2 sub moveto 2 sub lineto 0.6 setlinewidth stroke grestore } def\n";
    ps += "/S { 3 1 roll moveto show } def\n";
    ps += "%%EndProlog\n\n";

    for (const PageDescription &page : pages) {
        ps += "%%Page: " + QByteArray::number(page.pageNumber) + " " + QByteArray::number(page.pageNumber) + "\n";
        ps += "%%BeginPageSetup\n0 setgray\n%%EndPageSetup\n";

        if (!page.pageNumberText.isEmpty()) {
            ps += "R " + number(page.pageNumberPosition.x()) + " "
                  + number(page.pageSize.height() - page.pageNumberPosition.y())
                  + " (" + escape(page.pageNumberText) + ") S\n";
        }

        for (const TextRun &run : page.runs) {
            ps += run.style.testFlag(TextStyle::Bold) ? "B " : "R ";
            ps += number(run.position.x()) + " " + number(page.pageSize.height() - run.position.y());
            ps += " (" + escape(run.text) + ")";
            ps += run.style.testFlag(TextStyle::Underline) ? " U\n" : " S\n";
        }
        ps += "showpage\n";
    }

    ps += "%%Trailer\n%%EOF\n";
    return ps;
}

bool write(const QVector<PageDescription> &pages, const FontConfig &font, const QString &filePath)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[PostScriptWriter] Cannot open" << filePath << ":" << file.errorString();
        return false;
    }
    const QByteArray data = generate(pages, font);
    if (file.write(data) != data.size()) {
        qWarning() << "[PostScriptWriter] Short write to" << filePath << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qWarning() << "[PostScriptWriter] Commit failed for" << filePath << ":" << file.errorString();
        return false;
    }
    qDebug() << "[PostScriptWriter] Wrote" << pages.size() << "pages to" << filePath;
    return true;
}

} // namespace PostScriptWriter
