#include "documentio.h"

#include "documenteditor.h"

#include <QDebug>
#include <QFile>
#include <QSaveFile>

namespace DocumentIO {

bool saveDocument(DocumentEditor *editor, const QString &filePath)
{
    if (!editor) {
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[DocumentIO] Cannot open" << filePath << "for writing:" << file.errorString();
        return false;
    }

    const QByteArray data = editor->save();
    if (file.write(data) != data.size()) {
        qWarning() << "[DocumentIO] Write to" << filePath << "failed:" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qWarning() << "[DocumentIO] Commit of" << filePath << "failed:" << file.errorString();
        return false;
    }
    return true;
}

bool loadDocument(DocumentEditor *editor, const QString &filePath, int &paragraphCount)
{
    if (!editor) {
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[DocumentIO] Cannot open" << filePath << ":" << file.errorString();
        return false;
    }

    const QByteArray data = file.readAll();
    file.close();

    editor->load(data);
    paragraphCount = editor->buffer().paragraphCount();
    return true;
}

} // namespace DocumentIO
