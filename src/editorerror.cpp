#include "editorerror.h"

#include <QDebug>

QString editorErrorString(EditorError error)
{
    switch (error) {
    case EditorError::None:
        return QStringLiteral("No error");
    case EditorError::OutOfRange:
        return QStringLiteral("Position or length outside the document");
    case EditorError::InvalidConfiguration:
        return QStringLiteral("Invalid layout configuration");
    case EditorError::NothingToUndo:
        return QStringLiteral("Nothing to undo");
    case EditorError::NothingToRedo:
        return QStringLiteral("Nothing to redo");
    case EditorError::NoMatch:
        return QStringLiteral("No match");
    case EditorError::FontLoadError:
        return QStringLiteral("Font could not be loaded");
    }
    return QStringLiteral("Unknown error");
}

QDebug operator<<(QDebug debug, EditorError error)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "EditorError(" << editorErrorString(error) << ")";
    return debug;
}
