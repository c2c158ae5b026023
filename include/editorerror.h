#pragma once

#include <QString>

class QDebug;

// Status codes returned by core operations. None means success.
enum class EditorError {
    None = 0,
    OutOfRange,
    InvalidConfiguration,
    NothingToUndo,
    NothingToRedo,
    NoMatch,
    FontLoadError
};

QString editorErrorString(EditorError error);
QDebug operator<<(QDebug debug, EditorError error);
