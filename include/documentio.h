#pragma once

class QString;
class DocumentEditor;

namespace DocumentIO {

// Overstrike-encoded files. Saving replaces the file atomically.
bool saveDocument(DocumentEditor *editor, const QString &filePath);
bool loadDocument(DocumentEditor *editor, const QString &filePath, int &paragraphCount);

} // namespace DocumentIO
