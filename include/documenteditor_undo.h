#pragma once

#include "documenteditor.h"
#include "styledtext.h"

#include <QUndoCommand>

namespace DocumentEditorUndo {

class CompoundCommand : public QUndoCommand {
public:
    explicit CompoundCommand(const QString &text = QString());
};

class InsertTextCommand : public QUndoCommand {
public:
    InsertTextCommand(DocumentEditor *editor, int pos, const StyledText &text,
                      DocumentEditor::UndoGroupType type, bool allowMerge,
                      QUndoCommand *parent = nullptr);

    int id() const override;
    bool mergeWith(const QUndoCommand *other) override;
    void redo() override;
    void undo() override;

private:
    DocumentEditor *m_editor;
    int m_pos;
    StyledText m_text;
    DocumentEditor::UndoGroupType m_type;
    bool m_allowMerge;
};

class DeleteTextCommand : public QUndoCommand {
public:
    DeleteTextCommand(DocumentEditor *editor, int pos, const StyledText &text,
                      DocumentEditor::UndoGroupType type, bool allowMerge,
                      bool backspace, QUndoCommand *parent = nullptr);

    int id() const override;
    bool mergeWith(const QUndoCommand *other) override;
    void redo() override;
    void undo() override;

private:
    DocumentEditor *m_editor;
    int m_pos;
    StyledText m_text;
    DocumentEditor::UndoGroupType m_type;
    bool m_allowMerge;
    bool m_backspace;
};

// Replaces a range with text of the same length, used for attribute changes.
// Recorded as the text before and after so undo restores attributes exactly.
class AttributeCommand : public QUndoCommand {
public:
    AttributeCommand(DocumentEditor *editor, int pos, const StyledText &before, const StyledText &after,
                     QUndoCommand *parent = nullptr);

    void redo() override;
    void undo() override;

private:
    DocumentEditor *m_editor;
    int m_pos;
    StyledText m_before;
    StyledText m_after;
};

} // namespace DocumentEditorUndo
