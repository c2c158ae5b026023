#include "documenteditor_undo.h"

#include <QDebug>

namespace DocumentEditorUndo {

CompoundCommand::CompoundCommand(const QString &text) : QUndoCommand(text) {}

InsertTextCommand::InsertTextCommand(DocumentEditor *editor, int pos, const StyledText &text,
                                     DocumentEditor::UndoGroupType type, bool allowMerge,
                                     QUndoCommand *parent)
    : QUndoCommand(parent), m_editor(editor), m_pos(pos), m_text(text),
      m_type(type), m_allowMerge(allowMerge) {}

int InsertTextCommand::id() const { return 1; }

bool InsertTextCommand::mergeWith(const QUndoCommand *other)
{
    const auto *o = dynamic_cast<const InsertTextCommand *>(other);
    if (!o || !m_allowMerge || !o->m_allowMerge) {
        return false;
    }
    if (o->m_pos != m_pos + m_text.length()) {
        qDebug() << "[InsertTextCommand::mergeWith] Rejected: position" << o->m_pos
                 << "expected" << (m_pos + m_text.length());
        return false;
    }

    if (m_type == o->m_type) {
        m_text.append(o->m_text);
        return true;
    }

    // A space merges into the word typed after it; the result counts as a
    // word and no longer accepts whitespace.
    if (m_type == DocumentEditor::UndoGroupType::Whitespace
        && o->m_type == DocumentEditor::UndoGroupType::Word) {
        m_text.append(o->m_text);
        m_type = DocumentEditor::UndoGroupType::Word;
        return true;
    }

    return false;
}

void InsertTextCommand::redo()
{
    m_editor->replaceRange(m_pos, 0, m_text, m_pos + m_text.length());
}

void InsertTextCommand::undo()
{
    m_editor->replaceRange(m_pos, m_text.length(), StyledText(), m_pos);
}

DeleteTextCommand::DeleteTextCommand(DocumentEditor *editor, int pos, const StyledText &text,
                                     DocumentEditor::UndoGroupType type, bool allowMerge,
                                     bool backspace, QUndoCommand *parent)
    : QUndoCommand(parent), m_editor(editor), m_pos(pos), m_text(text),
      m_type(type), m_allowMerge(allowMerge), m_backspace(backspace) {}

int DeleteTextCommand::id() const { return 2; }

bool DeleteTextCommand::mergeWith(const QUndoCommand *other)
{
    const auto *o = dynamic_cast<const DeleteTextCommand *>(other);
    if (!o || !m_allowMerge || !o->m_allowMerge || m_type != o->m_type || m_backspace != o->m_backspace) {
        return false;
    }

    if (m_backspace) {
        if (o->m_pos + o->m_text.length() != m_pos) {
            return false;
        }
        StyledText merged = o->m_text;
        merged.append(m_text);
        m_text = merged;
        m_pos = o->m_pos;
        return true;
    }

    if (o->m_pos != m_pos) {
        return false;
    }
    m_text.append(o->m_text);
    return true;
}

void DeleteTextCommand::redo()
{
    m_editor->replaceRange(m_pos, m_text.length(), StyledText(), m_pos);
}

void DeleteTextCommand::undo()
{
    m_editor->replaceRange(m_pos, 0, m_text, m_pos + m_text.length());
}

AttributeCommand::AttributeCommand(DocumentEditor *editor, int pos, const StyledText &before,
                                   const StyledText &after, QUndoCommand *parent)
    : QUndoCommand(parent), m_editor(editor), m_pos(pos), m_before(before), m_after(after) {}

void AttributeCommand::redo()
{
    m_editor->replaceRange(m_pos, m_before.length(), m_after, m_pos + m_after.length());
}

void AttributeCommand::undo()
{
    m_editor->replaceRange(m_pos, m_after.length(), m_before, m_pos + m_before.length());
}

} // namespace DocumentEditorUndo
