// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editor/EditCommandManager.hpp"

#include <utility>

Q_LOGGING_CATEGORY(editorlog, "keyview.editor")

namespace KeyView::Editor {

EditCommandManager::EditCommandManager(LayoutModel::Layout* layout)
    : m_layout(layout)
{}

bool EditCommandManager::execute(std::unique_ptr<EditCommand> cmd)
{
    if (!m_layout || !cmd)
        return false;

    if (!cmd->apply(*m_layout)) {
        qCDebug(editorlog) << "Command" << cmd->name() << "did not apply";
        return false;
    }

    m_undo.emplace_back(std::move(cmd));
    m_redo.clear();
    return true;
}

bool EditCommandManager::canUndo() const noexcept { return !m_undo.empty(); }
bool EditCommandManager::canRedo() const noexcept { return !m_redo.empty(); }

bool EditCommandManager::undo()
{
    if (!m_layout || m_undo.empty())
        return false;

    if (!m_undo.back()->revert(*m_layout)) {
        qCWarning(editorlog) << "Undo of" << m_undo.back()->name() << "failed";
        return false;
    }

    m_redo.emplace_back(std::move(m_undo.back()));
    m_undo.pop_back();
    return true;
}

bool EditCommandManager::redo()
{
    if (!m_layout || m_redo.empty())
        return false;

    if (!m_redo.back()->apply(*m_layout)) {
        qCWarning(editorlog) << "Redo of" << m_redo.back()->name() << "failed";
        return false;
    }

    m_undo.emplace_back(std::move(m_redo.back()));
    m_redo.pop_back();
    return true;
}

void EditCommandManager::clear()
{
    m_undo.clear();
    m_redo.clear();
}

QString EditCommandManager::undoName() const
{
    return m_undo.empty() ? QString() : m_undo.back()->name();
}

QString EditCommandManager::redoName() const
{
    return m_redo.empty() ? QString() : m_redo.back()->name();
}

} // namespace KeyView::Editor
