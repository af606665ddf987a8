// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editor/EditCommand.hpp"
#include "editor/EditorGlobal.hpp"

#include <memory>
#include <vector>

namespace KeyView::Editor {

// Linear undo history over one layout. Executing a new command drops the redo branch.
class EDITOR_EXPORT EditCommandManager final
{
public:
    explicit EditCommandManager(LayoutModel::Layout* layout);

    bool execute(std::unique_ptr<EditCommand> cmd);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    bool undo();
    bool redo();

    void clear();

    int undoCount() const noexcept { return static_cast<int>(m_undo.size()); }
    int redoCount() const noexcept { return static_cast<int>(m_redo.size()); }

    // Name of the command the next undo/redo would run; empty when there is none.
    QString undoName() const;
    QString redoName() const;

private:
    LayoutModel::Layout* m_layout = nullptr;
    std::vector<std::unique_ptr<EditCommand>> m_undo;
    std::vector<std::unique_ptr<EditCommand>> m_redo;
};

} // namespace KeyView::Editor
