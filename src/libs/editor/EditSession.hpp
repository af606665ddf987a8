// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editor/EditCommandManager.hpp"
#include "editor/EditorGlobal.hpp"
#include "editor/HitTester.hpp"

#include "layoutmodel/Layout.hpp"

#include <QtCore/QPointF>

#include <memory>
#include <optional>

namespace KeyView::Editor {

// Pointer-driven geometry editing over a layout owned elsewhere. A drag mutates the layout
// live; releasing the pointer commits one undoable command for the whole gesture.
class EDITOR_EXPORT EditSession final
{
public:
    explicit EditSession(LayoutModel::Layout* layout);

    void setTolerances(const GrabTolerances& tolerances) { m_tolerances = tolerances; }
    void setMoveTextWithBody(bool move) { m_moveTextWithBody = move; }

    void pointerDown(const QPointF& point);
    void pointerMove(const QPointF& point);
    void pointerUp(const QPointF& point);

    // Restores the geometry from before the active drag. Returns false when idle.
    bool cancelGesture();

    bool isDragging() const noexcept { return m_drag.has_value(); }
    std::optional<ElementId> hoveredElement() const { return m_hovered; }
    std::optional<ElementId> heldElement() const;
    std::optional<ElementId> selectedElement() const { return m_selected; }
    std::optional<Grab> activeGrab() const;

    void select(std::optional<ElementId> id);

    bool execute(std::unique_ptr<EditCommand> cmd);
    bool undo();
    bool redo();

    EditCommandManager& commands() noexcept { return m_commands; }
    const EditCommandManager& commands() const noexcept { return m_commands; }

    // The layout was replaced: history, selection and any gesture are dropped.
    void reset();

private:
    struct Drag {
        QPointF origin;
        std::optional<Grab> grab; // empty when the press hit nothing
        LayoutModel::ElementGeometry before;
        bool moved = false;
    };

    void applyDrag(const QPointF& point);
    void dropStaleIds();

    LayoutModel::Layout* m_layout = nullptr;
    EditCommandManager m_commands;
    GrabTolerances m_tolerances;
    bool m_moveTextWithBody = true;

    std::optional<ElementId> m_hovered;
    std::optional<ElementId> m_selected;
    std::optional<Drag> m_drag;
};

} // namespace KeyView::Editor
