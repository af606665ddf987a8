// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editor/EditSession.hpp"

#include "editor/EditCommands.hpp"

#include "layoutmodel/Geometry.hpp"

#include "utils/Macros.hpp"

#include <algorithm>

namespace KeyView::Editor {

using LayoutModel::Element;
using LayoutModel::ElementGeometry;

namespace {

constexpr double kMinIndicatorRadius = 1.0;

QString gestureName(GrabKind kind)
{
    switch (kind) {
        case GrabKind::Body: return QStringLiteral("Move Element");
        case GrabKind::Vertex: return QStringLiteral("Move Vertex");
        case GrabKind::Edge: return QStringLiteral("Move Edge");
    }
    return QStringLiteral("Change Geometry");
}

} // namespace

EditSession::EditSession(LayoutModel::Layout* layout)
    : m_layout(layout)
    , m_commands(layout)
{}

std::optional<ElementId> EditSession::heldElement() const
{
    if (!m_drag || !m_drag->grab)
        return std::nullopt;
    return m_drag->grab->elementId;
}

std::optional<Grab> EditSession::activeGrab() const
{
    return m_drag ? m_drag->grab : std::nullopt;
}

void EditSession::select(std::optional<ElementId> id)
{
    if (id && (!m_layout || !m_layout->findElement(*id)))
        id.reset();
    m_selected = id;
}

void EditSession::pointerDown(const QPointF& point)
{
    KEYVIEW_GUARD(m_layout);
    if (m_drag)
        cancelGesture();

    Drag drag;
    drag.origin = point;

    // The selected element is drawn on top, so it wins hit tests under the cursor.
    if (m_selected) {
        if (const Element* selected = m_layout->findElement(*m_selected)) {
            const Grab grab = HitTester::grabOn(*selected, point, m_tolerances);
            if (grab.kind != GrabKind::Body || selected->contains(point))
                drag.grab = grab;
        }
    }
    if (!drag.grab)
        drag.grab = HitTester::grabAt(*m_layout, point, m_tolerances);

    if (drag.grab)
        drag.before = m_layout->findElement(drag.grab->elementId)->geometry();
    m_drag = drag;
}

void EditSession::pointerMove(const QPointF& point)
{
    KEYVIEW_GUARD(m_layout);
    if (!m_drag) {
        m_hovered = HitTester::elementAt(*m_layout, point);
        return;
    }
    applyDrag(point);
}

void EditSession::applyDrag(const QPointF& point)
{
    if (!m_drag->grab)
        return;
    Element* element = m_layout->findElement(m_drag->grab->elementId);
    if (!element)
        return;

    const QPointF offset = point - m_drag->origin;
    element->setGeometry(m_drag->before);

    switch (m_drag->grab->kind) {
        case GrabKind::Body:
            element->translate(offset, m_moveTextWithBody);
            break;
        case GrabKind::Vertex:
            element->translateVertex(m_drag->grab->index, offset);
            break;
        case GrabKind::Edge:
            if (auto* indicator = element->indicator()) {
                indicator->radius = std::max(kMinIndicatorRadius,
                                             LayoutModel::Geometry::distance(point, indicator->location));
            } else {
                element->translateFace(m_drag->grab->index, offset);
            }
            break;
    }
    m_drag->moved = m_drag->moved || offset != QPointF();
}

void EditSession::pointerUp(const QPointF& point)
{
    KEYVIEW_GUARD(m_layout && m_drag);

    applyDrag(point);
    const Drag drag = *m_drag;
    m_drag.reset();

    if (!drag.grab) {
        m_selected.reset();
        m_hovered = HitTester::elementAt(*m_layout, point);
        return;
    }

    const Element* element = m_layout->findElement(drag.grab->elementId);
    if (!element)
        return;

    const ElementGeometry after = element->geometry();
    if (drag.moved && after != drag.before) {
        auto cmd = std::make_unique<ChangeGeometryCommand>(drag.grab->elementId, drag.before, after,
                                                           gestureName(drag.grab->kind));
        if (!m_commands.execute(std::move(cmd)))
            qCWarning(editorlog) << "Could not commit drag of element" << drag.grab->elementId;
    }
    m_selected = drag.grab->elementId;
    m_hovered = HitTester::elementAt(*m_layout, point);
}

bool EditSession::cancelGesture()
{
    if (!m_drag)
        return false;
    if (m_drag->grab && m_layout) {
        if (Element* element = m_layout->findElement(m_drag->grab->elementId))
            element->setGeometry(m_drag->before);
    }
    m_drag.reset();
    return true;
}

bool EditSession::execute(std::unique_ptr<EditCommand> cmd)
{
    cancelGesture();
    const bool ok = m_commands.execute(std::move(cmd));
    dropStaleIds();
    return ok;
}

bool EditSession::undo()
{
    cancelGesture();
    const bool ok = m_commands.undo();
    dropStaleIds();
    return ok;
}

bool EditSession::redo()
{
    cancelGesture();
    const bool ok = m_commands.redo();
    dropStaleIds();
    return ok;
}

void EditSession::reset()
{
    m_drag.reset();
    m_commands.clear();
    m_hovered.reset();
    m_selected.reset();
}

void EditSession::dropStaleIds()
{
    KEYVIEW_GUARD(m_layout);
    if (m_selected && !m_layout->findElement(*m_selected))
        m_selected.reset();
    if (m_hovered && !m_layout->findElement(*m_hovered))
        m_hovered.reset();
}

} // namespace KeyView::Editor
