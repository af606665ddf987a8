// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editor/EditCommands.hpp"

#include <algorithm>
#include <utility>

namespace KeyView::Editor {

ChangeGeometryCommand::ChangeGeometryCommand(ElementId id, ElementGeometry before, ElementGeometry after,
                                             QString name)
    : m_id(id)
    , m_before(std::move(before))
    , m_after(std::move(after))
    , m_name(std::move(name))
{}

QString ChangeGeometryCommand::name() const
{
    return m_name.isEmpty() ? QStringLiteral("Change Geometry") : m_name;
}

bool ChangeGeometryCommand::apply(Layout& layout)
{
    Element* element = layout.findElement(m_id);
    if (!element)
        return false;
    element->setGeometry(m_after);
    return true;
}

bool ChangeGeometryCommand::revert(Layout& layout)
{
    Element* element = layout.findElement(m_id);
    if (!element)
        return false;
    element->setGeometry(m_before);
    return true;
}

AddElementCommand::AddElementCommand(Element element, int index)
    : m_element(std::move(element))
    , m_index(index)
{}

QString AddElementCommand::name() const
{
    return QStringLiteral("Add Element");
}

bool AddElementCommand::apply(Layout& layout)
{
    if (!m_assignedId) {
        if (layout.findElement(m_element.id()))
            m_element.setId(layout.nextFreeId());
        m_assignedId = m_element.id();
    } else if (layout.findElement(*m_assignedId)) {
        return false;
    }

    const int size = layout.elements.size();
    m_insertedAt = (m_index < 0 || m_index > size) ? size : m_index;
    layout.elements.insert(m_insertedAt, m_element);
    return true;
}

bool AddElementCommand::revert(Layout& layout)
{
    if (!m_assignedId)
        return false;
    const int index = layout.indexOf(*m_assignedId);
    if (index < 0)
        return false;
    layout.elements.removeAt(index);
    return true;
}

RemoveElementCommand::RemoveElementCommand(ElementId id)
    : m_id(id)
{}

QString RemoveElementCommand::name() const
{
    return QStringLiteral("Remove Element");
}

bool RemoveElementCommand::apply(Layout& layout)
{
    const int index = layout.indexOf(m_id);
    if (index < 0)
        return false;
    m_removed = layout.elements.at(index);
    m_index = index;
    layout.elements.removeAt(index);
    return true;
}

bool RemoveElementCommand::revert(Layout& layout)
{
    if (!m_removed || layout.findElement(m_id))
        return false;
    const int index = std::clamp(m_index, 0, int(layout.elements.size()));
    layout.elements.insert(index, *m_removed);
    return true;
}

ReplaceElementCommand::ReplaceElementCommand(Element before, Element after, QString name)
    : m_before(std::move(before))
    , m_after(std::move(after))
    , m_name(std::move(name))
{}

QString ReplaceElementCommand::name() const
{
    return m_name.isEmpty() ? QStringLiteral("Edit Element") : m_name;
}

bool ReplaceElementCommand::replace(Layout& layout, const Element& from, const Element& to)
{
    if (from.id() != to.id())
        return false;
    Element* element = layout.findElement(from.id());
    if (!element)
        return false;
    *element = to;
    return true;
}

bool ReplaceElementCommand::apply(Layout& layout)
{
    return replace(layout, m_before, m_after);
}

bool ReplaceElementCommand::revert(Layout& layout)
{
    return replace(layout, m_after, m_before);
}

} // namespace KeyView::Editor
