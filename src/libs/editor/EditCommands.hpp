// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editor/EditCommand.hpp"
#include "editor/EditorGlobal.hpp"

#include "layoutmodel/Layout.hpp"

#include <optional>

namespace KeyView::Editor {

using LayoutModel::Element;
using LayoutModel::ElementGeometry;
using LayoutModel::ElementId;
using LayoutModel::Layout;

// Replaces an element's geometry with a full snapshot, so revert restores it exactly.
class EDITOR_EXPORT ChangeGeometryCommand final : public EditCommand
{
public:
    ChangeGeometryCommand(ElementId id, ElementGeometry before, ElementGeometry after,
                          QString name = QString());

    QString name() const override;
    bool apply(Layout& layout) override;
    bool revert(Layout& layout) override;

    ElementId elementId() const noexcept { return m_id; }

private:
    ElementId m_id = 0;
    ElementGeometry m_before;
    ElementGeometry m_after;
    QString m_name;
};

// Inserts an element. If its id is taken when first applied it gets Layout::nextFreeId();
// the assigned id is kept for redo.
class EDITOR_EXPORT AddElementCommand final : public EditCommand
{
public:
    explicit AddElementCommand(Element element, int index = -1);

    QString name() const override;
    bool apply(Layout& layout) override;
    bool revert(Layout& layout) override;

    std::optional<ElementId> assignedId() const { return m_assignedId; }

private:
    Element m_element;
    int m_index = -1; // -1 appends (topmost)
    std::optional<ElementId> m_assignedId;
    int m_insertedAt = -1;
};

class EDITOR_EXPORT RemoveElementCommand final : public EditCommand
{
public:
    explicit RemoveElementCommand(ElementId id);

    QString name() const override;
    bool apply(Layout& layout) override;
    bool revert(Layout& layout) override;

private:
    ElementId m_id = 0;
    std::optional<Element> m_removed;
    int m_index = -1;
};

// Swaps one element definition for another with the same id. Used for property edits.
class EDITOR_EXPORT ReplaceElementCommand final : public EditCommand
{
public:
    ReplaceElementCommand(Element before, Element after, QString name = QString());

    QString name() const override;
    bool apply(Layout& layout) override;
    bool revert(Layout& layout) override;

private:
    bool replace(Layout& layout, const Element& from, const Element& to);

    Element m_before;
    Element m_after;
    QString m_name;
};

} // namespace KeyView::Editor
