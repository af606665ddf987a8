// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editor/ElementEdits.hpp"

#include "editor/EditCommands.hpp"

#include "layoutmodel/Geometry.hpp"

#include "utils/Macros.hpp"

#include <functional>
#include <utility>

namespace KeyView::Editor::ElementEdits {

using LayoutModel::CommonKeyDefinition;
using LayoutModel::Element;
using LayoutModel::ElementGeometry;
using LayoutModel::KeyboardKeyDefinition;

namespace Geometry = LayoutModel::Geometry;

namespace {

using GeometryEdit = std::function<bool(ElementGeometry&, const Element&)>;
using ElementEdit = std::function<bool(Element&)>;

std::unique_ptr<EditCommand> editGeometry(const Layout& layout, ElementId id, const QString& name,
                                          const GeometryEdit& edit)
{
    const Element* element = layout.findElement(id);
    KEYVIEW_GUARD_RET(element, nullptr);

    const ElementGeometry before = element->geometry();
    ElementGeometry after = before;
    if (!edit(after, *element) || after == before)
        return nullptr;
    return std::make_unique<ChangeGeometryCommand>(id, before, std::move(after), name);
}

std::unique_ptr<EditCommand> editElement(const Layout& layout, ElementId id, const QString& name,
                                         const ElementEdit& edit)
{
    const Element* element = layout.findElement(id);
    KEYVIEW_GUARD_RET(element, nullptr);

    Element after = *element;
    if (!edit(after) || after == *element)
        return nullptr;
    return std::make_unique<ReplaceElementCommand>(*element, std::move(after), name);
}

bool validVertex(const ElementGeometry& g, int index)
{
    return index >= 0 && index < g.boundaries.size();
}

} // namespace

std::unique_ptr<EditCommand> moveElement(const Layout& layout, ElementId id, const QPointF& delta, bool moveText)
{
    return editGeometry(layout, id, QStringLiteral("Move Element"),
                        [&](ElementGeometry& g, const Element& e) {
        Element moved = e;
        moved.setGeometry(g);
        moved.translate(delta, moveText);
        g = moved.geometry();
        return true;
    });
}

std::unique_ptr<EditCommand> setBoundaryVertex(const Layout& layout, ElementId id, int index, const QPointF& point)
{
    return editGeometry(layout, id, QStringLiteral("Move Vertex"),
                        [&](ElementGeometry& g, const Element& e) {
        if (!e.hasKeyCodes() || !validVertex(g, index))
            return false;
        g.boundaries[index] = point;
        return true;
    });
}

std::unique_ptr<EditCommand> addBoundaryVertex(const Layout& layout, ElementId id, const QPointF& point)
{
    return editGeometry(layout, id, QStringLiteral("Add Vertex"),
                        [&](ElementGeometry& g, const Element& e) {
        if (!e.hasKeyCodes())
            return false;
        g.boundaries.push_back(point);
        return true;
    });
}

std::unique_ptr<EditCommand> removeBoundaryVertex(const Layout& layout, ElementId id, int index)
{
    return editGeometry(layout, id, QStringLiteral("Remove Vertex"),
                        [&](ElementGeometry& g, const Element& e) {
        if (!e.hasKeyCodes() || !validVertex(g, index))
            return false;
        g.boundaries.removeAt(index);
        return true;
    });
}

std::unique_ptr<EditCommand> swapBoundaryVertices(const Layout& layout, ElementId id, int first, int second)
{
    return editGeometry(layout, id, QStringLiteral("Swap Vertices"),
                        [&](ElementGeometry& g, const Element& e) {
        if (!e.hasKeyCodes() || !validVertex(g, first) || !validVertex(g, second))
            return false;
        std::swap(g.boundaries[first], g.boundaries[second]);
        return true;
    });
}

std::unique_ptr<EditCommand> setTextPosition(const Layout& layout, ElementId id, const QPointF& point)
{
    return editGeometry(layout, id, QStringLiteral("Move Text"),
                        [&](ElementGeometry& g, const Element& e) {
        if (!e.hasKeyCodes())
            return false;
        g.textPosition = point;
        return true;
    });
}

std::unique_ptr<EditCommand> centerTextPosition(const Layout& layout, ElementId id)
{
    return editGeometry(layout, id, QStringLiteral("Center Text"),
                        [](ElementGeometry& g, const Element& e) {
        if (!e.hasKeyCodes() || g.boundaries.isEmpty())
            return false;
        g.textPosition = Geometry::boundingRect(g.boundaries).center();
        return true;
    });
}

std::unique_ptr<EditCommand> makeRectangle(const Layout& layout, ElementId id)
{
    return editGeometry(layout, id, QStringLiteral("Make Rectangle"),
                        [](ElementGeometry& g, const Element& e) {
        if (!e.hasKeyCodes() || g.boundaries.isEmpty())
            return false;
        g.boundaries = Geometry::rectangleVertices(Geometry::boundingRect(g.boundaries));
        return true;
    });
}

std::unique_ptr<EditCommand> setIndicatorLocation(const Layout& layout, ElementId id, const QPointF& location)
{
    return editGeometry(layout, id, QStringLiteral("Move Indicator"),
                        [&](ElementGeometry& g, const Element& e) {
        if (!e.indicator())
            return false;
        g.location = location;
        return true;
    });
}

std::unique_ptr<EditCommand> setIndicatorRadius(const Layout& layout, ElementId id, double radius)
{
    return editGeometry(layout, id, QStringLiteral("Resize Indicator"),
                        [&](ElementGeometry& g, const Element& e) {
        if (!e.indicator() || !(radius > 0.0))
            return false;
        g.radius = radius;
        return true;
    });
}

std::unique_ptr<EditCommand> setText(const Layout& layout, ElementId id, const QString& text)
{
    return editElement(layout, id, QStringLiteral("Set Text"), [&](Element& e) {
        CommonKeyDefinition* common = e.common();
        if (!common)
            return false;
        common->text = text;
        return true;
    });
}

std::unique_ptr<EditCommand> setShiftText(const Layout& layout, ElementId id, const QString& text)
{
    return editElement(layout, id, QStringLiteral("Set Shift Text"), [&](Element& e) {
        KeyboardKeyDefinition* key = e.keyboardKey();
        if (!key)
            return false;
        key->shiftText = text;
        return true;
    });
}

std::unique_ptr<EditCommand> setChangeOnCaps(const Layout& layout, ElementId id, bool changeOnCaps)
{
    return editElement(layout, id, QStringLiteral("Set Change On Caps"), [&](Element& e) {
        KeyboardKeyDefinition* key = e.keyboardKey();
        if (!key)
            return false;
        key->changeOnCaps = changeOnCaps;
        return true;
    });
}

std::unique_ptr<EditCommand> setKeyCodes(const Layout& layout, ElementId id, const QVector<KeyCode>& keyCodes)
{
    return editElement(layout, id, QStringLiteral("Set Key Codes"), [&](Element& e) {
        CommonKeyDefinition* common = e.common();
        if (!common)
            return false;
        common->keyCodes = keyCodes;
        return true;
    });
}

std::unique_ptr<EditCommand> addKeyCode(const Layout& layout, ElementId id, KeyCode code)
{
    return editElement(layout, id, QStringLiteral("Add Key Code"), [&](Element& e) {
        CommonKeyDefinition* common = e.common();
        if (!common || common->keyCodes.contains(code))
            return false;
        common->keyCodes.push_back(code);
        return true;
    });
}

std::unique_ptr<EditCommand> removeKeyCode(const Layout& layout, ElementId id, KeyCode code)
{
    return editElement(layout, id, QStringLiteral("Remove Key Code"), [&](Element& e) {
        CommonKeyDefinition* common = e.common();
        if (!common)
            return false;
        return common->keyCodes.removeAll(code) > 0;
    });
}

} // namespace KeyView::Editor::ElementEdits
