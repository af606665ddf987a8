// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editor/EditCommand.hpp"
#include "editor/EditorGlobal.hpp"

#include "layoutmodel/Layout.hpp"

#include <QtCore/QPointF>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <memory>

// Builders for the edits offered by the element properties panel. Each returns a ready
// command against the current layout, or null when the edit does not apply to the element
// (unknown id, wrong kind, index out of range, no change).
namespace KeyView::Editor::ElementEdits {

using LayoutModel::ElementId;
using LayoutModel::KeyCode;
using LayoutModel::Layout;

// Geometry
EDITOR_EXPORT std::unique_ptr<EditCommand> moveElement(const Layout& layout, ElementId id,
                                                       const QPointF& delta, bool moveText);
EDITOR_EXPORT std::unique_ptr<EditCommand> setBoundaryVertex(const Layout& layout, ElementId id,
                                                             int index, const QPointF& point);
EDITOR_EXPORT std::unique_ptr<EditCommand> addBoundaryVertex(const Layout& layout, ElementId id,
                                                             const QPointF& point);
EDITOR_EXPORT std::unique_ptr<EditCommand> removeBoundaryVertex(const Layout& layout, ElementId id, int index);
EDITOR_EXPORT std::unique_ptr<EditCommand> swapBoundaryVertices(const Layout& layout, ElementId id,
                                                                int first, int second);
EDITOR_EXPORT std::unique_ptr<EditCommand> setTextPosition(const Layout& layout, ElementId id,
                                                           const QPointF& point);
// Moves the text position to the center of the boundary's bounding box.
EDITOR_EXPORT std::unique_ptr<EditCommand> centerTextPosition(const Layout& layout, ElementId id);
// Replaces the boundary with its axis-aligned bounding rectangle.
EDITOR_EXPORT std::unique_ptr<EditCommand> makeRectangle(const Layout& layout, ElementId id);
EDITOR_EXPORT std::unique_ptr<EditCommand> setIndicatorLocation(const Layout& layout, ElementId id,
                                                                const QPointF& location);
EDITOR_EXPORT std::unique_ptr<EditCommand> setIndicatorRadius(const Layout& layout, ElementId id, double radius);

// Properties
EDITOR_EXPORT std::unique_ptr<EditCommand> setText(const Layout& layout, ElementId id, const QString& text);
EDITOR_EXPORT std::unique_ptr<EditCommand> setShiftText(const Layout& layout, ElementId id, const QString& text);
EDITOR_EXPORT std::unique_ptr<EditCommand> setChangeOnCaps(const Layout& layout, ElementId id, bool changeOnCaps);
EDITOR_EXPORT std::unique_ptr<EditCommand> setKeyCodes(const Layout& layout, ElementId id,
                                                       const QVector<KeyCode>& keyCodes);
EDITOR_EXPORT std::unique_ptr<EditCommand> addKeyCode(const Layout& layout, ElementId id, KeyCode code);
EDITOR_EXPORT std::unique_ptr<EditCommand> removeKeyCode(const Layout& layout, ElementId id, KeyCode code);

} // namespace KeyView::Editor::ElementEdits
