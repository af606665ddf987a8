// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "frame/FrameGlobal.hpp"

#include "layoutmodel/Layout.hpp"
#include "layoutmodel/Style.hpp"

#include <QtCore/QVector>

// Two-level style lookup: the element's override entry first, then the style's defaults.
// Overrides are optional per sub-style, so a KeyStyle with only `Pressed` set still inherits
// the default loose look.
namespace KeyView::Frame::StyleResolver {

FRAME_EXPORT LayoutModel::KeySubStyle keySubStyle(const LayoutModel::Style& style, LayoutModel::ElementId id,
                                                  bool pressed);

FRAME_EXPORT LayoutModel::MouseSpeedIndicatorStyle indicatorStyle(const LayoutModel::Style& style,
                                                                  LayoutModel::ElementId id);

// Elements whose override entry is of the other kind (a KeyStyle for an indicator or the
// reverse). Such overrides are ignored by the lookups above.
FRAME_EXPORT QVector<LayoutModel::ElementId> mismatchedOverrides(const LayoutModel::Layout& layout,
                                                                 const LayoutModel::Style& style);

} // namespace KeyView::Frame::StyleResolver
