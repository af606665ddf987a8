// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "frame/FrameGlobal.hpp"

#include "inputstate/MouseDynamics.hpp"
#include "layoutmodel/Layout.hpp"
#include "layoutmodel/Style.hpp"

#include <QtCore/QPointF>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace KeyView::Frame {

using LayoutModel::ElementId;

enum class EditOverlay : quint8 {
    None,
    Hovered,
    Held,
    Selected
};

FRAME_EXPORT QString editOverlayName(EditOverlay overlay);

// One element, fully resolved for drawing. Key-like elements carry keyStyle; indicators carry
// indicatorStyle and indicator instead.
struct FRAME_EXPORT DrawInstruction final {
    ElementId elementId = 0;
    LayoutModel::ElementKind kind = LayoutModel::ElementKind::KeyboardKey;
    bool pressed = false;
    EditOverlay overlay = EditOverlay::None;

    QVector<QPointF> polygon;
    QString text;
    QPointF textPosition;
    std::optional<LayoutModel::KeySubStyle> keyStyle;

    std::optional<LayoutModel::MouseSpeedIndicatorStyle> indicatorStyle;
    std::optional<InputState::IndicatorGeometry> indicator;

    friend bool operator==(const DrawInstruction&, const DrawInstruction&) = default;
};

struct FRAME_EXPORT FrameModel final {
    double width = 0.0;
    double height = 0.0;
    LayoutModel::Rgb backgroundColor;
    std::optional<QString> backgroundImageFileName;
    QVector<DrawInstruction> instructions; // back to front

    const DrawInstruction* find(ElementId id) const;

    friend bool operator==(const FrameModel&, const FrameModel&) = default;
};

} // namespace KeyView::Frame
