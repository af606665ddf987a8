// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "frame/FrameGlobal.hpp"
#include "frame/FrameModel.hpp"

#include "inputstate/InputEvent.hpp"
#include "inputstate/ModifierState.hpp"
#include "inputstate/MouseDynamics.hpp"
#include "inputstate/PressTracker.hpp"
#include "inputstate/Settings.hpp"

#include <optional>

namespace KeyView::Frame {

struct FRAME_EXPORT EditOverlayState final {
    bool enabled = false;
    std::optional<ElementId> hovered;
    std::optional<ElementId> held;
    std::optional<ElementId> selected;
};

// Everything one projection reads. All pointers are borrowed for the duration of the call;
// a null layout gives an empty frame, the other null inputs fall back to their defaults.
struct FRAME_EXPORT FrameInputs final {
    const LayoutModel::Layout* layout = nullptr;
    const LayoutModel::Style* style = nullptr;
    const InputState::PressTracker* tracker = nullptr;
    const InputState::MouseDynamics* dynamics = nullptr;
    const InputState::ModifierState* modifiers = nullptr;
    const InputState::Settings* settings = nullptr;
    EditOverlayState edit;
    InputState::TimePoint now;
};

class FRAME_EXPORT FrameProjector final
{
public:
    // Deterministic: the same inputs always give the same frame.
    static FrameModel project(const FrameInputs& inputs);

    static DrawInstruction projectElement(const LayoutModel::Element& element, const FrameInputs& inputs);
};

} // namespace KeyView::Frame
