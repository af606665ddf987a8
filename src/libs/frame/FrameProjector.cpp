// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "frame/FrameProjector.hpp"

#include "frame/StyleResolver.hpp"

#include "inputstate/TextResolver.hpp"

namespace KeyView::Frame {

using LayoutModel::Element;
using LayoutModel::Layout;
using LayoutModel::Style;

namespace {

EditOverlay overlayFor(ElementId id, const EditOverlayState& edit)
{
    if (!edit.enabled)
        return EditOverlay::None;
    if (edit.held == id)
        return EditOverlay::Held;
    if (edit.selected == id)
        return EditOverlay::Selected;
    if (edit.hovered == id)
        return EditOverlay::Hovered;
    return EditOverlay::None;
}

const Style& styleOf(const FrameInputs& inputs)
{
    static const Style kDefaultStyle = Style::defaults();
    return inputs.style ? *inputs.style : kDefaultStyle;
}

// The element drawn on top of everything else while editing.
std::optional<ElementId> frontElement(const EditOverlayState& edit)
{
    if (!edit.enabled)
        return std::nullopt;
    return edit.held ? edit.held : edit.selected;
}

} // namespace

DrawInstruction FrameProjector::projectElement(const Element& element, const FrameInputs& inputs)
{
    static const InputState::Settings kDefaultSettings;
    static const InputState::ModifierState kNoModifiers;

    const Style& style = styleOf(inputs);
    const InputState::Settings& settings = inputs.settings ? *inputs.settings : kDefaultSettings;

    DrawInstruction out;
    out.elementId = element.id();
    out.kind = element.kind();
    out.overlay = overlayFor(element.id(), inputs.edit);

    if (const auto* indicator = element.indicator()) {
        out.indicatorStyle = StyleResolver::indicatorStyle(style, element.id());
        out.indicator = inputs.dynamics
            ? inputs.dynamics->indicator(indicator->location, indicator->radius, settings.mouseSensitivity)
            : InputState::MouseDynamics::computeIndicator({}, indicator->location, indicator->radius,
                                                          settings.mouseSensitivity);
        return out;
    }

    // A held element is being dragged and is drawn loose whatever its keys are doing.
    const bool held = out.overlay == EditOverlay::Held;
    out.pressed = !held && inputs.tracker && inputs.tracker->isPressed(element.id(), inputs.now);

    const auto* common = element.common();
    out.polygon = common->boundaries;
    out.textPosition = common->textPosition;
    out.text = InputState::TextResolver::resolve(element, inputs.modifiers ? *inputs.modifiers : kNoModifiers,
                                                 settings);
    out.keyStyle = StyleResolver::keySubStyle(style, element.id(), out.pressed);
    return out;
}

FrameModel FrameProjector::project(const FrameInputs& inputs)
{
    FrameModel frame;
    const Style& style = styleOf(inputs);
    frame.backgroundColor = style.backgroundColor;
    frame.backgroundImageFileName = style.backgroundImageFileName;

    if (!inputs.layout)
        return frame;

    const Layout& layout = *inputs.layout;
    frame.width = layout.width;
    frame.height = layout.height;
    frame.instructions.reserve(layout.elements.size());

    const std::optional<ElementId> front = frontElement(inputs.edit);
    const Element* last = nullptr;
    for (const Element& element : layout.elements) {
        if (front == element.id()) {
            last = &element;
            continue;
        }
        frame.instructions.push_back(projectElement(element, inputs));
    }
    if (last)
        frame.instructions.push_back(projectElement(*last, inputs));
    return frame;
}

} // namespace KeyView::Frame
