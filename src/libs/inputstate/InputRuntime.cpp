// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/InputRuntime.hpp"

namespace KeyView::InputState {

void InputRuntime::reset(const LayoutModel::Layout& layout, const Settings& settings)
{
    applySettings(settings);
    m_tracker.rebuild(layout);
}

void InputRuntime::applySettings(const Settings& settings)
{
    m_tracker.setMinPressTime(settings.minPressTime());
    m_tracker.setScrollHoldTime(settings.scrollHoldTime());
}

bool InputRuntime::apply(const InputEvent& event, const Settings& settings, const QVector<DisplayInfo>& displays)
{
    switch (event.type) {
        case InputEventType::KeyPress:
            m_modifiers.keyPress(event.code, settings);
            m_tracker.press(InputDomain::Keyboard, event.code, event.time);
            return true;
        case InputEventType::KeyRelease:
            m_modifiers.keyRelease(event.code, settings);
            return m_tracker.release(InputDomain::Keyboard, event.code, event.time);
        case InputEventType::ButtonPress:
            return m_tracker.press(InputDomain::MouseButton, event.code, event.time);
        case InputEventType::ButtonRelease:
            return m_tracker.release(InputDomain::MouseButton, event.code, event.time);
        case InputEventType::Scroll:
            m_tracker.scroll(event.code, event.time);
            return true;
        case InputEventType::MouseMove:
            m_dynamics.moveTo(event.position, event.time, settings, displays);
            return true;
        case InputEventType::MouseDelta:
            m_dynamics.moveBy(event.position, event.time, settings, displays);
            return true;
        case InputEventType::CapsLockState:
            m_modifiers.setHardwareCaps(event.on);
            return true;
    }
    qCDebug(inputstatelog) << "Ignored event of unknown type" << static_cast<int>(event.type);
    return false;
}

void InputRuntime::clearPressed()
{
    m_tracker.clearPressed();
    m_modifiers.clearHeld();
}

} // namespace KeyView::InputState
