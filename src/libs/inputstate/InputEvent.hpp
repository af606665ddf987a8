// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputStateGlobal.hpp"

#include "layoutmodel/Layout.hpp"

#include <QtCore/QPointF>
#include <QtCore/QString>

#include <chrono>

namespace KeyView::InputState {

using LayoutModel::KeyCode;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Mouse button codes as stored in MouseKey elements.
enum class MouseButton : KeyCode {
    Left = 0,
    Right = 1,
    Middle = 2,
    Back = 3,
    Forward = 4
};

// Scroll direction codes as stored in MouseScroll elements.
enum class ScrollDirection : KeyCode {
    Up = 0,
    Down = 1,
    Right = 2,
    Left = 3
};

inline constexpr KeyCode code(MouseButton button) { return static_cast<KeyCode>(button); }
inline constexpr KeyCode code(ScrollDirection direction) { return static_cast<KeyCode>(direction); }

enum class InputEventType : quint8 {
    KeyPress,
    KeyRelease,
    ButtonPress,
    ButtonRelease,
    Scroll,
    MouseMove,   // absolute position
    MouseDelta,  // relative motion
    CapsLockState
};

INPUTSTATE_EXPORT QString inputEventTypeName(InputEventType type);

// The normalized shape delivered by the capture collaborator.
struct INPUTSTATE_EXPORT InputEvent final {
    InputEventType type = InputEventType::KeyPress;
    TimePoint time;
    KeyCode code = 0;  // key, button or scroll direction
    QPointF position;  // MouseMove position or MouseDelta offset
    bool on = false;   // CapsLockState

    static InputEvent keyPress(KeyCode key, TimePoint time);
    static InputEvent keyRelease(KeyCode key, TimePoint time);
    static InputEvent buttonPress(MouseButton button, TimePoint time);
    static InputEvent buttonRelease(MouseButton button, TimePoint time);
    static InputEvent buttonPress(KeyCode button, TimePoint time);
    static InputEvent buttonRelease(KeyCode button, TimePoint time);
    static InputEvent scroll(ScrollDirection direction, TimePoint time);
    static InputEvent mouseMove(const QPointF& position, TimePoint time);
    static InputEvent mouseDelta(const QPointF& delta, TimePoint time);
    static InputEvent capsLockState(bool on, TimePoint time);

    friend bool operator==(const InputEvent&, const InputEvent&) = default;
};

} // namespace KeyView::InputState
