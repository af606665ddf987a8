// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/InputEvent.hpp"

Q_LOGGING_CATEGORY(inputstatelog, "keyview.inputstate")

namespace KeyView::InputState {

using namespace Qt::StringLiterals;

QString inputEventTypeName(InputEventType type)
{
    switch (type) {
        case InputEventType::KeyPress: return u"key-press"_s;
        case InputEventType::KeyRelease: return u"key-release"_s;
        case InputEventType::ButtonPress: return u"button-press"_s;
        case InputEventType::ButtonRelease: return u"button-release"_s;
        case InputEventType::Scroll: return u"scroll"_s;
        case InputEventType::MouseMove: return u"mouse-move"_s;
        case InputEventType::MouseDelta: return u"mouse-delta"_s;
        case InputEventType::CapsLockState: return u"caps-lock-state"_s;
    }
    return u"unknown"_s;
}

namespace {

InputEvent make(InputEventType type, TimePoint time, KeyCode code = 0)
{
    InputEvent e;
    e.type = type;
    e.time = time;
    e.code = code;
    return e;
}

} // namespace

InputEvent InputEvent::keyPress(KeyCode key, TimePoint time)
{
    return make(InputEventType::KeyPress, time, key);
}

InputEvent InputEvent::keyRelease(KeyCode key, TimePoint time)
{
    return make(InputEventType::KeyRelease, time, key);
}

InputEvent InputEvent::buttonPress(MouseButton button, TimePoint time)
{
    return make(InputEventType::ButtonPress, time, InputState::code(button));
}

InputEvent InputEvent::buttonRelease(MouseButton button, TimePoint time)
{
    return make(InputEventType::ButtonRelease, time, InputState::code(button));
}

InputEvent InputEvent::buttonPress(KeyCode button, TimePoint time)
{
    return make(InputEventType::ButtonPress, time, button);
}

InputEvent InputEvent::buttonRelease(KeyCode button, TimePoint time)
{
    return make(InputEventType::ButtonRelease, time, button);
}

InputEvent InputEvent::scroll(ScrollDirection direction, TimePoint time)
{
    return make(InputEventType::Scroll, time, InputState::code(direction));
}

InputEvent InputEvent::mouseMove(const QPointF& position, TimePoint time)
{
    InputEvent e = make(InputEventType::MouseMove, time);
    e.position = position;
    return e;
}

InputEvent InputEvent::mouseDelta(const QPointF& delta, TimePoint time)
{
    InputEvent e = make(InputEventType::MouseDelta, time);
    e.position = delta;
    return e;
}

InputEvent InputEvent::capsLockState(bool on, TimePoint time)
{
    InputEvent e = make(InputEventType::CapsLockState, time);
    e.on = on;
    return e;
}

} // namespace KeyView::InputState
