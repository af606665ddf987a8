// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputEvent.hpp"
#include "inputstate/InputStateGlobal.hpp"

#include <QtCore/QMutex>
#include <QtCore/QVector>

namespace KeyView::InputState {

// Many producers, one consumer. Producers only ever append; the consumer takes the whole
// backlog at once so event handling never runs under this lock.
class INPUTSTATE_EXPORT InputEventQueue final
{
public:
    void push(const InputEvent& event);

    // Returns the pending events in arrival order and leaves the queue empty.
    QVector<InputEvent> takeAll();

    bool isEmpty() const;
    int size() const;

private:
    mutable QMutex m_mutex;
    QVector<InputEvent> m_pending;
};

} // namespace KeyView::InputState
