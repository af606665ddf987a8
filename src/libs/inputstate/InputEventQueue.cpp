// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/InputEventQueue.hpp"

#include <QtCore/QMutexLocker>

#include <utility>

namespace KeyView::InputState {

void InputEventQueue::push(const InputEvent& event)
{
    QMutexLocker locker(&m_mutex);
    m_pending.push_back(event);
}

QVector<InputEvent> InputEventQueue::takeAll()
{
    QVector<InputEvent> events;
    QMutexLocker locker(&m_mutex);
    std::swap(events, m_pending);
    return events;
}

bool InputEventQueue::isEmpty() const
{
    QMutexLocker locker(&m_mutex);
    return m_pending.isEmpty();
}

int InputEventQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_pending.size();
}

} // namespace KeyView::InputState
