// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "engine/EngineGlobal.hpp"

#include "inputstate/InputEvent.hpp"
#include "utils/Result.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>
#include <QtCore/QPointF>
#include <QtCore/QVector>

namespace KeyView::Engine {

class Session;

enum class ReplayAction : quint8 {
    Input,
    PointerDown,
    PointerMove,
    PointerUp
};

// One entry of an event script. `event.time` is only meaningful after the script is bound
// to a start time by run().
struct ENGINE_EXPORT ReplayStep final {
    InputState::Milliseconds at{0};
    ReplayAction action = ReplayAction::Input;
    InputState::InputEvent event;
    QPointF point; // pointer actions
};

// Scripted input for headless runs. A script is a JSON array of steps such as
//   {"t": 0, "type": "key", "code": 65, "pressed": true}
//   {"t": 16, "type": "move", "x": 10, "y": 20}
//   {"t": 40, "type": "scroll", "direction": "up"}
// with types key, button, scroll, move, delta, caps and, for edit mode, pointerdown,
// pointermove and pointerup.
class ENGINE_EXPORT ReplayScript final
{
public:
    // Steps come back sorted by time; steps with the same time keep their script order.
    static Utils::Result parse(const QJsonValue& json, QVector<ReplayStep>& out);

    // Feeds the steps to the session and captures one frame (as JSON) per requested time.
    // Times are milliseconds from `start`.
    static QJsonArray run(Session& session, const QVector<ReplayStep>& steps,
                          QVector<qint64> frameTimes, InputState::TimePoint start);
};

} // namespace KeyView::Engine
