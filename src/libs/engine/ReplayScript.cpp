// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "engine/ReplayScript.hpp"

#include "engine/Session.hpp"
#include "frame/FrameJsonWriter.hpp"

#include "utils/Macros.hpp"

#include <QtCore/QJsonObject>

#include <algorithm>
#include <cmath>
#include <optional>

namespace KeyView::Engine {

using namespace Qt::StringLiterals;
using namespace InputState;

namespace {

std::optional<ScrollDirection> directionFromName(const QString& name)
{
    if (name == u"up"_s)
        return ScrollDirection::Up;
    if (name == u"down"_s)
        return ScrollDirection::Down;
    if (name == u"right"_s)
        return ScrollDirection::Right;
    if (name == u"left"_s)
        return ScrollDirection::Left;
    return std::nullopt;
}

Utils::Result readCode(const QJsonObject& obj, const QString& where, KeyCode& out)
{
    const QJsonValue v = obj.value(u"code"_s);
    const double d = v.toDouble(-1.0);
    KEYVIEW_GUARD_OK(v.isDouble() && d >= 0.0 && d <= 4294967295.0 && d == std::floor(d),
                     u"%1: 'code' must be a non-negative integer"_s.arg(where));
    out = static_cast<KeyCode>(d);
    return Utils::Result::success();
}

Utils::Result readBool(const QJsonObject& obj, const QString& where, const QString& key, bool& out)
{
    const QJsonValue v = obj.value(key);
    KEYVIEW_GUARD_OK(v.isBool(), u"%1: '%2' must be a boolean"_s.arg(where, key));
    out = v.toBool();
    return Utils::Result::success();
}

Utils::Result readPoint(const QJsonObject& obj, const QString& where, QPointF& out)
{
    const QJsonValue x = obj.value(u"x"_s);
    const QJsonValue y = obj.value(u"y"_s);
    KEYVIEW_GUARD_OK(x.isDouble() && y.isDouble(), u"%1: 'x' and 'y' must be numbers"_s.arg(where));
    out = QPointF(x.toDouble(), y.toDouble());
    return Utils::Result::success();
}

Utils::Result readStep(const QJsonValue& value, const QString& where, ReplayStep& step)
{
    KEYVIEW_GUARD_OK(value.isObject(), u"%1: expected an object"_s.arg(where));
    const QJsonObject obj = value.toObject();

    const QJsonValue t = obj.value(u"t"_s);
    KEYVIEW_GUARD_OK(t.isDouble() && t.toDouble() >= 0.0, u"%1: 't' must be a non-negative number"_s.arg(where));
    step.at = Milliseconds(static_cast<qint64>(t.toDouble()));

    const QString type = obj.value(u"type"_s).toString();
    const TimePoint time{};

    if (type == u"key"_s || type == u"button"_s) {
        KeyCode code = 0;
        bool pressed = false;
        KEYVIEW_RETURN_IF_FAILED(readCode(obj, where, code));
        KEYVIEW_RETURN_IF_FAILED(readBool(obj, where, u"pressed"_s, pressed));
        if (type == u"key"_s)
            step.event = pressed ? InputEvent::keyPress(code, time) : InputEvent::keyRelease(code, time);
        else
            step.event = pressed ? InputEvent::buttonPress(code, time) : InputEvent::buttonRelease(code, time);
        return Utils::Result::success();
    }
    if (type == u"scroll"_s) {
        const std::optional<ScrollDirection> direction = directionFromName(obj.value(u"direction"_s).toString());
        KEYVIEW_GUARD_OK(direction, u"%1: 'direction' must be up, down, left or right"_s.arg(where));
        step.event = InputEvent::scroll(*direction, time);
        return Utils::Result::success();
    }
    if (type == u"move"_s || type == u"delta"_s) {
        QPointF p;
        KEYVIEW_RETURN_IF_FAILED(readPoint(obj, where, p));
        step.event = type == u"move"_s ? InputEvent::mouseMove(p, time) : InputEvent::mouseDelta(p, time);
        return Utils::Result::success();
    }
    if (type == u"caps"_s) {
        bool on = false;
        KEYVIEW_RETURN_IF_FAILED(readBool(obj, where, u"on"_s, on));
        step.event = InputEvent::capsLockState(on, time);
        return Utils::Result::success();
    }

    if (type == u"pointerdown"_s)
        step.action = ReplayAction::PointerDown;
    else if (type == u"pointermove"_s)
        step.action = ReplayAction::PointerMove;
    else if (type == u"pointerup"_s)
        step.action = ReplayAction::PointerUp;
    else
        return Utils::Result::failure(u"%1: unknown type '%2'"_s.arg(where, type));
    return readPoint(obj, where, step.point);
}

} // namespace

Utils::Result ReplayScript::parse(const QJsonValue& json, QVector<ReplayStep>& out)
{
    KEYVIEW_GUARD_OK(json.isArray(), u"event script must be a JSON array"_s);

    const QJsonArray array = json.toArray();
    QVector<ReplayStep> steps;
    steps.reserve(array.size());
    for (qsizetype i = 0; i < array.size(); ++i) {
        ReplayStep step;
        KEYVIEW_RETURN_IF_FAILED(readStep(array.at(i), u"[%1]"_s.arg(i), step));
        steps.push_back(step);
    }

    std::stable_sort(steps.begin(), steps.end(),
                     [](const ReplayStep& a, const ReplayStep& b) { return a.at < b.at; });
    out = std::move(steps);
    return Utils::Result::success();
}

QJsonArray ReplayScript::run(Session& session, const QVector<ReplayStep>& steps,
                             QVector<qint64> frameTimes, TimePoint start)
{
    std::sort(frameTimes.begin(), frameTimes.end());

    QJsonArray frames;
    qsizetype next = 0;
    for (const qint64 ms : std::as_const(frameTimes)) {
        const Milliseconds frameAt(ms);
        for (; next < steps.size() && steps.at(next).at <= frameAt; ++next) {
            const ReplayStep& step = steps.at(next);
            const TimePoint when = start + step.at;
            switch (step.action) {
                case ReplayAction::Input: {
                    InputEvent event = step.event;
                    event.time = when;
                    session.post(event);
                    break;
                }
                case ReplayAction::PointerDown:
                    session.pump(when);
                    session.pointerDown(step.point);
                    break;
                case ReplayAction::PointerMove:
                    session.pump(when);
                    session.pointerMove(step.point);
                    break;
                case ReplayAction::PointerUp:
                    session.pump(when);
                    session.pointerUp(step.point);
                    break;
            }
        }

        const TimePoint now = start + frameAt;
        session.pump(now);
        frames.append(QJsonObject{{u"t"_s, ms}, {u"frame"_s, Frame::FrameJsonWriter::toJson(session.frame(now))}});
    }
    return frames;
}

} // namespace KeyView::Engine
