// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "frame/FrameJsonWriter.hpp"

#include "layoutmodel/StyleJsonSerializer.hpp"

#include <QtCore/QJsonArray>

namespace KeyView::Frame {

using namespace Qt::StringLiterals;
using LayoutModel::StyleJsonSerializer;

namespace {

QJsonObject point(const QPointF& p)
{
    return QJsonObject{{u"X"_s, p.x()}, {u"Y"_s, p.y()}};
}

QJsonObject rgb(const LayoutModel::Rgb& c)
{
    return QJsonObject{{u"Red"_s, c.red}, {u"Green"_s, c.green}, {u"Blue"_s, c.blue}};
}

} // namespace

QJsonObject FrameJsonWriter::toJson(const InputState::IndicatorGeometry& indicator)
{
    QJsonObject obj;
    obj.insert(u"Center"_s, point(indicator.center));
    obj.insert(u"Radius"_s, indicator.radius);
    obj.insert(u"InnerRadius"_s, indicator.innerRadius);
    obj.insert(u"Moving"_s, indicator.moving);
    if (indicator.moving) {
        obj.insert(u"Angle"_s, indicator.angle);
        obj.insert(u"Magnitude"_s, indicator.magnitude);
        obj.insert(u"Tip"_s, point(indicator.tip));
        obj.insert(u"BaseLeft"_s, point(indicator.baseLeft));
        obj.insert(u"BaseRight"_s, point(indicator.baseRight));
        obj.insert(u"BallCenter"_s, point(indicator.ballCenter));
        obj.insert(u"BallGradient"_s, indicator.squashed);
    }
    return obj;
}

QJsonObject FrameJsonWriter::toJson(const DrawInstruction& instruction)
{
    QJsonObject obj;
    obj.insert(u"Id"_s, static_cast<qint64>(instruction.elementId));
    obj.insert(u"__type"_s, LayoutModel::elementKindTag(instruction.kind));
    obj.insert(u"Overlay"_s, editOverlayName(instruction.overlay));

    if (instruction.indicator) {
        obj.insert(u"Indicator"_s, toJson(*instruction.indicator));
        if (instruction.indicatorStyle)
            obj.insert(u"Style"_s, StyleJsonSerializer::serializeIndicatorStyle(*instruction.indicatorStyle));
        return obj;
    }

    QJsonArray polygon;
    for (const QPointF& p : instruction.polygon)
        polygon.append(point(p));

    obj.insert(u"Pressed"_s, instruction.pressed);
    obj.insert(u"Boundaries"_s, polygon);
    obj.insert(u"Text"_s, instruction.text);
    obj.insert(u"TextPosition"_s, point(instruction.textPosition));
    if (instruction.keyStyle)
        obj.insert(u"Style"_s, StyleJsonSerializer::serializeKeySubStyle(*instruction.keyStyle));
    return obj;
}

QJsonObject FrameJsonWriter::toJson(const FrameModel& frame)
{
    QJsonArray instructions;
    for (const DrawInstruction& instruction : frame.instructions)
        instructions.append(toJson(instruction));

    QJsonObject obj;
    obj.insert(u"Width"_s, frame.width);
    obj.insert(u"Height"_s, frame.height);
    obj.insert(u"BackgroundColor"_s, rgb(frame.backgroundColor));
    obj.insert(u"BackgroundImageFileName"_s, frame.backgroundImageFileName
                                                 ? QJsonValue(*frame.backgroundImageFileName)
                                                 : QJsonValue(QJsonValue::Null));
    obj.insert(u"Instructions"_s, instructions);
    return obj;
}

} // namespace KeyView::Frame
