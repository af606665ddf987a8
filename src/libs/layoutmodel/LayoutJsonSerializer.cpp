// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layoutmodel/LayoutJsonSerializer.hpp"

#include "layoutmodel/internal/JsonFields.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QSet>

#include <type_traits>
#include <utility>

namespace KeyView::LayoutModel {

using namespace Qt::StringLiterals;
using namespace Internal;

namespace {

QJsonArray pointsArray(const QVector<QPointF>& points)
{
    QJsonArray arr;
    for (const QPointF& p : points)
        arr.append(pointObject(p));
    return arr;
}

QJsonArray keyCodesArray(const QVector<KeyCode>& codes)
{
    QJsonArray arr;
    for (const KeyCode code : codes)
        arr.append(static_cast<qint64>(code));
    return arr;
}

void writeCommon(QJsonObject& obj, const CommonKeyDefinition& def)
{
    obj.insert(u"Id"_s, static_cast<qint64>(def.id));
    obj.insert(u"Boundaries"_s, pointsArray(def.boundaries));
    obj.insert(u"TextPosition"_s, pointObject(def.textPosition));
    obj.insert(u"KeyCodes"_s, keyCodesArray(def.keyCodes));
    obj.insert(u"Text"_s, def.text);
}

bool readCommon(DecodeContext& ctx, const QJsonObject& obj, const QString& path, CommonKeyDefinition& def)
{
    if (!readU32(ctx, obj, path, u"Id"_s, def.id))
        return false;

    QJsonArray boundaries;
    if (!readArray(ctx, obj, path, u"Boundaries"_s, boundaries))
        return false;
    const QString boundariesPath = fieldPath(path, u"Boundaries"_s);
    def.boundaries.clear();
    def.boundaries.reserve(boundaries.size());
    for (int i = 0; i < boundaries.size(); ++i) {
        QPointF p;
        if (!toPoint(ctx, boundaries.at(i), indexPath(boundariesPath, i), p))
            return false;
        def.boundaries.push_back(p);
    }

    if (!readPoint(ctx, obj, path, u"TextPosition"_s, def.textPosition))
        return false;

    QJsonArray codes;
    if (!readArray(ctx, obj, path, u"KeyCodes"_s, codes))
        return false;
    const QString codesPath = fieldPath(path, u"KeyCodes"_s);
    def.keyCodes.clear();
    def.keyCodes.reserve(codes.size());
    for (int i = 0; i < codes.size(); ++i) {
        KeyCode code = 0;
        if (!toU32(ctx, codes.at(i), indexPath(codesPath, i), code))
            return false;
        def.keyCodes.push_back(code);
    }

    return readString(ctx, obj, path, u"Text"_s, def.text);
}

bool readElement(DecodeContext& ctx, const QJsonValue& value, const QString& path, Element& out)
{
    if (!value.isObject())
        return ctx.fail(path, u"expected an element object"_s);
    const QJsonObject obj = value.toObject();

    QString tag;
    if (!readString(ctx, obj, path, u"__type"_s, tag))
        return false;
    const auto kind = elementKindFromTag(tag);
    if (!kind)
        return ctx.fail(fieldPath(path, u"__type"_s), u"unknown element type '%1'"_s.arg(tag));

    switch (*kind) {
        case ElementKind::KeyboardKey: {
            KeyboardKeyDefinition def;
            if (!readCommon(ctx, obj, path, def)
                || !readString(ctx, obj, path, u"ShiftText"_s, def.shiftText)
                || !readBool(ctx, obj, path, u"ChangeOnCaps"_s, def.changeOnCaps))
                return false;
            out = Element(std::move(def));
            return true;
        }
        case ElementKind::MouseKey: {
            MouseKeyDefinition def;
            if (!readCommon(ctx, obj, path, def))
                return false;
            out = Element(std::move(def));
            return true;
        }
        case ElementKind::MouseScroll: {
            MouseScrollDefinition def;
            if (!readCommon(ctx, obj, path, def))
                return false;
            out = Element(std::move(def));
            return true;
        }
        case ElementKind::MouseSpeedIndicator: {
            MouseSpeedIndicatorDefinition def;
            if (!readU32(ctx, obj, path, u"Id"_s, def.id)
                || !readPoint(ctx, obj, path, u"Location"_s, def.location)
                || !readPositive(ctx, obj, path, u"Radius"_s, def.radius))
                return false;
            out = Element(std::move(def));
            return true;
        }
    }
    return ctx.fail(path, u"unhandled element type"_s);
}

Utils::Result finish(const DecodeContext& ctx, SchemaError* error)
{
    if (ctx.ok())
        return Utils::Result::success();
    if (error)
        *error = ctx.error();
    return Utils::Result::failure(ctx.error().toString());
}

} // namespace

QJsonObject LayoutJsonSerializer::serializeElement(const Element& element)
{
    QJsonObject obj;
    obj.insert(u"__type"_s, element.tag());
    std::visit([&obj](const auto& def) {
        using T = std::decay_t<decltype(def)>;
        if constexpr (std::is_same_v<T, MouseSpeedIndicatorDefinition>) {
            obj.insert(u"Id"_s, static_cast<qint64>(def.id));
            obj.insert(u"Location"_s, pointObject(def.location));
            obj.insert(u"Radius"_s, def.radius);
        } else {
            writeCommon(obj, def);
            if constexpr (std::is_same_v<T, KeyboardKeyDefinition>) {
                obj.insert(u"ShiftText"_s, def.shiftText);
                obj.insert(u"ChangeOnCaps"_s, def.changeOnCaps);
            }
        }
    }, element.definition());
    return obj;
}

QJsonObject LayoutJsonSerializer::serialize(const Layout& layout)
{
    QJsonObject root;
    if (layout.version)
        root.insert(u"Version"_s, static_cast<int>(*layout.version));
    root.insert(u"Width"_s, layout.width);
    root.insert(u"Height"_s, layout.height);

    QJsonArray elements;
    for (const Element& element : layout.elements)
        elements.append(serializeElement(element));
    root.insert(u"Elements"_s, elements);
    return root;
}

Utils::Result LayoutJsonSerializer::deserializeElement(const QJsonValue& json, Element& out, SchemaError* error)
{
    DecodeContext ctx;
    Element element;
    if (readElement(ctx, json, QString(), element))
        out = std::move(element);
    return finish(ctx, error);
}

Utils::Result LayoutJsonSerializer::deserialize(const QJsonValue& json, Layout& out, SchemaError* error)
{
    DecodeContext ctx;
    Layout layout;

    auto decode = [&]() -> bool {
        if (!json.isObject())
            return ctx.fail(QString(), u"layout document must be a JSON object"_s);
        const QJsonObject root = json.toObject();

        const QJsonValue version = root.value(u"Version"_s);
        if (!isAbsent(version)) {
            quint8 v = 0;
            if (!toU8(ctx, version, u"Version"_s, v))
                return false;
            layout.version = v;
        }

        if (!readPositive(ctx, root, QString(), u"Width"_s, layout.width)
            || !readPositive(ctx, root, QString(), u"Height"_s, layout.height))
            return false;

        QJsonArray elements;
        if (!readArray(ctx, root, QString(), u"Elements"_s, elements))
            return false;

        QSet<ElementId> seen;
        layout.elements.reserve(elements.size());
        for (int i = 0; i < elements.size(); ++i) {
            const QString path = indexPath(u"Elements"_s, i);
            Element element;
            if (!readElement(ctx, elements.at(i), path, element))
                return false;
            if (seen.contains(element.id()))
                return ctx.fail(fieldPath(path, u"Id"_s), u"duplicate element id %1"_s.arg(element.id()));
            seen.insert(element.id());
            layout.elements.push_back(std::move(element));
        }
        return true;
    };

    if (decode())
        out = std::move(layout);
    return finish(ctx, error);
}

} // namespace KeyView::LayoutModel
