// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layoutmodel/StyleJsonSerializer.hpp"

#include "layoutmodel/internal/JsonFields.hpp"

#include <QtCore/QJsonArray>

#include <type_traits>
#include <utility>

namespace KeyView::LayoutModel {

using namespace Qt::StringLiterals;
using namespace Internal;

namespace {

QJsonObject fontObject(const Font& font)
{
    QJsonObject obj;
    obj.insert(u"FontFamily"_s, font.family);
    obj.insert(u"Size"_s, font.size);
    obj.insert(u"Style"_s, static_cast<int>(font.style));
    return obj;
}

QJsonValue optionalSubStyle(const std::optional<KeySubStyle>& style)
{
    if (!style)
        return QJsonValue(QJsonValue::Null);
    return StyleJsonSerializer::serializeKeySubStyle(*style);
}

QJsonObject elementStyleObject(const ElementStyle& style)
{
    QJsonObject obj;
    std::visit([&obj](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, KeyStyle>) {
            obj.insert(u"Loose"_s, optionalSubStyle(s.loose));
            obj.insert(u"Pressed"_s, optionalSubStyle(s.pressed));
        } else {
            obj = StyleJsonSerializer::serializeIndicatorStyle(s);
        }
    }, style);
    obj.insert(u"__type"_s, elementStyleKindTag(elementStyleKind(style)));
    return obj;
}

bool readFont(DecodeContext& ctx, const QJsonObject& obj, const QString& path, Font& out)
{
    QJsonObject fontObj;
    if (!readObject(ctx, obj, path, u"Font"_s, fontObj))
        return false;
    const QString fontPath = fieldPath(path, u"Font"_s);

    Font font;
    if (!readString(ctx, fontObj, fontPath, u"FontFamily"_s, font.family)
        || !readDouble(ctx, fontObj, fontPath, u"Size"_s, font.size))
        return false;

    QJsonValue styleValue;
    if (!readValue(ctx, fontObj, fontPath, u"Style"_s, styleValue))
        return false;
    const QString stylePath = fieldPath(fontPath, u"Style"_s);
    if (!toU8(ctx, styleValue, stylePath, font.style))
        return false;
    if ((font.style & ~kFontStyleMask) != 0)
        return ctx.fail(stylePath, u"extraneous bits set in font style %1"_s.arg(font.style));

    out = font;
    return true;
}

bool readKeySubStyle(DecodeContext& ctx, const QJsonObject& obj, const QString& path, KeySubStyle& out)
{
    KeySubStyle style;
    if (!readRgb(ctx, obj, path, u"Background"_s, style.background)
        || !readRgb(ctx, obj, path, u"Text"_s, style.text)
        || !readRgb(ctx, obj, path, u"Outline"_s, style.outline)
        || !readBool(ctx, obj, path, u"ShowOutline"_s, style.showOutline)
        || !readU32(ctx, obj, path, u"OutlineWidth"_s, style.outlineWidth)
        || !readFont(ctx, obj, path, style.font)
        || !readOptionalString(ctx, obj, path, u"BackgroundImageFileName"_s, style.backgroundImageFileName))
        return false;
    out = std::move(style);
    return true;
}

bool readRequiredSubStyle(DecodeContext& ctx, const QJsonObject& obj, const QString& path,
                          const QString& key, KeySubStyle& out)
{
    QJsonObject sub;
    if (!readObject(ctx, obj, path, key, sub))
        return false;
    return readKeySubStyle(ctx, sub, fieldPath(path, key), out);
}

bool readOptionalSubStyle(DecodeContext& ctx, const QJsonObject& obj, const QString& path,
                          const QString& key, std::optional<KeySubStyle>& out)
{
    const QJsonValue v = obj.value(key);
    if (isAbsent(v)) {
        out.reset();
        return true;
    }
    const QString subPath = fieldPath(path, key);
    if (!v.isObject())
        return ctx.fail(subPath, u"expected a key sub-style object or null"_s);
    KeySubStyle style;
    if (!readKeySubStyle(ctx, v.toObject(), subPath, style))
        return false;
    out = std::move(style);
    return true;
}

bool readIndicatorStyle(DecodeContext& ctx, const QJsonObject& obj, const QString& path,
                        MouseSpeedIndicatorStyle& out)
{
    MouseSpeedIndicatorStyle style;
    if (!readRgb(ctx, obj, path, u"InnerColor"_s, style.innerColor)
        || !readRgb(ctx, obj, path, u"OuterColor"_s, style.outerColor)
        || !readDouble(ctx, obj, path, u"OutlineWidth"_s, style.outlineWidth))
        return false;
    if (style.outlineWidth < 0.0)
        return ctx.fail(fieldPath(path, u"OutlineWidth"_s), u"must not be negative"_s);
    out = style;
    return true;
}

bool readElementStyle(DecodeContext& ctx, const QJsonValue& value, const QString& path, ElementStyle& out)
{
    if (!value.isObject())
        return ctx.fail(path, u"expected an element style object"_s);
    const QJsonObject obj = value.toObject();

    QString tag;
    if (!readString(ctx, obj, path, u"__type"_s, tag))
        return false;
    const auto kind = elementStyleKindFromTag(tag);
    if (!kind)
        return ctx.fail(fieldPath(path, u"__type"_s), u"unknown element style type '%1'"_s.arg(tag));

    switch (*kind) {
        case ElementStyleKind::KeyStyle: {
            KeyStyle style;
            if (!readOptionalSubStyle(ctx, obj, path, u"Loose"_s, style.loose)
                || !readOptionalSubStyle(ctx, obj, path, u"Pressed"_s, style.pressed))
                return false;
            out = std::move(style);
            return true;
        }
        case ElementStyleKind::MouseSpeedIndicatorStyle: {
            MouseSpeedIndicatorStyle style;
            if (!readIndicatorStyle(ctx, obj, path, style))
                return false;
            out = style;
            return true;
        }
    }
    return ctx.fail(path, u"unhandled element style type"_s);
}

} // namespace

QJsonObject StyleJsonSerializer::serializeKeySubStyle(const KeySubStyle& style)
{
    QJsonObject obj;
    obj.insert(u"Background"_s, rgbObject(style.background));
    obj.insert(u"Text"_s, rgbObject(style.text));
    obj.insert(u"Outline"_s, rgbObject(style.outline));
    obj.insert(u"ShowOutline"_s, style.showOutline);
    obj.insert(u"OutlineWidth"_s, static_cast<qint64>(style.outlineWidth));
    obj.insert(u"Font"_s, fontObject(style.font));
    obj.insert(u"BackgroundImageFileName"_s, optionalString(style.backgroundImageFileName));
    return obj;
}

QJsonObject StyleJsonSerializer::serializeIndicatorStyle(const MouseSpeedIndicatorStyle& style)
{
    QJsonObject obj;
    obj.insert(u"InnerColor"_s, rgbObject(style.innerColor));
    obj.insert(u"OuterColor"_s, rgbObject(style.outerColor));
    obj.insert(u"OutlineWidth"_s, style.outlineWidth);
    return obj;
}

QJsonObject StyleJsonSerializer::serialize(const Style& style)
{
    QJsonObject root;
    root.insert(u"BackgroundColor"_s, rgbObject(style.backgroundColor));
    root.insert(u"BackgroundImageFileName"_s, optionalString(style.backgroundImageFileName));

    QJsonObject defaults;
    defaults.insert(u"Loose"_s, serializeKeySubStyle(style.defaultKeyStyle.loose));
    defaults.insert(u"Pressed"_s, serializeKeySubStyle(style.defaultKeyStyle.pressed));
    root.insert(u"DefaultKeyStyle"_s, defaults);
    root.insert(u"DefaultMouseSpeedIndicatorStyle"_s, serializeIndicatorStyle(style.defaultMouseSpeedIndicatorStyle));

    QJsonArray entries;
    for (const ElementStyleEntry& entry : style.elementStyles) {
        QJsonObject pair;
        pair.insert(u"Key"_s, static_cast<qint64>(entry.key));
        pair.insert(u"Value"_s, elementStyleObject(entry.value));
        entries.append(pair);
    }
    root.insert(u"ElementStyles"_s, entries);
    return root;
}

Utils::Result StyleJsonSerializer::deserialize(const QJsonValue& json, Style& out, SchemaError* error)
{
    DecodeContext ctx;
    Style style;

    auto decode = [&]() -> bool {
        if (!json.isObject())
            return ctx.fail(QString(), u"style document must be a JSON object"_s);
        const QJsonObject root = json.toObject();

        if (!readRgb(ctx, root, QString(), u"BackgroundColor"_s, style.backgroundColor)
            || !readOptionalString(ctx, root, QString(), u"BackgroundImageFileName"_s, style.backgroundImageFileName))
            return false;

        QJsonObject defaults;
        if (!readObject(ctx, root, QString(), u"DefaultKeyStyle"_s, defaults))
            return false;
        if (!readRequiredSubStyle(ctx, defaults, u"DefaultKeyStyle"_s, u"Loose"_s, style.defaultKeyStyle.loose)
            || !readRequiredSubStyle(ctx, defaults, u"DefaultKeyStyle"_s, u"Pressed"_s, style.defaultKeyStyle.pressed))
            return false;

        QJsonObject indicator;
        if (!readObject(ctx, root, QString(), u"DefaultMouseSpeedIndicatorStyle"_s, indicator)
            || !readIndicatorStyle(ctx, indicator, u"DefaultMouseSpeedIndicatorStyle"_s,
                                   style.defaultMouseSpeedIndicatorStyle))
            return false;

        QJsonArray entries;
        if (!readArray(ctx, root, QString(), u"ElementStyles"_s, entries))
            return false;
        style.elementStyles.reserve(entries.size());
        for (int i = 0; i < entries.size(); ++i) {
            const QString path = indexPath(u"ElementStyles"_s, i);
            const QJsonValue entryValue = entries.at(i);
            if (!entryValue.isObject())
                return ctx.fail(path, u"expected a {Key, Value} object"_s);
            const QJsonObject pair = entryValue.toObject();

            ElementStyleEntry entry;
            QJsonValue value;
            if (!readU32(ctx, pair, path, u"Key"_s, entry.key)
                || !readValue(ctx, pair, path, u"Value"_s, value)
                || !readElementStyle(ctx, value, fieldPath(path, u"Value"_s), entry.value))
                return false;
            style.elementStyles.push_back(std::move(entry));
        }
        return true;
    };

    if (decode()) {
        out = std::move(style);
        return Utils::Result::success();
    }
    if (error)
        *error = ctx.error();
    return Utils::Result::failure(ctx.error().toString());
}

} // namespace KeyView::LayoutModel
