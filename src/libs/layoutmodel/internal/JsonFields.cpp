// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layoutmodel/internal/JsonFields.hpp"

#include <cmath>
#include <limits>

namespace KeyView::LayoutModel::Internal {

using namespace Qt::StringLiterals;

namespace {

QString typeName(const QJsonValue& value)
{
    switch (value.type()) {
        case QJsonValue::Null: return u"null"_s;
        case QJsonValue::Bool: return u"bool"_s;
        case QJsonValue::Double: return u"number"_s;
        case QJsonValue::String: return u"string"_s;
        case QJsonValue::Array: return u"array"_s;
        case QJsonValue::Object: return u"object"_s;
        case QJsonValue::Undefined: return u"nothing"_s;
    }
    return u"unknown"_s;
}

bool expected(DecodeContext& ctx, const QString& path, const QString& what, const QJsonValue& got)
{
    return ctx.fail(path, u"expected %1, found %2"_s.arg(what, typeName(got)));
}

bool toUnsigned(DecodeContext& ctx, const QJsonValue& value, const QString& path, double max, double& out)
{
    if (!value.isDouble())
        return expected(ctx, path, u"an unsigned integer"_s, value);
    const double d = value.toDouble();
    if (d < 0.0 || d != std::floor(d))
        return ctx.fail(path, u"%1 is not an unsigned integer"_s.arg(d));
    if (d > max)
        return ctx.fail(path, u"%1 is out of range"_s.arg(d));
    out = d;
    return true;
}

} // namespace

bool DecodeContext::fail(const QString& path, const QString& message)
{
    if (m_error.isNull()) {
        m_error.path = path;
        m_error.message = message;
    }
    return false;
}

QString fieldPath(const QString& parent, const QString& key)
{
    if (parent.isEmpty())
        return key;
    return parent + u'.' + key;
}

QString indexPath(const QString& parent, int index)
{
    return u"%1[%2]"_s.arg(parent).arg(index);
}

bool toU32(DecodeContext& ctx, const QJsonValue& value, const QString& path, quint32& out)
{
    double d = 0.0;
    if (!toUnsigned(ctx, value, path, double(std::numeric_limits<quint32>::max()), d))
        return false;
    out = static_cast<quint32>(d);
    return true;
}

bool toU8(DecodeContext& ctx, const QJsonValue& value, const QString& path, quint8& out)
{
    double d = 0.0;
    if (!toUnsigned(ctx, value, path, 255.0, d))
        return false;
    out = static_cast<quint8>(d);
    return true;
}

bool toPoint(DecodeContext& ctx, const QJsonValue& value, const QString& path, QPointF& out)
{
    if (!value.isObject())
        return expected(ctx, path, u"a point object"_s, value);
    const QJsonObject obj = value.toObject();
    double x = 0.0;
    double y = 0.0;
    if (!readDouble(ctx, obj, path, u"X"_s, x) || !readDouble(ctx, obj, path, u"Y"_s, y))
        return false;
    out = QPointF(x, y);
    return true;
}

bool readValue(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QJsonValue& out)
{
    const auto it = obj.constFind(key);
    if (it == obj.constEnd())
        return ctx.fail(fieldPath(path, key), u"missing required field"_s);
    out = it.value();
    return true;
}

bool readObject(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QJsonObject& out)
{
    QJsonValue v;
    if (!readValue(ctx, obj, path, key, v))
        return false;
    if (!v.isObject())
        return expected(ctx, fieldPath(path, key), u"an object"_s, v);
    out = v.toObject();
    return true;
}

bool readArray(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QJsonArray& out)
{
    QJsonValue v;
    if (!readValue(ctx, obj, path, key, v))
        return false;
    if (!v.isArray())
        return expected(ctx, fieldPath(path, key), u"an array"_s, v);
    out = v.toArray();
    return true;
}

bool readDouble(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, double& out)
{
    QJsonValue v;
    if (!readValue(ctx, obj, path, key, v))
        return false;
    if (!v.isDouble())
        return expected(ctx, fieldPath(path, key), u"a number"_s, v);
    out = v.toDouble();
    return true;
}

bool readPositive(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, double& out)
{
    double d = 0.0;
    if (!readDouble(ctx, obj, path, key, d))
        return false;
    if (!(d > 0.0))
        return ctx.fail(fieldPath(path, key), u"must be positive, found %1"_s.arg(d));
    out = d;
    return true;
}

bool readU32(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, quint32& out)
{
    QJsonValue v;
    if (!readValue(ctx, obj, path, key, v))
        return false;
    return toU32(ctx, v, fieldPath(path, key), out);
}

bool readBool(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, bool& out)
{
    QJsonValue v;
    if (!readValue(ctx, obj, path, key, v))
        return false;
    if (!v.isBool())
        return expected(ctx, fieldPath(path, key), u"a bool"_s, v);
    out = v.toBool();
    return true;
}

bool readString(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QString& out)
{
    QJsonValue v;
    if (!readValue(ctx, obj, path, key, v))
        return false;
    if (!v.isString())
        return expected(ctx, fieldPath(path, key), u"a string"_s, v);
    out = v.toString();
    return true;
}

bool readPoint(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QPointF& out)
{
    QJsonValue v;
    if (!readValue(ctx, obj, path, key, v))
        return false;
    return toPoint(ctx, v, fieldPath(path, key), out);
}

bool readRgb(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, Rgb& out)
{
    QJsonObject color;
    if (!readObject(ctx, obj, path, key, color))
        return false;
    const QString colorPath = fieldPath(path, key);
    Rgb rgb;
    if (!readDouble(ctx, color, colorPath, u"Red"_s, rgb.red)
        || !readDouble(ctx, color, colorPath, u"Green"_s, rgb.green)
        || !readDouble(ctx, color, colorPath, u"Blue"_s, rgb.blue))
        return false;
    out = rgb;
    return true;
}

bool readOptionalString(DecodeContext& ctx, const QJsonObject& obj, const QString& path,
                        const QString& key, std::optional<QString>& out)
{
    const QJsonValue v = obj.value(key);
    if (isAbsent(v)) {
        out.reset();
        return true;
    }
    if (!v.isString())
        return expected(ctx, fieldPath(path, key), u"a string or null"_s, v);
    out = v.toString();
    return true;
}

QJsonObject pointObject(const QPointF& point)
{
    QJsonObject obj;
    obj.insert(u"X"_s, point.x());
    obj.insert(u"Y"_s, point.y());
    return obj;
}

QJsonObject rgbObject(const Rgb& rgb)
{
    QJsonObject obj;
    obj.insert(u"Red"_s, rgb.red);
    obj.insert(u"Green"_s, rgb.green);
    obj.insert(u"Blue"_s, rgb.blue);
    return obj;
}

QJsonValue optionalString(const std::optional<QString>& value)
{
    if (!value)
        return QJsonValue(QJsonValue::Null);
    return QJsonValue(*value);
}

} // namespace KeyView::LayoutModel::Internal
