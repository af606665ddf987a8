// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/SettingsJsonSerializer.hpp"

#include "utils/Macros.hpp"
#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QJsonArray>

#include <cmath>
#include <limits>

namespace KeyView::InputState {

using namespace Qt::StringLiterals;

namespace {

const QString kCapitalization = u"capitalization"_s;
const QString kFollowSensitive = u"follow_for_caps_sensitive"_s;
const QString kFollowInsensitive = u"follow_for_caps_insensitive"_s;
const QString kMouseFromCenter = u"mouse_from_center"_s;
const QString kMouseSensitivity = u"mouse_sensitivity"_s;
const QString kMinPressTime = u"min_press_time"_s;
const QString kScrollHoldTime = u"scroll_hold_time"_s;
const QString kDisplayChoice = u"display_choice"_s;
const QString kUpdateTextPosition = u"update_text_position"_s;
const QString kCapsLockKeyCode = u"caps_lock_key_code"_s;
const QString kShiftKeyCodes = u"shift_key_codes"_s;
const QString kVertexGrabRadius = u"vertex_grab_radius"_s;
const QString kEdgeGrabTolerance = u"edge_grab_tolerance"_s;

bool isU32(const QJsonValue& v)
{
    if (!v.isDouble())
        return false;
    const double d = v.toDouble();
    return d >= 0.0 && d == std::floor(d) && d <= double(std::numeric_limits<quint32>::max());
}

void readBool(const QJsonObject& obj, const QString& key, bool& out, Utils::Result& r)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined())
        return;
    if (!v.isBool()) {
        r.addError(u"%1: expected a bool"_s.arg(key));
        return;
    }
    out = v.toBool();
}

void readNumber(const QJsonObject& obj, const QString& key, double& out, Utils::Result& r)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined())
        return;
    if (!v.isDouble() || v.toDouble() < 0.0) {
        r.addError(u"%1: expected a non-negative number"_s.arg(key));
        return;
    }
    out = v.toDouble();
}

void readU32(const QJsonObject& obj, const QString& key, quint32& out, Utils::Result& r)
{
    const QJsonValue v = obj.value(key);
    if (v.isUndefined())
        return;
    if (!isU32(v)) {
        r.addError(u"%1: expected an unsigned integer"_s.arg(key));
        return;
    }
    out = static_cast<quint32>(v.toDouble());
}

} // namespace

QJsonObject SettingsJsonSerializer::serialize(const Settings& settings)
{
    QJsonObject obj;
    obj.insert(kCapitalization, capitalizationPolicyName(settings.capitalization));
    obj.insert(kFollowSensitive, settings.honorShiftForCapsSensitive);
    obj.insert(kFollowInsensitive, settings.honorShiftForCapsInsensitive);
    obj.insert(kMouseFromCenter, settings.mouseFromCenter);
    obj.insert(kMouseSensitivity, settings.mouseSensitivity);
    obj.insert(kMinPressTime, static_cast<qint64>(settings.minPressTimeMs));
    obj.insert(kScrollHoldTime, static_cast<qint64>(settings.scrollHoldTimeMs));
    obj.insert(kDisplayChoice, QJsonObject{{u"id"_s, static_cast<qint64>(settings.displayChoice.id)},
                                           {u"primary"_s, settings.displayChoice.primary}});
    obj.insert(kUpdateTextPosition, settings.updateTextPosition);
    obj.insert(kCapsLockKeyCode, static_cast<qint64>(settings.capsLockKeyCode));

    QJsonArray shift;
    for (const KeyCode key : settings.shiftKeyCodes)
        shift.append(static_cast<qint64>(key));
    obj.insert(kShiftKeyCodes, shift);
    obj.insert(kVertexGrabRadius, settings.vertexGrabRadius);
    obj.insert(kEdgeGrabTolerance, settings.edgeGrabTolerance);
    return obj;
}

Utils::Result SettingsJsonSerializer::deserialize(const QJsonObject& json, Settings& out)
{
    Settings s = out;
    Utils::Result r;

    const QJsonValue cap = json.value(kCapitalization);
    if (!cap.isUndefined()) {
        const auto policy = capitalizationPolicyFromName(cap.toString());
        if (!cap.isString() || !policy)
            r.addError(u"%1: expected \"Follow\", \"Upper\" or \"Lower\""_s.arg(kCapitalization));
        else
            s.capitalization = *policy;
    }

    readBool(json, kFollowSensitive, s.honorShiftForCapsSensitive, r);
    readBool(json, kFollowInsensitive, s.honorShiftForCapsInsensitive, r);
    readBool(json, kMouseFromCenter, s.mouseFromCenter, r);
    readNumber(json, kMouseSensitivity, s.mouseSensitivity, r);
    readU32(json, kMinPressTime, s.minPressTimeMs, r);
    readU32(json, kScrollHoldTime, s.scrollHoldTimeMs, r);
    readBool(json, kUpdateTextPosition, s.updateTextPosition, r);
    readU32(json, kCapsLockKeyCode, s.capsLockKeyCode, r);
    readNumber(json, kVertexGrabRadius, s.vertexGrabRadius, r);
    readNumber(json, kEdgeGrabTolerance, s.edgeGrabTolerance, r);

    const QJsonValue display = json.value(kDisplayChoice);
    if (!display.isUndefined()) {
        if (!display.isObject()) {
            r.addError(u"%1: expected an object"_s.arg(kDisplayChoice));
        } else {
            const QJsonObject d = display.toObject();
            readU32(d, u"id"_s, s.displayChoice.id, r);
            readBool(d, u"primary"_s, s.displayChoice.primary, r);
        }
    }

    const QJsonValue shift = json.value(kShiftKeyCodes);
    if (!shift.isUndefined()) {
        QVector<KeyCode> codes;
        bool valid = shift.isArray();
        for (const QJsonValue& v : shift.toArray()) {
            if (!isU32(v)) {
                valid = false;
                break;
            }
            codes.push_back(static_cast<KeyCode>(v.toDouble()));
        }
        if (valid)
            s.shiftKeyCodes = codes;
        else
            r.addError(u"%1: expected an array of unsigned integers"_s.arg(kShiftKeyCodes));
    }

    if (r.ok)
        out = s;
    return r;
}

Utils::Result SettingsJsonSerializer::loadFile(const QString& path, Settings& out)
{
    QString error;
    const QJsonObject obj = Utils::JsonFileUtils::readObject(path, &error);
    KEYVIEW_GUARD_OK(error.isEmpty(), error);

    Utils::Result r = deserialize(obj, out);
    if (!r)
        return r.withContext(path);
    qCInfo(inputstatelog).noquote() << "Loaded settings" << path;
    return r;
}

Utils::Result SettingsJsonSerializer::saveFile(const QString& path, const Settings& settings)
{
    return Utils::JsonFileUtils::writeObjectAtomic(path, serialize(settings)).withContext(path);
}

} // namespace KeyView::InputState
