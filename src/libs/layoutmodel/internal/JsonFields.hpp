// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/SchemaError.hpp"
#include "layoutmodel/Style.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QPointF>

#include <optional>

namespace KeyView::LayoutModel::Internal {

// Collects the first schema violation of a decode pass. Readers return false once a
// violation has been recorded so callers can bail out with a plain `if (!read...) return`.
class DecodeContext final
{
public:
    bool ok() const noexcept { return m_error.isNull(); }
    const SchemaError& error() const noexcept { return m_error; }

    bool fail(const QString& path, const QString& message);

private:
    SchemaError m_error;
};

QString fieldPath(const QString& parent, const QString& key);
QString indexPath(const QString& parent, int index);

bool toU32(DecodeContext& ctx, const QJsonValue& value, const QString& path, quint32& out);
bool toU8(DecodeContext& ctx, const QJsonValue& value, const QString& path, quint8& out);
bool toPoint(DecodeContext& ctx, const QJsonValue& value, const QString& path, QPointF& out);

bool readValue(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QJsonValue& out);
bool readObject(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QJsonObject& out);
bool readArray(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QJsonArray& out);
bool readDouble(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, double& out);
bool readPositive(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, double& out);
bool readU32(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, quint32& out);
bool readBool(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, bool& out);
bool readString(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QString& out);
bool readPoint(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, QPointF& out);
bool readRgb(DecodeContext& ctx, const QJsonObject& obj, const QString& path, const QString& key, Rgb& out);

// Missing and null both mean "absent".
bool readOptionalString(DecodeContext& ctx, const QJsonObject& obj, const QString& path,
                        const QString& key, std::optional<QString>& out);

inline bool isAbsent(const QJsonValue& v) { return v.isUndefined() || v.isNull(); }

QJsonObject pointObject(const QPointF& point);
QJsonObject rgbObject(const Rgb& rgb);
QJsonValue optionalString(const std::optional<QString>& value);

} // namespace KeyView::LayoutModel::Internal
