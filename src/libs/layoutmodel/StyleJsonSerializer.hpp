// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/LayoutModelGlobal.hpp"
#include "layoutmodel/SchemaError.hpp"
#include "layoutmodel/Style.hpp"

#include "utils/Result.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>

namespace KeyView::LayoutModel {

// Style files (`*.style`). ElementStyles is written as a list of `{Key, Value}` pairs in the
// order they are held, so files written by the reference tool re-encode unchanged.
class LAYOUTMODEL_EXPORT StyleJsonSerializer final
{
public:
    static QJsonObject serialize(const Style& style);
    static QJsonObject serializeKeySubStyle(const KeySubStyle& style);
    static QJsonObject serializeIndicatorStyle(const MouseSpeedIndicatorStyle& style);

    // `out` is only assigned when the whole document is valid.
    static Utils::Result deserialize(const QJsonValue& json, Style& out, SchemaError* error = nullptr);
};

} // namespace KeyView::LayoutModel
