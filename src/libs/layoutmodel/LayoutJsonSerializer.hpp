// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/Layout.hpp"
#include "layoutmodel/LayoutModelGlobal.hpp"
#include "layoutmodel/SchemaError.hpp"

#include "utils/Result.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>

namespace KeyView::LayoutModel {

// Layout files (`keyboard.json`): PascalCase keys, elements flattened next to their `__type`.
class LAYOUTMODEL_EXPORT LayoutJsonSerializer final
{
public:
    static QJsonObject serialize(const Layout& layout);
    static QJsonObject serializeElement(const Element& element);

    // `out` is only assigned when the whole document is valid.
    static Utils::Result deserialize(const QJsonValue& json, Layout& out, SchemaError* error = nullptr);
    static Utils::Result deserializeElement(const QJsonValue& json, Element& out, SchemaError* error = nullptr);
};

} // namespace KeyView::LayoutModel
