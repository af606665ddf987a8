// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/LayoutModelGlobal.hpp"

#include <QtCore/QString>

namespace KeyView::LayoutModel {

// A document that does not match the layout or style schema. `path` names the offending
// field, e.g. `Elements[3].KeyCodes[1]`; it is empty for problems with the root value.
struct LAYOUTMODEL_EXPORT SchemaError final {
    QString path;
    QString message;

    bool isNull() const noexcept { return message.isEmpty(); }

    QString toString() const
    {
        if (path.isEmpty())
            return message;
        return path + QStringLiteral(": ") + message;
    }
};

} // namespace KeyView::LayoutModel
