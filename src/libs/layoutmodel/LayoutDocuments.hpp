// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "layoutmodel/Layout.hpp"
#include "layoutmodel/LayoutModelGlobal.hpp"
#include "layoutmodel/SchemaError.hpp"
#include "layoutmodel/Style.hpp"

#include "utils/Result.hpp"

#include <QtCore/QString>

namespace KeyView::LayoutModel::LayoutDocuments {

// File-level wrappers around the serializers. Errors are prefixed with the file path.
LAYOUTMODEL_EXPORT Utils::Result loadLayoutFile(const QString& path, Layout& out, SchemaError* error = nullptr);
LAYOUTMODEL_EXPORT Utils::Result loadStyleFile(const QString& path, Style& out, SchemaError* error = nullptr);

LAYOUTMODEL_EXPORT Utils::Result saveLayoutFile(const QString& path, const Layout& layout);
LAYOUTMODEL_EXPORT Utils::Result saveStyleFile(const QString& path, const Style& style);

} // namespace KeyView::LayoutModel::LayoutDocuments
