// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace KeyView::Utils::JsonFileUtils {

UTILS_EXPORT Result writeDocumentAtomic(const QString& path,
                                        const QJsonDocument& document,
                                        QJsonDocument::JsonFormat format = QJsonDocument::Indented);

UTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                      const QJsonObject& object,
                                      QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// Parses a whole file. Layout and style files written by other tools may start with a
// UTF-8 BOM; it is skipped.
UTILS_EXPORT QJsonDocument readDocument(const QString& path, QString* error = nullptr);

UTILS_EXPORT QJsonObject readObject(const QString& path, QString* error = nullptr);
UTILS_EXPORT QJsonArray readArray(const QString& path, QString* error = nullptr);

} // namespace KeyView::Utils::JsonFileUtils
