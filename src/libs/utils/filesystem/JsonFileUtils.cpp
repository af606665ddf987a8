// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace KeyView::Utils::JsonFileUtils {

namespace {

void setError(QString* error, const QString& message)
{
    if (error)
        *error = message;
}

QByteArray stripBom(QByteArray bytes)
{
    static const QByteArray bom("\xEF\xBB\xBF", 3);
    if (bytes.startsWith(bom))
        bytes.remove(0, bom.size());
    return bytes;
}

} // namespace

Result writeDocumentAtomic(const QString& path, const QJsonDocument& document, QJsonDocument::JsonFormat format)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("JSON output path is empty."));

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly))
        return Result::failure(QStringLiteral("Failed to open file for writing: %1").arg(cleanedPath));

    if (file.write(document.toJson(format)) < 0) {
        const QString error = file.errorString();
        file.cancelWriting();
        return Result::failure(QStringLiteral("Failed to write JSON file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit())
        return Result::failure(QStringLiteral("Failed to commit JSON file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    return Result::success();
}

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    return writeDocumentAtomic(path, QJsonDocument(object), format);
}

QJsonDocument readDocument(const QString& path, QString* error)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty()) {
        setError(error, QStringLiteral("JSON input path is empty."));
        return {};
    }

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("Failed to open JSON file: %1 (%2)")
                            .arg(cleanedPath, file.errorString()));
        return {};
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(stripBom(file.readAll()), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("Failed to parse JSON file: %1 (%2 at offset %3)")
                            .arg(cleanedPath, parseError.errorString())
                            .arg(parseError.offset));
        return {};
    }

    if (error)
        error->clear();
    return doc;
}

QJsonObject readObject(const QString& path, QString* error)
{
    const QJsonDocument doc = readDocument(path, error);
    if (error && !error->isEmpty())
        return {};

    if (!doc.isObject()) {
        setError(error, QStringLiteral("JSON document is not an object: %1").arg(path.trimmed()));
        return {};
    }
    return doc.object();
}

QJsonArray readArray(const QString& path, QString* error)
{
    const QJsonDocument doc = readDocument(path, error);
    if (error && !error->isEmpty())
        return {};

    if (!doc.isArray()) {
        setError(error, QStringLiteral("JSON document is not an array: %1").arg(path.trimmed()));
        return {};
    }
    return doc.array();
}

} // namespace KeyView::Utils::JsonFileUtils
