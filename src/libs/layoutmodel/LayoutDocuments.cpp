// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layoutmodel/LayoutDocuments.hpp"

#include "layoutmodel/LayoutJsonSerializer.hpp"
#include "layoutmodel/StyleJsonSerializer.hpp"

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QJsonDocument>

namespace KeyView::LayoutModel::LayoutDocuments {

namespace {

template <typename Document, typename Serializer>
Utils::Result loadFile(const QString& path, Document& out, SchemaError* error, const char* what)
{
    QString readError;
    const QJsonDocument doc = Utils::JsonFileUtils::readDocument(path, &readError);
    if (doc.isNull()) {
        if (error)
            *error = SchemaError{QString(), readError};
        return Utils::Result::failure(readError);
    }

    const QJsonValue root = doc.isObject() ? QJsonValue(doc.object()) : QJsonValue(doc.array());
    Utils::Result r = Serializer::deserialize(root, out, error);
    if (!r) {
        qCWarning(layoutmodellog).noquote() << "Rejected" << what << path << r.errorString();
        return r.withContext(path);
    }
    qCInfo(layoutmodellog).noquote() << "Loaded" << what << path;
    return r;
}

} // namespace

Utils::Result loadLayoutFile(const QString& path, Layout& out, SchemaError* error)
{
    return loadFile<Layout, LayoutJsonSerializer>(path, out, error, "layout");
}

Utils::Result loadStyleFile(const QString& path, Style& out, SchemaError* error)
{
    return loadFile<Style, StyleJsonSerializer>(path, out, error, "style");
}

Utils::Result saveLayoutFile(const QString& path, const Layout& layout)
{
    return Utils::JsonFileUtils::writeObjectAtomic(path, LayoutJsonSerializer::serialize(layout))
        .withContext(path);
}

Utils::Result saveStyleFile(const QString& path, const Style& style)
{
    return Utils::JsonFileUtils::writeObjectAtomic(path, StyleJsonSerializer::serialize(style))
        .withContext(path);
}

} // namespace KeyView::LayoutModel::LayoutDocuments
