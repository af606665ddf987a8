// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

using namespace KeyView::Utils;

TEST(JsonFileUtilsTests, WriteThenReadObject)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("keyboard.json"));

    const QJsonObject object{{QStringLiteral("Width"), 640.0}, {QStringLiteral("Height"), 200.0}};
    const Result written = JsonFileUtils::writeObjectAtomic(path, object);
    ASSERT_TRUE(written.ok) << written.errorString().toStdString();

    QString error;
    const QJsonObject read = JsonFileUtils::readObject(path, &error);
    EXPECT_TRUE(error.isEmpty()) << error.toStdString();
    EXPECT_EQ(read, object);
}

TEST(JsonFileUtilsTests, SkipsUtf8ByteOrderMark)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("bom.style"));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("\xEF\xBB\xBF{\"Version\": 2}");
    file.close();

    QString error;
    const QJsonObject read = JsonFileUtils::readObject(path, &error);
    EXPECT_TRUE(error.isEmpty()) << error.toStdString();
    EXPECT_EQ(read.value(QStringLiteral("Version")).toInt(), 2);
}

TEST(JsonFileUtilsTests, ReportsMissingFileAndWrongShape)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    QString error;
    JsonFileUtils::readObject(QDir(temp.path()).filePath(QStringLiteral("missing.json")), &error);
    EXPECT_FALSE(error.isEmpty());

    const QString arrayPath = QDir(temp.path()).filePath(QStringLiteral("events.json"));
    ASSERT_TRUE(JsonFileUtils::writeDocumentAtomic(arrayPath, QJsonDocument(QJsonArray{1, 2, 3})).ok);

    JsonFileUtils::readObject(arrayPath, &error);
    EXPECT_TRUE(error.contains(QStringLiteral("not an object")));

    const QJsonArray array = JsonFileUtils::readArray(arrayPath, &error);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(array.size(), 3);
}

TEST(JsonFileUtilsTests, RejectsEmptyOutputPath)
{
    const Result r = JsonFileUtils::writeObjectAtomic(QStringLiteral("  "), QJsonObject{});
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.errors.isEmpty());
}

TEST(JsonFileUtilsTests, ResultContextPrefixesMessages)
{
    Result r = Result::failure(QStringLiteral("Width must be positive."));
    r.withContext(QStringLiteral("keyboard.json"));
    EXPECT_EQ(r.errorString(), QStringLiteral("keyboard.json: Width must be positive."));
}
