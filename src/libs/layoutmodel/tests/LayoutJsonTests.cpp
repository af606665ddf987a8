// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "layoutmodel/LayoutDocuments.hpp"
#include "layoutmodel/LayoutJsonSerializer.hpp"

#include <QtCore/QDir>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QTemporaryDir>

using namespace KeyView::LayoutModel;

namespace {

const char* kLayoutJson = R"({
    "Version": 2,
    "Width": 400,
    "Height": 200.5,
    "Elements": [
        {
            "__type": "KeyboardKey",
            "Id": 1,
            "Boundaries": [{"X": 0, "Y": 0}, {"X": 40, "Y": 0}, {"X": 40, "Y": 40}, {"X": 0, "Y": 40}],
            "TextPosition": {"X": 20.25, "Y": 20},
            "KeyCodes": [65],
            "Text": "a",
            "ShiftText": "A",
            "ChangeOnCaps": true
        },
        {
            "__type": "MouseKey",
            "Id": 2,
            "Boundaries": [{"X": 50, "Y": 0}, {"X": 90, "Y": 0}, {"X": 90, "Y": 40}],
            "TextPosition": {"X": 70, "Y": 20},
            "KeyCodes": [0],
            "Text": "LMB"
        },
        {
            "__type": "MouseScroll",
            "Id": 3,
            "Boundaries": [{"X": 100, "Y": 0}, {"X": 140, "Y": 0}, {"X": 140, "Y": 40}],
            "TextPosition": {"X": 120, "Y": 20},
            "KeyCodes": [0],
            "Text": "Up",
            "Unknown": "ignored"
        },
        {
            "__type": "MouseSpeedIndicator",
            "Id": 4,
            "Location": {"X": 300, "Y": 100},
            "Radius": 30
        }
    ]
})";

QJsonObject parse(const char* text)
{
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray(text), &err);
    EXPECT_EQ(err.error, QJsonParseError::NoError) << err.errorString().toStdString();
    return doc.object();
}

template <typename Fn>
QJsonObject withElement(QJsonObject root, int index, Fn&& edit)
{
    QJsonArray elements = root.value(QStringLiteral("Elements")).toArray();
    QJsonObject element = elements.at(index).toObject();
    edit(element);
    elements.replace(index, element);
    root.insert(QStringLiteral("Elements"), elements);
    return root;
}

} // namespace

TEST(LayoutJsonTests, DecodesAllElementKinds)
{
    Layout layout;
    const auto r = LayoutJsonSerializer::deserialize(parse(kLayoutJson), layout);
    ASSERT_TRUE(r.ok) << r.errorString().toStdString();

    ASSERT_TRUE(layout.version.has_value());
    EXPECT_EQ(*layout.version, 2);
    EXPECT_DOUBLE_EQ(layout.width, 400.0);
    EXPECT_DOUBLE_EQ(layout.height, 200.5);
    ASSERT_EQ(layout.elements.size(), 4);

    EXPECT_EQ(layout.elements[0].kind(), ElementKind::KeyboardKey);
    EXPECT_EQ(layout.elements[1].kind(), ElementKind::MouseKey);
    EXPECT_EQ(layout.elements[2].kind(), ElementKind::MouseScroll);
    EXPECT_EQ(layout.elements[3].kind(), ElementKind::MouseSpeedIndicator);

    const auto* key = layout.elements[0].keyboardKey();
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(key->text, QStringLiteral("a"));
    EXPECT_EQ(key->shiftText, QStringLiteral("A"));
    EXPECT_TRUE(key->changeOnCaps);
    EXPECT_EQ(key->keyCodes, QVector<KeyCode>{65});
    EXPECT_EQ(key->textPosition, QPointF(20.25, 20));

    const auto* indicator = layout.elements[3].indicator();
    ASSERT_NE(indicator, nullptr);
    EXPECT_EQ(indicator->location, QPointF(300, 100));
    EXPECT_DOUBLE_EQ(indicator->radius, 30.0);
}

TEST(LayoutJsonTests, RoundTripKeepsTagsAndValues)
{
    Layout first;
    ASSERT_TRUE(LayoutJsonSerializer::deserialize(parse(kLayoutJson), first).ok);

    const QJsonObject encoded = LayoutJsonSerializer::serialize(first);
    const QJsonArray elements = encoded.value(QStringLiteral("Elements")).toArray();
    ASSERT_EQ(elements.size(), 4);
    EXPECT_EQ(elements.at(1).toObject().value(QStringLiteral("__type")).toString(), QStringLiteral("MouseKey"));
    EXPECT_EQ(elements.at(2).toObject().value(QStringLiteral("__type")).toString(), QStringLiteral("MouseScroll"));
    EXPECT_FALSE(elements.at(1).toObject().contains(QStringLiteral("ShiftText")));
    EXPECT_EQ(encoded.value(QStringLiteral("Version")).toInt(), 2);

    Layout second;
    ASSERT_TRUE(LayoutJsonSerializer::deserialize(encoded, second).ok);
    EXPECT_EQ(first, second);
}

TEST(LayoutJsonTests, VersionIsOnlyWrittenWhenPresent)
{
    QJsonObject root = parse(kLayoutJson);
    root.remove(QStringLiteral("Version"));

    Layout layout;
    ASSERT_TRUE(LayoutJsonSerializer::deserialize(root, layout).ok);
    EXPECT_FALSE(layout.version.has_value());
    EXPECT_FALSE(LayoutJsonSerializer::serialize(layout).contains(QStringLiteral("Version")));
}

TEST(LayoutJsonTests, MissingFieldReportsPath)
{
    const QJsonObject root = withElement(parse(kLayoutJson), 1, [](QJsonObject& e) {
        e.remove(QStringLiteral("Text"));
    });

    Layout layout;
    layout.width = 7.0;
    SchemaError error;
    const auto r = LayoutJsonSerializer::deserialize(root, layout, &error);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(error.path, QStringLiteral("Elements[1].Text"));
    EXPECT_DOUBLE_EQ(layout.width, 7.0);
    EXPECT_TRUE(layout.elements.isEmpty());
}

TEST(LayoutJsonTests, UnknownTagIsRejected)
{
    const QJsonObject root = withElement(parse(kLayoutJson), 0, [](QJsonObject& e) {
        e.insert(QStringLiteral("__type"), QStringLiteral("Joystick"));
    });

    Layout layout;
    SchemaError error;
    EXPECT_FALSE(LayoutJsonSerializer::deserialize(root, layout, &error).ok);
    EXPECT_EQ(error.path, QStringLiteral("Elements[0].__type"));
    EXPECT_TRUE(error.message.contains(QStringLiteral("Joystick")));
}

TEST(LayoutJsonTests, InvalidKeyCodeReportsIndex)
{
    const QJsonObject root = withElement(parse(kLayoutJson), 0, [](QJsonObject& e) {
        e.insert(QStringLiteral("KeyCodes"), QJsonArray{65, -3});
    });

    Layout layout;
    SchemaError error;
    EXPECT_FALSE(LayoutJsonSerializer::deserialize(root, layout, &error).ok);
    EXPECT_EQ(error.path, QStringLiteral("Elements[0].KeyCodes[1]"));

    const QJsonObject fractional = withElement(parse(kLayoutJson), 0, [](QJsonObject& e) {
        e.insert(QStringLiteral("KeyCodes"), QJsonArray{65.5});
    });
    EXPECT_FALSE(LayoutJsonSerializer::deserialize(fractional, layout, &error).ok);
    EXPECT_EQ(error.path, QStringLiteral("Elements[0].KeyCodes[0]"));
}

TEST(LayoutJsonTests, DuplicateIdsAreRejected)
{
    const QJsonObject root = withElement(parse(kLayoutJson), 3, [](QJsonObject& e) {
        e.insert(QStringLiteral("Id"), 1);
    });

    Layout layout;
    SchemaError error;
    const auto r = LayoutJsonSerializer::deserialize(root, layout, &error);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(error.path, QStringLiteral("Elements[3].Id"));
    EXPECT_TRUE(r.errorString().contains(QStringLiteral("duplicate")));
}

TEST(LayoutJsonTests, NonPositiveSizesAreRejected)
{
    QJsonObject root = parse(kLayoutJson);
    root.insert(QStringLiteral("Width"), 0);

    Layout layout;
    SchemaError error;
    EXPECT_FALSE(LayoutJsonSerializer::deserialize(root, layout, &error).ok);
    EXPECT_EQ(error.path, QStringLiteral("Width"));

    const QJsonObject badRadius = withElement(parse(kLayoutJson), 3, [](QJsonObject& e) {
        e.insert(QStringLiteral("Radius"), -4);
    });
    EXPECT_FALSE(LayoutJsonSerializer::deserialize(badRadius, layout, &error).ok);
    EXPECT_EQ(error.path, QStringLiteral("Elements[3].Radius"));
}

TEST(LayoutJsonTests, DegenerateBoundariesAreAccepted)
{
    const QJsonObject root = withElement(parse(kLayoutJson), 1, [](QJsonObject& e) {
        e.insert(QStringLiteral("Boundaries"), QJsonArray{});
        e.insert(QStringLiteral("KeyCodes"), QJsonArray{});
    });

    Layout layout;
    ASSERT_TRUE(LayoutJsonSerializer::deserialize(root, layout).ok);
    EXPECT_TRUE(layout.elements[1].common()->boundaries.isEmpty());
    EXPECT_FALSE(layout.elements[1].contains(QPointF(60, 10)));
}

TEST(LayoutJsonTests, RootMustBeObject)
{
    Layout layout;
    SchemaError error;
    EXPECT_FALSE(LayoutJsonSerializer::deserialize(QJsonArray{}, layout, &error).ok);
    EXPECT_TRUE(error.path.isEmpty());
    EXPECT_FALSE(error.isNull());
}

TEST(LayoutJsonTests, SaveAndLoadFile)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("keyboard.json"));

    Layout layout;
    ASSERT_TRUE(LayoutJsonSerializer::deserialize(parse(kLayoutJson), layout).ok);
    const auto saved = LayoutDocuments::saveLayoutFile(path, layout);
    ASSERT_TRUE(saved.ok) << saved.errorString().toStdString();

    Layout loaded;
    const auto r = LayoutDocuments::loadLayoutFile(path, loaded);
    ASSERT_TRUE(r.ok) << r.errorString().toStdString();
    EXPECT_EQ(layout, loaded);

    const auto missing = LayoutDocuments::loadLayoutFile(QDir(temp.path()).filePath(QStringLiteral("nope.json")), loaded);
    EXPECT_FALSE(missing.ok);
}
