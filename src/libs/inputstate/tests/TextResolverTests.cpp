// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "inputstate/InputRuntime.hpp"
#include "inputstate/TextResolver.hpp"

using namespace KeyView::InputState;
using namespace KeyView::LayoutModel;
using namespace std::chrono_literals;

namespace {

constexpr KeyCode kCaps = 20;
constexpr KeyCode kLeftShift = 160;

KeyboardKeyDefinition letterKey(bool changeOnCaps)
{
    KeyboardKeyDefinition key;
    key.id = 1;
    key.keyCodes = {65};
    key.text = QStringLiteral("a");
    key.shiftText = QStringLiteral("A");
    key.changeOnCaps = changeOnCaps;
    return key;
}

QString textFor(const KeyboardKeyDefinition& key, const ModifierState& modifiers, const Settings& settings)
{
    return TextResolver::resolve(Element(key), modifiers, settings);
}

} // namespace

TEST(TextResolverTests, CapsTogglesOnFreshPressOnly)
{
    const Settings settings;
    ModifierState modifiers;
    modifiers.keyPress(kCaps, settings);
    EXPECT_TRUE(modifiers.hardwareCaps());
    modifiers.keyPress(kCaps, settings); // auto-repeat
    EXPECT_TRUE(modifiers.hardwareCaps());
    modifiers.keyRelease(kCaps, settings);
    modifiers.keyPress(kCaps, settings);
    EXPECT_FALSE(modifiers.hardwareCaps());

    modifiers.setHardwareCaps(true);
    EXPECT_TRUE(modifiers.hardwareCaps());
}

TEST(TextResolverTests, EitherShiftKeyCounts)
{
    const Settings settings;
    ModifierState modifiers;
    modifiers.keyPress(161, settings);
    EXPECT_TRUE(modifiers.shiftHeld());
    modifiers.keyPress(kLeftShift, settings);
    modifiers.keyRelease(161, settings);
    EXPECT_TRUE(modifiers.shiftHeld());
    modifiers.keyRelease(kLeftShift, settings);
    EXPECT_FALSE(modifiers.shiftHeld());
}

TEST(TextResolverTests, CapsSensitiveKeyUsesCapsXorShift)
{
    const Settings settings;
    const auto key = letterKey(true);
    ModifierState modifiers;
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("a"));

    modifiers.keyPress(kLeftShift, settings);
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("A"));

    modifiers.setHardwareCaps(true);
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("a"));

    modifiers.keyRelease(kLeftShift, settings);
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("A"));
}

TEST(TextResolverTests, CapsSensitiveKeyIgnoresShiftWhenNotHonored)
{
    Settings settings;
    settings.honorShiftForCapsSensitive = false;
    const auto key = letterKey(true);
    ModifierState modifiers;
    modifiers.keyPress(kLeftShift, settings);
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("a"));
    modifiers.setHardwareCaps(true);
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("A"));
}

TEST(TextResolverTests, CapsInsensitiveKeyFollowsShiftOnly)
{
    Settings settings;
    KeyboardKeyDefinition digit = letterKey(false);
    digit.text = QStringLiteral("1");
    digit.shiftText = QStringLiteral("!");

    ModifierState modifiers;
    modifiers.setHardwareCaps(true);
    EXPECT_EQ(textFor(digit, modifiers, settings), QStringLiteral("1"));
    modifiers.keyPress(kLeftShift, settings);
    EXPECT_EQ(textFor(digit, modifiers, settings), QStringLiteral("!"));

    settings.honorShiftForCapsInsensitive = false;
    EXPECT_EQ(textFor(digit, modifiers, settings), QStringLiteral("1"));
}

TEST(TextResolverTests, ForcedPoliciesIgnoreHardwareCaps)
{
    Settings settings;
    const auto key = letterKey(true);
    ModifierState modifiers;

    settings.capitalization = CapitalizationPolicy::ForceOn;
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("A"));

    settings.capitalization = CapitalizationPolicy::ForceOff;
    modifiers.setHardwareCaps(true);
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("a"));
    modifiers.keyPress(kLeftShift, settings);
    EXPECT_EQ(textFor(key, modifiers, settings), QStringLiteral("A"));
}

TEST(TextResolverTests, NonKeyboardElementsShowPlainText)
{
    MouseKeyDefinition button;
    button.text = QStringLiteral("LMB");
    ModifierState modifiers;
    modifiers.setHardwareCaps(true);
    EXPECT_EQ(TextResolver::resolve(Element(button), modifiers, Settings{}), QStringLiteral("LMB"));
    EXPECT_TRUE(TextResolver::resolve(Element(MouseSpeedIndicatorDefinition{}), modifiers, Settings{}).isEmpty());
}

TEST(TextResolverTests, CapsLockWhileKeyHeld)
{
    Layout layout;
    layout.width = 100;
    layout.height = 100;
    layout.elements = {Element(letterKey(true))};

    const Settings settings;
    InputRuntime runtime;
    runtime.reset(layout, settings);

    const TimePoint t0 = TimePoint{} + 10s;
    runtime.apply(InputEvent::keyPress(65, t0), settings, {});
    EXPECT_TRUE(runtime.tracker().isPressed(1, t0));
    EXPECT_EQ(TextResolver::resolve(layout.elements[0], runtime.modifiers(), settings), QStringLiteral("a"));

    runtime.apply(InputEvent::keyPress(kCaps, t0 + 100ms), settings, {});
    EXPECT_EQ(TextResolver::resolve(layout.elements[0], runtime.modifiers(), settings), QStringLiteral("A"));
    EXPECT_TRUE(runtime.tracker().isPressed(1, t0 + 100ms));

    runtime.apply(InputEvent::keyRelease(65, t0 + 200ms), settings, {});
    EXPECT_TRUE(runtime.tracker().isPressed(1, t0 + 200ms));
    EXPECT_FALSE(runtime.tracker().isPressed(1, t0 + 200ms + settings.minPressTime()));
}
