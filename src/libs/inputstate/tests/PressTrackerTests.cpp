// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "inputstate/PressTracker.hpp"

using namespace KeyView::InputState;
using namespace KeyView::LayoutModel;
using namespace std::chrono_literals;

namespace {

const TimePoint t0 = TimePoint{} + 1000s;

Layout makeLayout()
{
    Layout layout;
    layout.width = 200;
    layout.height = 100;

    KeyboardKeyDefinition a;
    a.id = 1;
    a.keyCodes = {65};
    KeyboardKeyDefinition chord;
    chord.id = 2;
    chord.keyCodes = {162, 67};
    MouseKeyDefinition left;
    left.id = 3;
    left.keyCodes = {code(MouseButton::Left)};
    MouseScrollDefinition up;
    up.id = 4;
    up.keyCodes = {code(ScrollDirection::Up)};
    MouseScrollDefinition any;
    any.id = 5;
    MouseSpeedIndicatorDefinition indicator;
    indicator.id = 6;
    indicator.radius = 10;

    layout.elements = {Element(a), Element(chord), Element(left), Element(up), Element(any), Element(indicator)};
    return layout;
}

PressTracker makeTracker(Milliseconds minPress = 50ms)
{
    PressTracker tracker;
    tracker.setMinPressTime(minPress);
    tracker.setScrollHoldTime(100ms);
    tracker.rebuild(makeLayout());
    return tracker;
}

} // namespace

TEST(PressTrackerTests, TracksOnlyElementsWithKeyCodes)
{
    const PressTracker tracker = makeTracker();
    EXPECT_EQ(tracker.trackedCount(), 5);
    EXPECT_EQ(tracker.state(6), nullptr);
    EXPECT_FALSE(tracker.isPressed(6, t0));
}

TEST(PressTrackerTests, PressThenDebouncedRelease)
{
    PressTracker tracker = makeTracker();
    tracker.press(InputDomain::Keyboard, 65, t0);
    EXPECT_TRUE(tracker.isPressed(1, t0));

    tracker.release(InputDomain::Keyboard, 65, t0 + 10ms);
    EXPECT_TRUE(tracker.isPressed(1, t0 + 10ms));
    EXPECT_TRUE(tracker.isPressed(1, t0 + 59ms));
    EXPECT_FALSE(tracker.isPressed(1, t0 + 60ms));

    EXPECT_TRUE(tracker.tick(t0 + 60ms));
    EXPECT_FALSE(tracker.state(1)->releaseDeadline.has_value());
    EXPECT_FALSE(tracker.tick(t0 + 70ms));
}

TEST(PressTrackerTests, ChordNeedsEveryCode)
{
    PressTracker tracker = makeTracker();
    tracker.press(InputDomain::Keyboard, 67, t0);
    EXPECT_FALSE(tracker.isPressed(2, t0));
    tracker.press(InputDomain::Keyboard, 162, t0 + 5ms);
    EXPECT_TRUE(tracker.isPressed(2, t0 + 5ms));

    PressTracker reversed = makeTracker();
    reversed.press(InputDomain::Keyboard, 162, t0);
    EXPECT_FALSE(reversed.isPressed(2, t0));
    reversed.press(InputDomain::Keyboard, 67, t0);
    EXPECT_TRUE(reversed.isPressed(2, t0));
}

TEST(PressTrackerTests, ReleasingAnyMemberBreaksChord)
{
    PressTracker tracker = makeTracker();
    tracker.press(InputDomain::Keyboard, 162, t0);
    tracker.press(InputDomain::Keyboard, 67, t0);
    tracker.release(InputDomain::Keyboard, 162, t0 + 100ms);

    const PressState* state = tracker.state(2);
    ASSERT_NE(state, nullptr);
    EXPECT_FALSE(state->chordHeld);
    ASSERT_TRUE(state->releaseDeadline.has_value());
    EXPECT_EQ(*state->releaseDeadline, t0 + 150ms);
    EXPECT_EQ(state->heldKeyCodes, QSet<KeyCode>{67});
    EXPECT_FALSE(tracker.isPressed(2, t0 + 150ms));
}

TEST(PressTrackerTests, ReformingChordClearsDeadline)
{
    PressTracker tracker = makeTracker();
    tracker.press(InputDomain::Keyboard, 65, t0);
    tracker.release(InputDomain::Keyboard, 65, t0 + 10ms);
    tracker.press(InputDomain::Keyboard, 65, t0 + 20ms);

    EXPECT_FALSE(tracker.state(1)->releaseDeadline.has_value());
    EXPECT_TRUE(tracker.isPressed(1, t0 + 500ms));
}

TEST(PressTrackerTests, RepeatPressIsIdempotent)
{
    PressTracker tracker = makeTracker();
    EXPECT_TRUE(tracker.press(InputDomain::Keyboard, 65, t0));
    EXPECT_FALSE(tracker.press(InputDomain::Keyboard, 65, t0 + 30ms));
    EXPECT_EQ(tracker.heldCodes(InputDomain::Keyboard).size(), 1);
    EXPECT_EQ(tracker.state(1)->heldKeyCodes.size(), 1);

    tracker.release(InputDomain::Keyboard, 65, t0 + 40ms);
    EXPECT_FALSE(tracker.isPressed(1, t0 + 90ms));
}

TEST(PressTrackerTests, UnmatchedReleaseAndUnknownCodesAreNoOps)
{
    PressTracker tracker = makeTracker();
    EXPECT_FALSE(tracker.release(InputDomain::Keyboard, 65, t0));
    EXPECT_FALSE(tracker.isPressed(1, t0));

    EXPECT_TRUE(tracker.press(InputDomain::Keyboard, 9999, t0));
    EXPECT_TRUE(tracker.pressedElements(t0).isEmpty());

    tracker.press(InputDomain::Keyboard, 65, t0);
    tracker.release(InputDomain::Keyboard, 9999, t0 + 1ms);
    EXPECT_TRUE(tracker.isPressed(1, t0 + 500ms));
}

TEST(PressTrackerTests, DomainsAreSeparate)
{
    PressTracker tracker = makeTracker();
    // Keyboard code 0 must not press the left mouse button element.
    tracker.press(InputDomain::Keyboard, 0, t0);
    EXPECT_FALSE(tracker.isPressed(3, t0));

    tracker.press(InputDomain::MouseButton, code(MouseButton::Left), t0);
    EXPECT_TRUE(tracker.isPressed(3, t0));
    EXPECT_FALSE(tracker.isPressed(4, t0));
}

TEST(PressTrackerTests, ZeroMinPressTimeReleasesImmediately)
{
    PressTracker tracker = makeTracker(0ms);
    tracker.press(InputDomain::MouseButton, 0, t0);
    tracker.release(InputDomain::MouseButton, 0, t0 + 5ms);
    EXPECT_FALSE(tracker.isPressed(3, t0 + 5ms));
}

TEST(PressTrackerTests, ScrollPulseHoldsForHoldTime)
{
    PressTracker tracker = makeTracker();
    tracker.scroll(code(ScrollDirection::Up), t0);
    EXPECT_TRUE(tracker.isPressed(4, t0));
    EXPECT_TRUE(tracker.isPressed(4, t0 + 99ms));
    EXPECT_FALSE(tracker.isPressed(4, t0 + 100ms));

    EXPECT_TRUE(tracker.tick(t0 + 100ms));
    EXPECT_FALSE(tracker.isScrollActive(code(ScrollDirection::Up), t0 + 100ms));
    EXPECT_TRUE(tracker.state(4)->heldKeyCodes.isEmpty());
}

TEST(PressTrackerTests, RepeatedScrollExtendsHold)
{
    PressTracker tracker = makeTracker();
    tracker.scroll(code(ScrollDirection::Up), t0);
    tracker.scroll(code(ScrollDirection::Up), t0 + 80ms);
    tracker.tick(t0 + 120ms);
    EXPECT_TRUE(tracker.isPressed(4, t0 + 120ms));
    EXPECT_FALSE(tracker.isPressed(4, t0 + 180ms));
}

TEST(PressTrackerTests, ScrollWithoutKeyCodesReactsToAnyDirection)
{
    PressTracker tracker = makeTracker();
    tracker.scroll(code(ScrollDirection::Down), t0);
    EXPECT_TRUE(tracker.isPressed(5, t0));
    EXPECT_FALSE(tracker.isPressed(4, t0));
    EXPECT_FALSE(tracker.isPressed(5, t0 + 100ms));
}

TEST(PressTrackerTests, ScrollIgnoresMinPressTime)
{
    PressTracker tracker = makeTracker(1000ms);
    tracker.scroll(code(ScrollDirection::Up), t0);
    EXPECT_FALSE(tracker.isPressed(4, t0 + 100ms));
}

TEST(PressTrackerTests, ClearPressedDropsEverything)
{
    PressTracker tracker = makeTracker();
    tracker.press(InputDomain::Keyboard, 65, t0);
    tracker.press(InputDomain::MouseButton, 0, t0);
    tracker.release(InputDomain::MouseButton, 0, t0);
    tracker.scroll(code(ScrollDirection::Up), t0);

    tracker.clearPressed();
    EXPECT_TRUE(tracker.pressedElements(t0).isEmpty());
    EXPECT_FALSE(tracker.isHeld(InputDomain::Keyboard, 65));

    // The key is no longer considered down, so its release is a no-op.
    EXPECT_FALSE(tracker.release(InputDomain::Keyboard, 65, t0));
}

TEST(PressTrackerTests, RebuildKeepsHeldCodes)
{
    PressTracker tracker = makeTracker();
    tracker.press(InputDomain::Keyboard, 65, t0);
    tracker.rebuild(makeLayout());
    EXPECT_TRUE(tracker.isPressed(1, t0));
    EXPECT_FALSE(tracker.state(1)->releaseDeadline.has_value());
}

TEST(PressTrackerTests, RebuildKeepsPendingReleaseDeadline)
{
    PressTracker tracker = makeTracker();
    tracker.press(InputDomain::Keyboard, 65, t0);
    tracker.release(InputDomain::Keyboard, 65, t0 + 10ms);

    tracker.rebuild(makeLayout());
    EXPECT_TRUE(tracker.isPressed(1, t0 + 20ms));
    EXPECT_FALSE(tracker.isPressed(1, t0 + 60ms));

    // A removed element takes its deadline with it.
    Layout withoutKey = makeLayout();
    withoutKey.elements.removeFirst();
    tracker.rebuild(withoutKey);
    tracker.rebuild(makeLayout());
    EXPECT_FALSE(tracker.isPressed(1, t0 + 20ms));
}
