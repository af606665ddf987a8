// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "frame/FrameProjector.hpp"

#include "inputstate/InputRuntime.hpp"

using namespace KeyView::Frame;
using namespace KeyView::InputState;
using namespace KeyView::LayoutModel;
using namespace std::chrono_literals;

namespace {

const TimePoint t0 = TimePoint{} + 1000s;

Layout makeLayout()
{
    KeyboardKeyDefinition a;
    a.id = 1;
    a.boundaries = {{0, 0}, {40, 0}, {40, 40}, {0, 40}};
    a.textPosition = {20, 20};
    a.keyCodes = {65};
    a.text = QStringLiteral("a");
    a.shiftText = QStringLiteral("A");
    a.changeOnCaps = true;

    MouseKeyDefinition left;
    left.id = 2;
    left.boundaries = {{50, 0}, {90, 0}, {90, 40}, {50, 40}};
    left.keyCodes = {code(MouseButton::Left)};
    left.text = QStringLiteral("LMB");

    MouseSpeedIndicatorDefinition indicator;
    indicator.id = 3;
    indicator.location = {150, 50};
    indicator.radius = 20;

    MouseScrollDefinition wheel;
    wheel.id = 4;
    wheel.boundaries = {{100, 0}, {120, 0}, {120, 20}, {100, 20}};

    Layout layout;
    layout.width = 200;
    layout.height = 100;
    layout.elements = {Element(a), Element(left), Element(indicator), Element(wheel)};
    return layout;
}

struct Fixture {
    Layout layout = makeLayout();
    Style style = Style::defaults();
    Settings settings;
    InputRuntime runtime;

    Fixture() { runtime.reset(layout, settings); }

    void apply(const InputEvent& event) { runtime.apply(event, settings, {}); }

    FrameInputs inputs(TimePoint now) const
    {
        FrameInputs in;
        in.layout = &layout;
        in.style = &style;
        in.tracker = &runtime.tracker();
        in.dynamics = &runtime.dynamics();
        in.modifiers = &runtime.modifiers();
        in.settings = &settings;
        in.now = now;
        return in;
    }

    FrameModel project(TimePoint now) const { return FrameProjector::project(inputs(now)); }
};

QVector<ElementId> order(const FrameModel& frame)
{
    QVector<ElementId> ids;
    for (const DrawInstruction& d : frame.instructions)
        ids.push_back(d.elementId);
    return ids;
}

} // namespace

TEST(FrameProjectorTests, NullLayoutGivesBackgroundOnly)
{
    const FrameModel frame = FrameProjector::project(FrameInputs{});
    EXPECT_TRUE(frame.instructions.isEmpty());
    EXPECT_EQ(frame.backgroundColor, (Rgb{0, 0, 100}));
    EXPECT_EQ(frame.width, 0.0);
}

TEST(FrameProjectorTests, IdleFrameUsesDefaults)
{
    const Fixture f;
    const FrameModel frame = f.project(t0);

    EXPECT_EQ(frame.width, 200.0);
    EXPECT_EQ(frame.height, 100.0);
    EXPECT_EQ(order(frame), (QVector<ElementId>{1, 2, 3, 4}));

    const DrawInstruction* key = frame.find(1);
    ASSERT_NE(key, nullptr);
    EXPECT_FALSE(key->pressed);
    EXPECT_EQ(key->text, QStringLiteral("a"));
    EXPECT_EQ(key->polygon, f.layout.elements.at(0).common()->boundaries);
    EXPECT_EQ(key->textPosition, QPointF(20, 20));
    ASSERT_TRUE(key->keyStyle.has_value());
    EXPECT_EQ(*key->keyStyle, f.style.defaultKeyStyle.loose);
    EXPECT_FALSE(key->indicator.has_value());
    EXPECT_EQ(key->overlay, EditOverlay::None);

    const DrawInstruction* indicator = frame.find(3);
    ASSERT_NE(indicator, nullptr);
    ASSERT_TRUE(indicator->indicator.has_value());
    EXPECT_FALSE(indicator->indicator->moving);
    EXPECT_EQ(indicator->indicator->center, QPointF(150, 50));
    EXPECT_EQ(indicator->indicatorStyle, f.style.defaultMouseSpeedIndicatorStyle);
    EXPECT_FALSE(indicator->keyStyle.has_value());
}

TEST(FrameProjectorTests, PressedElementsUsePressedStyle)
{
    Fixture f;
    f.apply(InputEvent::keyPress(65, t0));
    f.apply(InputEvent::buttonPress(MouseButton::Left, t0));

    const FrameModel frame = f.project(t0 + 1ms);
    EXPECT_TRUE(frame.find(1)->pressed);
    EXPECT_EQ(*frame.find(1)->keyStyle, f.style.defaultKeyStyle.pressed);
    EXPECT_TRUE(frame.find(2)->pressed);

    f.apply(InputEvent::keyRelease(65, t0 + 10ms));
    EXPECT_TRUE(f.project(t0 + 30ms).find(1)->pressed);
    EXPECT_FALSE(f.project(t0 + 70ms).find(1)->pressed);
}

TEST(FrameProjectorTests, ScrollPulseHoldsPressedForHoldTime)
{
    Fixture f;
    f.apply(InputEvent::scroll(ScrollDirection::Up, t0));

    EXPECT_TRUE(f.project(t0).find(4)->pressed);
    EXPECT_TRUE(f.project(t0 + 99ms).find(4)->pressed);
    EXPECT_FALSE(f.project(t0 + 100ms).find(4)->pressed);
}

TEST(FrameProjectorTests, TextFollowsCapsAndShift)
{
    Fixture f;
    f.apply(InputEvent::keyPress(65, t0));
    EXPECT_EQ(f.project(t0).find(1)->text, QStringLiteral("a"));

    f.apply(InputEvent::capsLockState(true, t0 + 5ms));
    EXPECT_EQ(f.project(t0 + 5ms).find(1)->text, QStringLiteral("A"));

    f.apply(InputEvent::keyPress(160, t0 + 6ms));
    EXPECT_EQ(f.project(t0 + 6ms).find(1)->text, QStringLiteral("a"));
}

TEST(FrameProjectorTests, OverrideInheritsMissingSubStyle)
{
    Fixture f;
    KeySubStyle red = f.style.defaultKeyStyle.pressed;
    red.background = Rgb{255, 0, 0};
    f.style.elementStyles.push_back(ElementStyleEntry{1, KeyStyle{std::nullopt, red}});

    EXPECT_EQ(*f.project(t0).find(1)->keyStyle, f.style.defaultKeyStyle.loose);

    f.apply(InputEvent::keyPress(65, t0));
    EXPECT_EQ(*f.project(t0).find(1)->keyStyle, red);
}

TEST(FrameProjectorTests, IndicatorFollowsMouseVelocity)
{
    Fixture f;
    f.apply(InputEvent::mouseMove({10, 10}, t0));
    f.apply(InputEvent::mouseMove({20, 10}, t0 + 10ms));

    const DrawInstruction* indicator = f.project(t0 + 10ms).find(3);
    ASSERT_TRUE(indicator->indicator.has_value());
    EXPECT_TRUE(indicator->indicator->moving);
    EXPECT_NEAR(indicator->indicator->angle, 0.0, 1e-12);
    EXPECT_GT(indicator->indicator->magnitude, 0.0);
    EXPECT_LE(indicator->indicator->magnitude, 20.0);

    FrameInputs still = f.inputs(t0 + 10ms);
    still.dynamics = nullptr;
    EXPECT_FALSE(FrameProjector::project(still).find(3)->indicator->moving);
}

TEST(FrameProjectorTests, EditOverlayOrdersFrontElementLast)
{
    Fixture f;
    f.apply(InputEvent::keyPress(65, t0));

    FrameInputs in = f.inputs(t0);
    in.edit.enabled = true;
    in.edit.hovered = 2;
    in.edit.selected = 1;

    FrameModel frame = FrameProjector::project(in);
    EXPECT_EQ(order(frame), (QVector<ElementId>{2, 3, 4, 1}));
    EXPECT_EQ(frame.find(1)->overlay, EditOverlay::Selected);
    EXPECT_TRUE(frame.find(1)->pressed);
    EXPECT_EQ(frame.find(2)->overlay, EditOverlay::Hovered);

    in.edit.held = 2;
    frame = FrameProjector::project(in);
    EXPECT_EQ(order(frame), (QVector<ElementId>{1, 3, 4, 2}));
    EXPECT_EQ(frame.find(2)->overlay, EditOverlay::Held);
    EXPECT_EQ(frame.find(1)->overlay, EditOverlay::Selected);
}

TEST(FrameProjectorTests, HeldElementIsDrawnLoose)
{
    Fixture f;
    f.apply(InputEvent::keyPress(65, t0));

    FrameInputs in = f.inputs(t0);
    in.edit.enabled = true;
    in.edit.held = 1;

    const DrawInstruction* key = FrameProjector::project(in).find(1);
    EXPECT_FALSE(key->pressed);
    EXPECT_EQ(*key->keyStyle, f.style.defaultKeyStyle.loose);
}

TEST(FrameProjectorTests, OverlayIgnoredOutsideEditMode)
{
    const Fixture f;
    FrameInputs in = f.inputs(t0);
    in.edit.selected = 1;
    in.edit.held = 1;

    const FrameModel frame = FrameProjector::project(in);
    EXPECT_EQ(order(frame), (QVector<ElementId>{1, 2, 3, 4}));
    EXPECT_EQ(frame.find(1)->overlay, EditOverlay::None);
}

TEST(FrameProjectorTests, ProjectionIsDeterministic)
{
    Fixture f;
    f.apply(InputEvent::keyPress(65, t0));
    f.apply(InputEvent::mouseMove({0, 0}, t0));
    f.apply(InputEvent::mouseMove({3, 4}, t0 + 16ms));

    EXPECT_EQ(f.project(t0 + 20ms), f.project(t0 + 20ms));
}
