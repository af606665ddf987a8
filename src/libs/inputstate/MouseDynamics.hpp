// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputEvent.hpp"
#include "inputstate/InputStateGlobal.hpp"
#include "inputstate/Settings.hpp"

#include <QtCore/QPointF>
#include <QtCore/QVector>

namespace KeyView::InputState {

// Everything a renderer needs to draw one mouse speed indicator.
struct INPUTSTATE_EXPORT IndicatorGeometry final {
    QPointF center;
    double radius = 0.0;      // outer ring
    double innerRadius = 0.0; // filled inner circle, also the ball radius
    bool moving = false;      // false means draw the circles only

    double angle = 0.0;     // radians, atan2 of the velocity
    double squashed = 0.0;  // tanh-compressed speed in [0, 1), also the ball's gradient position
    double magnitude = 0.0; // pointer length, squashed * radius

    // Pointer triangle: apex at the center, base centered on the tip.
    QPointF tip;
    QPointF baseLeft;
    QPointF baseRight;

    QPointF ballCenter; // on the outer ring, in the direction of motion

    friend bool operator==(const IndicatorGeometry&, const IndicatorGeometry&) = default;
};

struct INPUTSTATE_EXPORT MouseSample final {
    QPointF position;
    TimePoint time;

    friend bool operator==(const MouseSample&, const MouseSample&) = default;
};

// Tracks cursor motion and derives the velocity shown by speed indicators.
class INPUTSTATE_EXPORT MouseDynamics final
{
public:
    static constexpr int kSampleCount = 8;
    static constexpr double kSensitivityScale = 5e-6;
    static constexpr double kInnerRatio = 0.2;

    void moveTo(const QPointF& position, TimePoint time,
                const Settings& settings, const QVector<DisplayInfo>& displays);

    // Relative motion is accumulated onto the last known position.
    void moveBy(const QPointF& delta, TimePoint time,
                const Settings& settings, const QVector<DisplayInfo>& displays);

    void reset();

    QPointF position() const { return m_position; }
    QPointF velocity() const { return m_velocity; } // units per second
    const QVector<MouseSample>& samples() const { return m_samples; } // oldest first

    IndicatorGeometry indicator(const QPointF& center, double radius, double sensitivity) const
    {
        return computeIndicator(m_velocity, center, radius, sensitivity);
    }

    static IndicatorGeometry computeIndicator(const QPointF& velocity, const QPointF& center,
                                              double radius, double sensitivity);

private:
    QVector<MouseSample> m_samples;
    QPointF m_position;
    QPointF m_velocity;
};

} // namespace KeyView::InputState
