// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/MouseDynamics.hpp"

#include "layoutmodel/Geometry.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numbers>

namespace KeyView::InputState {

namespace Geometry = LayoutModel::Geometry;

void MouseDynamics::moveTo(const QPointF& position, TimePoint time,
                           const Settings& settings, const QVector<DisplayInfo>& displays)
{
    if (!m_samples.isEmpty()) {
        const MouseSample& previous = m_samples.back();
        const double dt = std::chrono::duration<double>(time - previous.time).count();

        QPointF origin = previous.position;
        if (settings.mouseFromCenter) {
            const DisplayInfo* display = chooseDisplay(displays, settings.displayChoice);
            origin = display ? display->center() : QPointF();
        }
        m_velocity = dt > 0.0 ? (position - origin) / dt : QPointF();
    }

    m_position = position;
    m_samples.push_back(MouseSample{position, time});
    if (m_samples.size() > kSampleCount)
        m_samples.removeFirst();
}

void MouseDynamics::moveBy(const QPointF& delta, TimePoint time,
                           const Settings& settings, const QVector<DisplayInfo>& displays)
{
    moveTo(m_position + delta, time, settings, displays);
}

void MouseDynamics::reset()
{
    m_samples.clear();
    m_velocity = QPointF();
}

IndicatorGeometry MouseDynamics::computeIndicator(const QPointF& velocity, const QPointF& center,
                                                  double radius, double sensitivity)
{
    IndicatorGeometry g;
    g.center = center;
    g.radius = radius;
    g.innerRadius = radius * kInnerRatio;
    g.tip = center;
    g.baseLeft = center;
    g.baseRight = center;
    g.ballCenter = center;

    const double speed = Geometry::length(velocity);
    if (speed == 0.0)
        return g;

    g.moving = true;
    g.angle = Geometry::angleOf(velocity);
    g.squashed = std::tanh(sensitivity * kSensitivityScale * speed);
    g.magnitude = std::clamp(g.squashed * radius, 0.0, radius);

    // Half-width grows with the pointer, reaching the ball radius at full speed.
    const double halfBase = g.squashed * kInnerRatio * radius;
    const double across = g.angle + std::numbers::pi / 2.0;
    g.tip = Geometry::polarOffset(center, g.angle, g.magnitude);
    g.baseLeft = Geometry::polarOffset(g.tip, across, -halfBase);
    g.baseRight = Geometry::polarOffset(g.tip, across, halfBase);
    g.ballCenter = Geometry::polarOffset(center, g.angle, radius);
    return g;
}

} // namespace KeyView::InputState
