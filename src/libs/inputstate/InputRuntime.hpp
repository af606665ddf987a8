// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputEvent.hpp"
#include "inputstate/InputStateGlobal.hpp"
#include "inputstate/ModifierState.hpp"
#include "inputstate/MouseDynamics.hpp"
#include "inputstate/PressTracker.hpp"
#include "inputstate/Settings.hpp"

#include <QtCore/QVector>

namespace KeyView::InputState {

// The runtime input state of one session: press tracking, modifiers and mouse motion.
// Not thread safe; events reach it through a single consumer.
class INPUTSTATE_EXPORT InputRuntime final
{
public:
    // Rebuilds per-element state for a new layout and picks up the timing settings.
    void reset(const LayoutModel::Layout& layout, const Settings& settings);
    void applySettings(const Settings& settings);

    // Returns whether anything visible may have changed.
    bool apply(const InputEvent& event, const Settings& settings, const QVector<DisplayInfo>& displays);

    bool tick(TimePoint now) { return m_tracker.tick(now); }

    void clearPressed();

    const PressTracker& tracker() const noexcept { return m_tracker; }
    const ModifierState& modifiers() const noexcept { return m_modifiers; }
    const MouseDynamics& dynamics() const noexcept { return m_dynamics; }

private:
    PressTracker m_tracker;
    ModifierState m_modifiers;
    MouseDynamics m_dynamics;
};

} // namespace KeyView::InputState
