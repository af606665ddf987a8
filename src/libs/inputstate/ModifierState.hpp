// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputEvent.hpp"
#include "inputstate/InputStateGlobal.hpp"
#include "inputstate/Settings.hpp"

#include <QtCore/QSet>

namespace KeyView::InputState {

// Shift and caps-lock as seen by text resolution. The hardware caps state toggles on every
// fresh press of the caps-lock key; a collaborator that can read the LED may set it directly.
class INPUTSTATE_EXPORT ModifierState final
{
public:
    void keyPress(KeyCode key, const Settings& settings);
    void keyRelease(KeyCode key, const Settings& settings);

    void setHardwareCaps(bool on) { m_hardwareCaps = on; }
    bool hardwareCaps() const noexcept { return m_hardwareCaps; }

    bool shiftHeld() const noexcept { return !m_shiftHeld.isEmpty(); }

    bool logicalCaps(CapitalizationPolicy policy) const;

    // Forgets held modifiers; the caps-lock toggle survives.
    void clearHeld();

private:
    QSet<KeyCode> m_shiftHeld;
    bool m_capsHeld = false;
    bool m_hardwareCaps = false;
};

} // namespace KeyView::InputState
