// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/ModifierState.hpp"

namespace KeyView::InputState {

void ModifierState::keyPress(KeyCode key, const Settings& settings)
{
    if (key == settings.capsLockKeyCode) {
        if (!m_capsHeld)
            m_hardwareCaps = !m_hardwareCaps;
        m_capsHeld = true;
    }
    if (settings.isShiftKey(key))
        m_shiftHeld.insert(key);
}

void ModifierState::keyRelease(KeyCode key, const Settings& settings)
{
    if (key == settings.capsLockKeyCode)
        m_capsHeld = false;
    if (settings.isShiftKey(key))
        m_shiftHeld.remove(key);
}

bool ModifierState::logicalCaps(CapitalizationPolicy policy) const
{
    switch (policy) {
        case CapitalizationPolicy::FollowCapsLock: return m_hardwareCaps;
        case CapitalizationPolicy::ForceOn: return true;
        case CapitalizationPolicy::ForceOff: return false;
    }
    return m_hardwareCaps;
}

void ModifierState::clearHeld()
{
    m_shiftHeld.clear();
    m_capsHeld = false;
}

} // namespace KeyView::InputState
