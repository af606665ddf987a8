// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputEvent.hpp"
#include "inputstate/InputStateGlobal.hpp"

#include "layoutmodel/Layout.hpp"

#include <QtCore/QHash>
#include <QtCore/QSet>
#include <QtCore/QVector>

#include <array>
#include <optional>

namespace KeyView::InputState {

using LayoutModel::ElementId;

// Which code space drives an element.
enum class InputDomain : quint8 {
    Keyboard,    // KeyboardKey
    MouseButton, // MouseKey
    Scroll       // MouseScroll
};

INPUTSTATE_EXPORT std::optional<InputDomain> inputDomainFor(LayoutModel::ElementKind kind);

struct INPUTSTATE_EXPORT PressState final {
    QSet<KeyCode> heldKeyCodes;               // members of the chord that are down
    bool chordHeld = false;                   // every member is down
    std::optional<TimePoint> releaseDeadline; // debounce after the chord broke

    bool isPressed(TimePoint now) const
    {
        return chordHeld || (releaseDeadline && now < *releaseDeadline);
    }
};

// Per-element press state for one layout. Holds only element ids and keycodes, never
// geometry. Every query takes the current time so pressed state is a pure function of the
// recorded inputs.
class INPUTSTATE_EXPORT PressTracker final
{
public:
    PressTracker() = default;

    // Re-derives element state from the codes that are still down. Elements that keep their
    // id also keep a pending debounce deadline.
    void rebuild(const LayoutModel::Layout& layout);

    void setMinPressTime(Milliseconds time) { m_minPressTime = time; }
    void setScrollHoldTime(Milliseconds time) { m_scrollHoldTime = time; }
    Milliseconds minPressTime() const { return m_minPressTime; }
    Milliseconds scrollHoldTime() const { return m_scrollHoldTime; }

    // Keyboard keys and mouse buttons. Repeats and unmatched releases are no-ops.
    // Return whether the held set changed.
    bool press(InputDomain domain, KeyCode code, TimePoint now);
    bool release(InputDomain domain, KeyCode code, TimePoint now);

    // A scroll pulse keeps its direction active until now + scrollHoldTime.
    void scroll(KeyCode direction, TimePoint now);

    // Drops expired debounce and scroll deadlines. Returns whether any element changed.
    bool tick(TimePoint now);

    // Forgets every held code, deadline and scroll pulse.
    void clearPressed();

    bool isPressed(ElementId id, TimePoint now) const;
    const PressState* state(ElementId id) const;
    QVector<ElementId> pressedElements(TimePoint now) const;

    bool isHeld(InputDomain domain, KeyCode code) const;
    QSet<KeyCode> heldCodes(InputDomain domain) const;
    bool isScrollActive(KeyCode direction, TimePoint now) const;

    int trackedCount() const { return m_elements.size(); }

private:
    struct Tracked {
        ElementId id = 0;
        InputDomain domain = InputDomain::Keyboard;
        QSet<KeyCode> chord;
        PressState state;
    };

    static int slot(InputDomain domain) { return static_cast<int>(domain); }
    void refreshChord(Tracked& t) const;
    void refreshScroll(Tracked& t) const;

    QVector<Tracked> m_elements;
    QHash<ElementId, int> m_indexById;
    std::array<QHash<KeyCode, QVector<int>>, 3> m_byCode;
    QVector<int> m_anyDirection; // scroll elements without keycodes
    std::array<QSet<KeyCode>, 2> m_held; // keyboard, mouse buttons
    QHash<KeyCode, TimePoint> m_scrollDeadlines;

    Milliseconds m_minPressTime{50};
    Milliseconds m_scrollHoldTime{100};
};

} // namespace KeyView::InputState
