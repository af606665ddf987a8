// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputEvent.hpp"
#include "inputstate/InputStateGlobal.hpp"

#include <QtCore/QRectF>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace KeyView::InputState {

enum class CapitalizationPolicy : quint8 {
    FollowCapsLock, // "Follow"
    ForceOn,        // "Upper"
    ForceOff        // "Lower"
};

INPUTSTATE_EXPORT QString capitalizationPolicyName(CapitalizationPolicy policy);
INPUTSTATE_EXPORT std::optional<CapitalizationPolicy> capitalizationPolicyFromName(const QString& name);

struct INPUTSTATE_EXPORT DisplayChoice final {
    quint32 id = 0;
    bool primary = true;

    friend bool operator==(const DisplayChoice&, const DisplayChoice&) = default;
};

// Supplied by the host; KeyView never enumerates displays itself.
struct INPUTSTATE_EXPORT DisplayInfo final {
    quint32 id = 0;
    QRectF geometry;
    bool primary = false;

    QPointF center() const { return geometry.center(); }

    friend bool operator==(const DisplayInfo&, const DisplayInfo&) = default;
};

// Display with the chosen id, else the primary display, else the first one. Null when the
// list is empty.
INPUTSTATE_EXPORT const DisplayInfo* chooseDisplay(const QVector<DisplayInfo>& displays,
                                                   const DisplayChoice& choice);

struct INPUTSTATE_EXPORT Settings final {
    double mouseSensitivity = 50.0;
    quint32 scrollHoldTimeMs = 100;
    bool mouseFromCenter = false;
    DisplayChoice displayChoice;
    quint32 minPressTimeMs = 50;
    CapitalizationPolicy capitalization = CapitalizationPolicy::FollowCapsLock;
    bool honorShiftForCapsSensitive = true;
    bool honorShiftForCapsInsensitive = true;
    bool updateTextPosition = true;

    KeyCode capsLockKeyCode = 20;
    QVector<KeyCode> shiftKeyCodes{160, 161};

    // Edit-mode grab distances, in layout units.
    double vertexGrabRadius = 6.0;
    double edgeGrabTolerance = 4.0;

    Milliseconds minPressTime() const { return Milliseconds(minPressTimeMs); }
    Milliseconds scrollHoldTime() const { return Milliseconds(scrollHoldTimeMs); }
    bool isShiftKey(KeyCode key) const { return shiftKeyCodes.contains(key); }

    friend bool operator==(const Settings&, const Settings&) = default;
};

} // namespace KeyView::InputState
