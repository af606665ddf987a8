// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputStateGlobal.hpp"
#include "inputstate/ModifierState.hpp"
#include "inputstate/Settings.hpp"

#include "layoutmodel/Layout.hpp"

#include <QtCore/QString>

namespace KeyView::InputState::TextResolver {

// Caps-sensitive keys (change_on_caps) show the shift text when logical caps differs from
// shift, or for caps alone when shift is not honored for them. Other keys follow shift
// when honored.
INPUTSTATE_EXPORT bool useShiftText(const LayoutModel::KeyboardKeyDefinition& key,
                                    const ModifierState& modifiers,
                                    const Settings& settings);

// Display text for any element; only keyboard keys have a shift variant.
INPUTSTATE_EXPORT QString resolve(const LayoutModel::Element& element,
                                  const ModifierState& modifiers,
                                  const Settings& settings);

} // namespace KeyView::InputState::TextResolver
