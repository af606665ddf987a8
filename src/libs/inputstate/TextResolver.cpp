// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/TextResolver.hpp"

namespace KeyView::InputState::TextResolver {

bool useShiftText(const LayoutModel::KeyboardKeyDefinition& key,
                  const ModifierState& modifiers,
                  const Settings& settings)
{
    const bool shift = modifiers.shiftHeld();
    if (key.changeOnCaps) {
        const bool caps = modifiers.logicalCaps(settings.capitalization);
        return settings.honorShiftForCapsSensitive ? (caps != shift) : caps;
    }
    return shift && settings.honorShiftForCapsInsensitive;
}

QString resolve(const LayoutModel::Element& element,
                const ModifierState& modifiers,
                const Settings& settings)
{
    if (const auto* key = element.keyboardKey())
        return useShiftText(*key, modifiers, settings) ? key->shiftText : key->text;
    if (const auto* common = element.common())
        return common->text;
    return {};
}

} // namespace KeyView::InputState::TextResolver
