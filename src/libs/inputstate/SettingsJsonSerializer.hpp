// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inputstate/InputStateGlobal.hpp"
#include "inputstate/Settings.hpp"

#include "utils/Result.hpp"

#include <QtCore/QJsonObject>

namespace KeyView::InputState {

// Settings files use snake_case keys. Missing keys keep their defaults; a key with the wrong
// type fails the whole load.
class INPUTSTATE_EXPORT SettingsJsonSerializer final
{
public:
    static QJsonObject serialize(const Settings& settings);
    static Utils::Result deserialize(const QJsonObject& json, Settings& out);

    static Utils::Result loadFile(const QString& path, Settings& out);
    static Utils::Result saveFile(const QString& path, const Settings& settings);
};

} // namespace KeyView::InputState
