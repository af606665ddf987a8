// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "frame/FrameGlobal.hpp"
#include "frame/FrameModel.hpp"

#include <QtCore/QJsonObject>

namespace KeyView::Frame {

// Stable JSON form of a frame, used for snapshots and by the replay tool. Style objects use
// the same keys as style files.
class FRAME_EXPORT FrameJsonWriter final
{
public:
    static QJsonObject toJson(const FrameModel& frame);
    static QJsonObject toJson(const DrawInstruction& instruction);
    static QJsonObject toJson(const InputState::IndicatorGeometry& indicator);
};

} // namespace KeyView::Frame
