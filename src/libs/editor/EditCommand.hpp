// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editor/EditorGlobal.hpp"

#include "layoutmodel/Layout.hpp"

#include <QtCore/QString>

namespace KeyView::Editor {

// One undoable change to a layout. apply() may run again after revert() (redo), so it
// must be written against stored snapshots, never against the layout's current state.
class EDITOR_EXPORT EditCommand
{
public:
    virtual ~EditCommand() = default;

    virtual QString name() const = 0;

    virtual bool apply(LayoutModel::Layout& layout) = 0;

    virtual bool revert(LayoutModel::Layout& layout) = 0;
};

} // namespace KeyView::Editor
