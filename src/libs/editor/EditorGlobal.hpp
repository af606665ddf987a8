// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(EDITOR_BUILD_SHARED) && (EDITOR_BUILD_SHARED == 1)
#	if defined(EDITOR_LIBRARY)
#		define EDITOR_EXPORT Q_DECL_EXPORT
#	else
#		define EDITOR_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define EDITOR_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(editorlog)
