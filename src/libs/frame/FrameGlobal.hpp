// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(FRAME_BUILD_SHARED) && (FRAME_BUILD_SHARED == 1)
#	if defined(FRAME_LIBRARY)
#		define FRAME_EXPORT Q_DECL_EXPORT
#	else
#		define FRAME_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define FRAME_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(framelog)
