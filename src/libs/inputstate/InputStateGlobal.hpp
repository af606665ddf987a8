// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(INPUTSTATE_BUILD_SHARED) && (INPUTSTATE_BUILD_SHARED == 1)
#	if defined(INPUTSTATE_LIBRARY)
#		define INPUTSTATE_EXPORT Q_DECL_EXPORT
#	else
#		define INPUTSTATE_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define INPUTSTATE_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(inputstatelog)
