// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(ENGINE_BUILD_SHARED) && (ENGINE_BUILD_SHARED == 1)
#	if defined(ENGINE_LIBRARY)
#		define ENGINE_EXPORT Q_DECL_EXPORT
#	else
#		define ENGINE_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define ENGINE_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(enginelog)
