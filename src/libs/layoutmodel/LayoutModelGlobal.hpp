// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(LAYOUTMODEL_BUILD_SHARED) && (LAYOUTMODEL_BUILD_SHARED == 1)
#	if defined(LAYOUTMODEL_LIBRARY)
#		define LAYOUTMODEL_EXPORT Q_DECL_EXPORT
#	else
#		define LAYOUTMODEL_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define LAYOUTMODEL_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(layoutmodellog)
