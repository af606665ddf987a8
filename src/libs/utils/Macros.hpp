// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"

// Guard and early-return idioms.

#ifndef KEYVIEW_GUARD
#	define KEYVIEW_GUARD(cond) do { if (!(cond)) return; } while (false)
#endif

#ifndef KEYVIEW_GUARD_RET
#	define KEYVIEW_GUARD_RET(cond, ret) do { if (!(cond)) return (ret); } while (false)
#endif

#ifndef KEYVIEW_GUARD_OK
#	define KEYVIEW_GUARD_OK(cond, msg) do { if (!(cond)) return ::KeyView::Utils::Result::failure((msg)); } while (false)
#endif

#ifndef KEYVIEW_RETURN_IF_FAILED
#	define KEYVIEW_RETURN_IF_FAILED(expr) \
		do { auto _keyview_r = (expr); if (!_keyview_r.ok) return _keyview_r; } while (false)
#endif
