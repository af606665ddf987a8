// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <utility>

namespace KeyView::Utils {

// Outcome of a recoverable operation. Messages are user facing; callers surface them and
// keep running.
struct Result {
	bool ok = true;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(const QString& msg)
	{
		Result r;
		r.ok = false;
		r.errors.push_back(msg);
		return r;
	}

	static Result failure(QStringList msgs)
	{
		Result r;
		r.ok = false;
		r.errors = std::move(msgs);
		return r;
	}

	void addError(const QString& msg)
	{
		ok = false;
		errors.push_back(msg);
	}

	// Prefixes every message, e.g. with the file the result came from.
	Result& withContext(const QString& context)
	{
		for (QString& e : errors)
			e = context + QStringLiteral(": ") + e;
		return *this;
	}

	QString errorString() const { return errors.join(QLatin1Char('\n')); }

	explicit operator bool() const { return ok; }
};

} // namespace KeyView::Utils
