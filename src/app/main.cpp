// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>
#include <QtCore/QTextStream>

#include "engine/ReplayScript.hpp"
#include "engine/Session.hpp"
#include "layoutmodel/SchemaError.hpp"
#include "utils/filesystem/JsonFileUtils.hpp"

#include <optional>

Q_LOGGING_CATEGORY(replaylog, "keyview.replay")

using namespace KeyView;

static void printErrors(const QString& header, const Utils::Result& result)
{
	qCritical().noquote() << header;
	for (const QString& e : result.errors)
		qCritical().noquote() << "  " << e;
}

static std::optional<QVector<qint64>> parseTimes(const QString& text)
{
	QVector<qint64> times;
	const QStringList parts = text.split(QLatin1Char(','), Qt::SkipEmptyParts);
	for (const QString& part : parts) {
		bool ok = false;
		const qint64 ms = part.trimmed().toLongLong(&ok);
		if (!ok || ms < 0)
			return std::nullopt;
		times.push_back(ms);
	}
	return times;
}

static bool writeOutput(const QString& path, const QByteArray& bytes)
{
	if (path.isEmpty()) {
		QTextStream(stdout) << bytes;
		return true;
	}

	QFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		qCritical().noquote() << "Cannot write" << path << ":" << file.errorString();
		return false;
	}
	return file.write(bytes) == bytes.size();
}

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("keyview-replay"));
	QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

	QCommandLineParser parser;
	parser.setApplicationDescription(
		QStringLiteral("Replays scripted input against a KeyView layout and prints the resulting frames as JSON."));
	parser.addHelpOption();
	parser.addVersionOption();

	const QCommandLineOption layoutOpt(QStringLiteral("layout"), QStringLiteral("Layout file."), QStringLiteral("file"));
	const QCommandLineOption styleOpt(QStringLiteral("style"), QStringLiteral("Style file."), QStringLiteral("file"));
	const QCommandLineOption settingsOpt(QStringLiteral("settings"), QStringLiteral("Settings file."), QStringLiteral("file"));
	const QCommandLineOption eventsOpt(QStringLiteral("events"), QStringLiteral("Event script."), QStringLiteral("file"));
	const QCommandLineOption atOpt(QStringLiteral("at"),
	                               QStringLiteral("Comma separated frame times in ms. Defaults to the last event."),
	                               QStringLiteral("times"));
	const QCommandLineOption editOpt(QStringLiteral("edit"), QStringLiteral("Run in edit mode."));
	const QCommandLineOption outputOpt(QStringLiteral("output"), QStringLiteral("Write frames here instead of stdout."),
	                                   QStringLiteral("file"));
	const QCommandLineOption normLayoutOpt(QStringLiteral("normalize-layout"),
	                                       QStringLiteral("Re-encode the loaded layout to this file."),
	                                       QStringLiteral("file"));
	const QCommandLineOption normStyleOpt(QStringLiteral("normalize-style"),
	                                      QStringLiteral("Re-encode the loaded style to this file."),
	                                      QStringLiteral("file"));
	const QCommandLineOption verboseOpt(QStringLiteral("verbose"), QStringLiteral("Enable debug logging."));

	parser.addOptions({layoutOpt, styleOpt, settingsOpt, eventsOpt, atOpt, editOpt, outputOpt,
	                   normLayoutOpt, normStyleOpt, verboseOpt});
	parser.process(app);

	if (parser.isSet(verboseOpt))
		QLoggingCategory::setFilterRules(QStringLiteral("keyview.*.debug=true"));

	if (!parser.isSet(layoutOpt) || !parser.isSet(eventsOpt)) {
		qCritical().noquote() << "Both --layout and --events are required.";
		return 1;
	}

	Engine::Session session;

	LayoutModel::SchemaError schemaError;
	Utils::Result r = session.loadLayoutFile(parser.value(layoutOpt), &schemaError);
	if (!r) {
		printErrors(QStringLiteral("Failed to load layout:"), r);
		return 1;
	}
	if (parser.isSet(styleOpt)) {
		r = session.loadStyleFile(parser.value(styleOpt), &schemaError);
		if (!r) {
			printErrors(QStringLiteral("Failed to load style:"), r);
			return 1;
		}
	}
	if (parser.isSet(settingsOpt)) {
		r = session.loadSettingsFile(parser.value(settingsOpt));
		if (!r) {
			printErrors(QStringLiteral("Failed to load settings:"), r);
			return 1;
		}
	}

	if (parser.isSet(normLayoutOpt)) {
		r = session.saveLayoutFile(parser.value(normLayoutOpt));
		if (!r) {
			printErrors(QStringLiteral("Failed to write layout:"), r);
			return 1;
		}
	}
	if (parser.isSet(normStyleOpt)) {
		r = session.saveStyleFile(parser.value(normStyleOpt));
		if (!r) {
			printErrors(QStringLiteral("Failed to write style:"), r);
			return 1;
		}
	}

	QString readError;
	const QJsonArray script = Utils::JsonFileUtils::readArray(parser.value(eventsOpt), &readError);
	if (!readError.isEmpty()) {
		qCritical().noquote() << "Failed to read event script:" << readError;
		return 1;
	}

	QVector<Engine::ReplayStep> steps;
	r = Engine::ReplayScript::parse(script, steps);
	if (!r) {
		printErrors(QStringLiteral("Invalid event script:"), r);
		return 1;
	}

	QVector<qint64> frameTimes;
	if (parser.isSet(atOpt)) {
		const std::optional<QVector<qint64>> times = parseTimes(parser.value(atOpt));
		if (!times || times->isEmpty()) {
			qCritical().noquote() << "--at expects comma separated non-negative integers, got" << parser.value(atOpt);
			return 1;
		}
		frameTimes = *times;
	} else {
		frameTimes.push_back(steps.isEmpty() ? 0 : steps.constLast().at.count());
	}

	session.setEditMode(parser.isSet(editOpt));
	qCInfo(replaylog) << "Replaying" << steps.size() << "steps," << frameTimes.size() << "frames";

	// Any fixed origin works: only differences between event times matter.
	const InputState::TimePoint start = InputState::Clock::now();
	const QJsonArray frames = Engine::ReplayScript::run(session, steps, frameTimes, start);

	if (!writeOutput(parser.value(outputOpt), QJsonDocument(frames).toJson(QJsonDocument::Indented)))
		return 1;
	return 0;
}
