#include "options.hpp"

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <cmath>
#include <stdexcept>

namespace bubbler::cli {

static std::filesystem::path toPath(const QString& value) {
	return std::filesystem::path(value.toStdString());
}

static Mode parseMode(const QString& value) {
	if (value == "answer_key") {
		return Mode::AnswerKey;
	}
	if (value == "student") {
		return Mode::Student;
	}
	if (value == "evaluate") {
		return Mode::Evaluate;
	}
	throw std::invalid_argument("unknown mode '" + value.toStdString() + "' (expected answer_key, student or evaluate)");
}

//! Parses "WIDTHxHEIGHT".
static cv::Size parseCanvas(const QString& value) {
	const QStringList parts = value.toLower().split('x');
	bool okW = false, okH = false;
	const int w = parts.size() == 2 ? parts[0].toInt(&okW) : 0;
	const int h = parts.size() == 2 ? parts[1].toInt(&okH) : 0;
	if (!okW || !okH || w <= 0 || h <= 0) {
		throw std::invalid_argument("canvas must look like 2480x3508, got '" + value.toStdString() + "'");
	}
	return {w, h};
}

Options parseOptions(const QStringList& arguments) {
	QCommandLineParser parser;
	parser.setApplicationDescription("Extract bubble sheet answers and submit them for grading.");
	parser.addHelpOption();
	parser.addVersionOption();

	const QCommandLineOption modeOpt("mode", "answer_key, student or evaluate.", "mode");
	const QCommandLineOption imageOpt("image", "Scanned sheet to read.", "path");
	const QCommandLineOption templateOpt("template", "Bubble template JSON. Defaults to the built-in example layout.", "path");
	const QCommandLineOption modelOpt("model", "Optional ONNX fill classifier. Falls back to the intensity heuristic.", "path");
	const QCommandLineOption thresholdOpt("threshold", "Fill threshold in [0, 1].", "value", "0.7");
	const QCommandLineOption canvasOpt("canvas", "Canvas size WIDTHxHEIGHT.", "size", "2480x3508");
	const QCommandLineOption patchOpt("patch-size", "Patch edge length in pixels.", "pixels", "28");
	const QCommandLineOption channelsLastOpt("channels-last", "Feed the model N x H x W x 1 tensors.");
	const QCommandLineOption keyJsonOpt("answer-key-json", "Answer key records (JSON array).", "path");
	const QCommandLineOption studentJsonOpt("student-json", "Student answer records (JSON array).", "path");
	const QCommandLineOption submissionOpt("submission-id", "Submit to the grading backend under this id.", "id");
	const QCommandLineOption apiBaseOpt("api-base", "Examiner API base URL.", "url", QString::fromStdString(backend::BackendConfig{}.apiBase));
	const QCommandLineOption tokenOpt("token", "Bearer token for the Authorization header.", "token");
	const QCommandLineOption offlineOpt("offline", "Evaluate mode: print a local score preview instead of calling the backend.");
	const QCommandLineOption outputOpt(QStringList{"o", "output"}, "Write JSON here instead of stdout.", "path");
	const QCommandLineOption mosaicOpt("debug-mosaic", "Write an image of the intermediate pipeline stages.", "path");
	const QCommandLineOption verboseOpt(QStringList{"v", "verbose"}, "Debug logging.");

	parser.addOptions({modeOpt, imageOpt, templateOpt, modelOpt, thresholdOpt, canvasOpt, patchOpt, channelsLastOpt, keyJsonOpt, studentJsonOpt,
	                   submissionOpt, apiBaseOpt, tokenOpt, offlineOpt, outputOpt, mosaicOpt, verboseOpt});
	parser.process(arguments);

	if (!parser.isSet(modeOpt)) {
		throw std::invalid_argument("--mode is required");
	}

	Options options;
	options.mode    = parseMode(parser.value(modeOpt));
	options.offline = parser.isSet(offlineOpt);
	options.verbose = parser.isSet(verboseOpt);

	const auto optionalPath = [&parser](const QCommandLineOption& opt) -> std::optional<std::filesystem::path> {
		if (!parser.isSet(opt)) {
			return std::nullopt;
		}
		return toPath(parser.value(opt));
	};
	options.image         = optionalPath(imageOpt);
	options.templatePath  = optionalPath(templateOpt);
	options.modelPath     = optionalPath(modelOpt);
	options.answerKeyJson = optionalPath(keyJsonOpt);
	options.studentJson   = optionalPath(studentJsonOpt);
	options.output        = optionalPath(outputOpt);
	options.debugMosaic   = optionalPath(mosaicOpt);
	if (parser.isSet(submissionOpt)) {
		options.submissionId = parser.value(submissionOpt).toStdString();
	}

	bool ok               = false;
	const float threshold = parser.value(thresholdOpt).toFloat(&ok);
	if (!ok || !std::isfinite(threshold) || threshold < 0.0f || threshold > 1.0f) {
		throw std::invalid_argument("--threshold must be a number in [0, 1]");
	}
	options.reader.resolver.fillThreshold = threshold;

	const int patchSize = parser.value(patchOpt).toInt(&ok);
	if (!ok || patchSize <= 0) {
		throw std::invalid_argument("--patch-size must be a positive integer");
	}
	options.reader.resolver.patch.size = patchSize;
	options.reader.align.canvasSize    = parseCanvas(parser.value(canvasOpt));
	options.model.channelsLast         = parser.isSet(channelsLastOpt);

	options.backend.apiBase = parser.value(apiBaseOpt).toStdString();
	if (parser.isSet(tokenOpt)) {
		options.backend.token = parser.value(tokenOpt).toStdString();
	}

	// Mode specific requirements.
	switch (options.mode) {
	case Mode::AnswerKey:
	case Mode::Student:
		if (!options.image) {
			throw std::invalid_argument("--image is required in answer_key and student mode");
		}
		if (options.mode == Mode::Student && options.submissionId && !options.answerKeyJson) {
			throw std::invalid_argument("--submission-id in student mode needs --answer-key-json");
		}
		break;
	case Mode::Evaluate:
		if (!options.answerKeyJson || !options.studentJson) {
			throw std::invalid_argument("evaluate mode needs --answer-key-json and --student-json");
		}
		if (!options.offline && !options.submissionId) {
			throw std::invalid_argument("evaluate mode needs --submission-id or --offline");
		}
		break;
	}

	return options;
}

} // namespace bubbler::cli
