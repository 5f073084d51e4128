#include "options.hpp"

#include "backend/gradingClient.hpp"
#include "backend/qtGradingClient.hpp"
#include "report/records.hpp"
#include "report/scoring.hpp"
#include "vision/core/debugVisualizer.hpp"
#include "vision/core/errors.hpp"
#include "vision/sheetReader.hpp"

#include <QtCore/QCoreApplication>

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bubbler::cli {

//! JSON goes to stdout (or --output). Logs stay on stderr.
static void writeOutput(const Options& options, const std::string& text) {
	if (!options.output) {
		std::cout << text << '\n';
		return;
	}

	std::ofstream file(*options.output);
	if (!file || !(file << text << '\n')) {
		throw std::runtime_error("cannot write " + options.output->string());
	}
	spdlog::info("Wrote {}", options.output->string());
}

template<typename Record>
static std::vector<Record> loadRecords(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		throw report::RecordError("cannot open " + path.string());
	}

	nlohmann::json document;
	try {
		document = nlohmann::json::parse(file);
	} catch (const nlohmann::json::parse_error& e) {
		throw report::RecordError(path.string() + ": " + e.what());
	}
	if (!document.is_array()) {
		throw report::RecordError(path.string() + ": expected a JSON array of records");
	}
	return document.get<std::vector<Record>>();
}

static vision::core::ResolvedSheet readSheet(const Options& options) {
	vision::core::SheetTemplate sheet =
	        options.templatePath ? vision::core::SheetTemplate::load(*options.templatePath) : vision::core::exampleTemplate();
	if (!options.templatePath) {
		spdlog::warn("No --template given, using the built-in example layout");
	}

	const vision::SheetReader reader(std::move(sheet), options.reader, vision::core::makeClassifier(options.modelPath, options.model));
	spdlog::debug("Fill classifier: {}", reader.classifier().name());

	vision::core::DebugVisualizer debugger;
	const vision::core::ResolvedSheet resolved = reader.read(*options.image, options.debugMosaic ? &debugger : nullptr);

	if (options.debugMosaic) {
		const cv::Mat mosaic = debugger.buildMosaic();
		if (mosaic.empty() || !cv::imwrite(options.debugMosaic->string(), mosaic)) {
			spdlog::warn("Could not write debug mosaic {}", options.debugMosaic->string());
		}
	}

	for (const unsigned question: resolved.unanswered) {
		spdlog::warn("No answer detected for question {}", question);
	}
	return resolved;
}

static void submit(const Options& options, const report::EvaluationPayload& payload) {
	backend::QtGradingClient client;
	const backend::BackendResponse response = backend::evaluate(client, options.backend, *options.submissionId, payload);
	writeOutput(options, response.body);
}

static int run(const Options& options) {
	switch (options.mode) {
	case Mode::AnswerKey: {
		const auto sheet = readSheet(options);
		writeOutput(options, nlohmann::json(report::buildAnswerKey(sheet)).dump(2));
		break;
	}

	case Mode::Student: {
		const auto sheet = readSheet(options);
		auto answers     = report::buildStudentAnswers(sheet);
		if (!options.submissionId) {
			writeOutput(options, nlohmann::json(answers).dump(2));
			break;
		}
		submit(options, {loadRecords<report::AnswerKeyEntry>(*options.answerKeyJson), std::move(answers)});
		break;
	}

	case Mode::Evaluate: {
		report::EvaluationPayload payload{
		        loadRecords<report::AnswerKeyEntry>(*options.answerKeyJson),
		        loadRecords<report::StudentAnswer>(*options.studentJson),
		};
		if (options.offline) {
			writeOutput(options, nlohmann::json(report::scoreSheet(payload)).dump(2));
			break;
		}
		submit(options, payload);
		break;
	}
	}
	return 0;
}

} // namespace bubbler::cli

int main(int argc, char** argv) {
	QCoreApplication application(argc, argv);
	QCoreApplication::setApplicationName("bubbler");
	QCoreApplication::setApplicationVersion(BUBBLER_VERSION);

	spdlog::set_default_logger(spdlog::stderr_color_st("bubbler"));
	spdlog::cfg::load_env_levels();

	try {
		const bubbler::cli::Options options = bubbler::cli::parseOptions(QCoreApplication::arguments());
		if (options.verbose) {
			spdlog::set_level(spdlog::level::debug);
		}
		return bubbler::cli::run(options);
	} catch (const bubbler::backend::BackendError& e) {
		spdlog::error("{}", e.what());
		if (!e.body().empty()) {
			spdlog::error("Response body: {}", e.body());
		}
	} catch (const bubbler::vision::core::Error& e) {
		spdlog::error("{}", e.what());
	} catch (const bubbler::report::RecordError& e) {
		spdlog::error("{}", e.what());
	} catch (const nlohmann::json::exception& e) {
		spdlog::error("Malformed JSON: {}", e.what());
	} catch (const std::exception& e) {
		spdlog::error("{}", e.what());
	}
	return 1;
}
