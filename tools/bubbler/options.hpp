#pragma once

#include "backend/gradingClient.hpp"
#include "vision/core/fillClassifier.hpp"
#include "vision/sheetReader.hpp"

#include <QtCore/QStringList>

#include <filesystem>
#include <optional>
#include <string>

namespace bubbler::cli {

enum class Mode { AnswerKey, Student, Evaluate };

//! Everything the command line configures for one run.
struct Options {
	Mode mode{Mode::Student};

	std::optional<std::filesystem::path> image{};
	std::optional<std::filesystem::path> templatePath{}; //!< Built-in example template if unset.
	std::optional<std::filesystem::path> modelPath{};
	std::optional<std::filesystem::path> answerKeyJson{};
	std::optional<std::filesystem::path> studentJson{};
	std::optional<std::filesystem::path> output{};      //!< stdout if unset.
	std::optional<std::filesystem::path> debugMosaic{};
	std::optional<std::string> submissionId{};

	bool offline{false};
	bool verbose{false};

	vision::ReaderConfig reader{};
	vision::core::ModelConfig model{};
	backend::BackendConfig backend{};
};

//! Parse the arguments. Handles --help and --version itself. Throws std::invalid_argument on bad input.
Options parseOptions(const QStringList& arguments);

} // namespace bubbler::cli
