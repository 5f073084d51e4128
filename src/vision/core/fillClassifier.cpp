#include "vision/core/fillClassifier.hpp"
#include "vision/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <system_error>
#include <utility>

namespace bubbler::vision::core {

//! NaN reads as an empty bubble.
static float clampProbability(const double value) {
	if (std::isnan(value)) {
		return 0.0f;
	}
	return static_cast<float>(std::clamp(value, 0.0, 1.0));
}

std::vector<float> HeuristicClassifier::predict(const std::vector<cv::Mat>& patches) {
	std::vector<float> probabilities;
	probabilities.reserve(patches.size());
	for (const auto& patch: patches) {
		probabilities.push_back(patch.empty() ? 0.0f : clampProbability(1.0 - cv::mean(patch)[0]));
	}
	return probabilities;
}

ModelClassifier::ModelClassifier(cv::dnn::Net net, const ModelConfig& config) : m_net{std::move(net)}, m_config{config} {
}

std::unique_ptr<ModelClassifier> ModelClassifier::load(const std::filesystem::path& path, const ModelConfig& config) {
	std::error_code ec;
	if (!std::filesystem::is_regular_file(path, ec)) {
		throw ModelLoadError("no model file at " + path.string());
	}

	cv::dnn::Net net;
	try {
		net = cv::dnn::readNet(path.string());
	} catch (const cv::Exception& e) {
		throw ModelLoadError(path.string() + ": " + e.what());
	}
	if (net.empty()) {
		throw ModelLoadError(path.string() + ": network is empty");
	}

	spdlog::info("Loaded fill model {}", path.string());
	return std::unique_ptr<ModelClassifier>(new ModelClassifier(std::move(net), config));
}

std::vector<float> ModelClassifier::predict(const std::vector<cv::Mat>& patches) {
	if (patches.empty()) {
		return {};
	}

	const int n = static_cast<int>(patches.size());
	const int h = patches.front().rows;
	const int w = patches.front().cols;

	cv::Mat blob = cv::dnn::blobFromImages(patches, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
	if (m_config.channelsLast) {
		// Single channel: NCHW and NHWC share the same memory layout, only the shape differs.
		const int shape[] = {n, h, w, 1};
		blob              = blob.reshape(1, 4, shape);
	}

	cv::Mat output;
	try {
		m_net.setInput(blob);
		output = m_net.forward();
	} catch (const cv::Exception& e) {
		throw InferenceError(e.what());
	}

	if (output.total() != static_cast<std::size_t>(n) && output.total() != static_cast<std::size_t>(2 * n)) {
		throw InferenceError("model returned " + std::to_string(output.total()) + " values for a batch of " + std::to_string(n));
	}

	// One column: probability of filled. Two columns: (empty, filled) scores.
	const int table[]   = {n, static_cast<int>(output.total()) / n};
	const cv::Mat rows  = output.reshape(1, 2, table);
	const int filledCol = rows.cols - 1;

	cv::Mat scores;
	rows.col(filledCol).convertTo(scores, CV_32F);

	std::vector<float> probabilities;
	probabilities.reserve(patches.size());
	for (int i = 0; i < n; ++i) {
		probabilities.push_back(clampProbability(scores.at<float>(i, 0)));
	}

	const auto filled = std::count_if(probabilities.begin(), probabilities.end(), [this](float p) { return isFilled(p); });
	spdlog::debug("Model considers {} of {} patches filled (decision threshold {:.2f})", filled, n, m_config.decisionThreshold);
	return probabilities;
}

std::unique_ptr<FillClassifier> makeClassifier(const std::optional<std::filesystem::path>& modelPath, const ModelConfig& config) {
	if (!modelPath || modelPath->empty()) {
		return std::make_unique<HeuristicClassifier>();
	}

	try {
		return ModelClassifier::load(*modelPath, config);
	} catch (const ModelLoadError& e) {
		spdlog::warn("{}. Falling back to the intensity heuristic.", e.what());
	}
	return std::make_unique<HeuristicClassifier>();
}

} // namespace bubbler::vision::core
