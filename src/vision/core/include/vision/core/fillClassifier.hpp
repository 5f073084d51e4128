#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/dnn.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace bubbler::vision::core {

//! Estimates for each patch the probability that its bubble is filled.
class FillClassifier {
public:
	virtual ~FillClassifier() = default;

	/*! Classify a batch in one call.
	 * \param [in] patches CV_32FC1 patches of identical size, values in [0, 1].
	 * \returns    One probability in [0, 1] per patch, in input order.
	 */
	virtual std::vector<float> predict(const std::vector<cv::Mat>& patches) = 0;

	virtual std::string_view name() const = 0;
};

//! Darker patch, higher probability: p = 1 - mean(patch). Needs no model.
class HeuristicClassifier final : public FillClassifier {
public:
	std::vector<float> predict(const std::vector<cv::Mat>& patches) override;
	std::string_view name() const override {
		return "heuristic";
	}
};

struct ModelConfig {
	bool channelsLast{false};       //!< Feed N x H x W x 1 instead of N x 1 x H x W.
	float decisionThreshold{0.5f};  //!< The model's own filled/empty cut. Independent of the resolver's fill threshold.
};

//! Network run through OpenCV DNN. Any format cv::dnn::readNet understands (ONNX, Caffe prototxt, ...).
class ModelClassifier final : public FillClassifier {
public:
	//! Read the network. Throws ModelLoadError if the file is missing or cannot be parsed.
	static std::unique_ptr<ModelClassifier> load(const std::filesystem::path& path, const ModelConfig& config = ModelConfig{});

	//! Single forward pass over the whole batch. Throws InferenceError on an output/batch size mismatch.
	std::vector<float> predict(const std::vector<cv::Mat>& patches) override;
	std::string_view name() const override {
		return "model";
	}

	bool isFilled(float probability) const {
		return probability >= m_config.decisionThreshold;
	}

private:
	ModelClassifier(cv::dnn::Net net, const ModelConfig& config);

private:
	cv::dnn::Net m_net;
	ModelConfig m_config;
};

/*! Select the classifier once for a run.
 * Loads the model only if a path is given. A ModelLoadError is logged and answered with the heuristic classifier.
 */
std::unique_ptr<FillClassifier> makeClassifier(const std::optional<std::filesystem::path>& modelPath, const ModelConfig& config = ModelConfig{});

} // namespace bubbler::vision::core
