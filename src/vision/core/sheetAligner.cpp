#include "vision/core/sheetAligner.hpp"
#include "vision/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace bubbler::vision::core {

static int makeOddKernelSize(int value) {
	value = std::max(1, value);
	return (value % 2 == 0) ? value + 1 : value;
}

//! Convert image to grayscale independent of channel format.
static bool convertToGray(const cv::Mat& image, cv::Mat& outGray) {
	switch (image.channels()) {
	case 1:
		outGray = image.clone();
		return true;
	case 3:
		cv::cvtColor(image, outGray, cv::COLOR_BGR2GRAY);
		return true;
	case 4:
		cv::cvtColor(image, outGray, cv::COLOR_BGRA2GRAY);
		return true;
	default:
		return false;
	}
}

cv::Mat alignSheet(const cv::Mat& image, const AlignConfig& config, DebugVisualizer* debugger) {
	if (image.empty()) {
		throw ImageLoadError("image is empty");
	}
	if (config.canvasSize.width <= 0 || config.canvasSize.height <= 0) {
		throw ImageLoadError("canvas size must be positive");
	}

	cv::Mat gray;
	if (!convertToGray(image, gray)) {
		throw ImageLoadError("unsupported channel count " + std::to_string(image.channels()));
	}
	if (gray.depth() != CV_8U) {
		// Otsu needs 8 bit input. 16 bit scans are scaled down, float scans are expected in [0, 1].
		const double scale = gray.depth() == CV_16U ? 1.0 / 257.0 : (gray.depth() == CV_32F || gray.depth() == CV_64F ? 255.0 : 1.0);
		gray.convertTo(gray, CV_8U, scale);
	}

	const int kernel = makeOddKernelSize(config.blurKernelSize);
	cv::Mat blurred;
	cv::GaussianBlur(gray, blurred, cv::Size(kernel, kernel), 0);

	// Inverted Otsu: marks become the bright foreground of the mask.
	cv::Mat markMask;
	const double otsu = cv::threshold(blurred, markMask, 0.0, 255.0, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

	cv::Mat resizedMask;
	cv::resize(markMask, resizedMask, config.canvasSize, 0.0, 0.0, cv::INTER_LINEAR);

	// Flip back so filled bubbles read dark on the canvas.
	cv::Mat canvas = cv::Scalar(255) - resizedMask;

	spdlog::debug("Aligned {}x{} scan to {}x{} canvas (otsu threshold {:.1f})", image.cols, image.rows, canvas.cols, canvas.rows, otsu);

	if (debugger) {
		debugger->beginStage("Align");
		debugger->add("Gray", gray);
		debugger->add("Blurred", blurred);
		debugger->add("Mark Mask", markMask);
		debugger->add("Canvas", canvas);
		debugger->endStage();
	}

	return canvas;
}

cv::Mat loadAndAlign(const std::filesystem::path& path, const AlignConfig& config, DebugVisualizer* debugger) {
	const cv::Mat image = cv::imread(path.string(), cv::IMREAD_COLOR);
	if (image.empty()) {
		throw ImageLoadError("cannot read image " + path.string());
	}
	return alignSheet(image, config, debugger);
}

} // namespace bubbler::vision::core
