#include "vision/core/patchExtractor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace bubbler::vision::core {

cv::Mat cropPatch(const cv::Mat& aligned, const cv::Point2f center, int size) {
	size = std::max(1, size);
	const int half = size / 2;

	const int x1 = static_cast<int>(std::lround(center.x)) - half;
	const int y1 = static_cast<int>(std::lround(center.y)) - half;

	const cv::Rect wanted(x1, y1, size, size);
	const cv::Rect clipped = wanted & cv::Rect(0, 0, aligned.cols, aligned.rows);

	if (clipped.empty()) {
		spdlog::debug("Patch at ({:.1f}, {:.1f}) lies outside the {}x{} canvas", center.x, center.y, aligned.cols, aligned.rows);
		return cv::Mat(size, size, CV_32FC1, cv::Scalar(1.0));
	}

	cv::Mat crop = aligned(clipped);
	if (crop.cols != size || crop.rows != size) {
		cv::Mat resized;
		cv::resize(crop, resized, cv::Size(size, size), 0.0, 0.0, cv::INTER_LINEAR);
		crop = resized;
	}

	cv::Mat patch;
	crop.convertTo(patch, CV_32F, 1.0 / 255.0);
	return patch;
}

std::vector<cv::Mat> extractPatches(const cv::Mat& aligned, const SheetTemplate& sheet, const PatchConfig& config) {
	std::vector<cv::Mat> patches;
	patches.reserve(sheet.entries().size());
	for (const auto& entry: sheet.entries()) {
		patches.push_back(cropPatch(aligned, entry.center, config.size));
	}
	return patches;
}

} // namespace bubbler::vision::core
