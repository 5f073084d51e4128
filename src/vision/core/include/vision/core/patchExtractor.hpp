#pragma once

#include "vision/core/sheetTemplate.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace bubbler::vision::core {

struct PatchConfig {
	int size{28}; //!< Edge length of the square patch in pixels.
};

/*! Cut a square patch centered on a bubble.
 * \param [in] aligned Aligned CV_8UC1 canvas.
 * \param [in] center  Bubble center in canvas pixels.
 * \param [in] size    Patch edge length.
 * \returns    CV_32FC1 patch of exactly size x size with values in [0, 1].
 * \note       Crops clipped by the canvas border are resized back to size x size, never padded.
 *             A crop lying completely outside the canvas yields an all-ones (blank paper) patch.
 */
cv::Mat cropPatch(const cv::Mat& aligned, cv::Point2f center, int size = PatchConfig{}.size);

//! One patch per template entry, in template order.
std::vector<cv::Mat> extractPatches(const cv::Mat& aligned, const SheetTemplate& sheet, const PatchConfig& config = PatchConfig{});

} // namespace bubbler::vision::core
