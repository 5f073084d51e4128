#pragma once

#include "vision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>

// Alignment is the first step of the extraction.
// The scanner is assumed to deliver the sheet with a stable aspect ratio and framing. The raw scan is binarised and stretched
// onto the canonical canvas, which is the coordinate space of every SheetTemplate. No corner markers are searched and no
// perspective is corrected.
namespace bubbler::vision::core {

//! Canonical canvas of an A4 sheet scanned at 300 dpi.
static constexpr int TEMPLATE_WIDTH  = 2480;
static constexpr int TEMPLATE_HEIGHT = 3508;

struct AlignConfig {
	cv::Size canvasSize{TEMPLATE_WIDTH, TEMPLATE_HEIGHT}; //!< Output size. All template coordinates refer to it.
	int blurKernelSize{5};                                //!< Gaussian kernel suppressing scan noise. Forced odd.
};

/*! Normalise a decoded scan to the canvas.
 * \param [in]     image    Raster image with 1, 3 or 4 channels.
 * \param [in]     config   Canvas and preprocessing settings.
 * \param [in,out] debugger Optional collector for intermediate images.
 * \returns        CV_8UC1 image of config.canvasSize. Marks (filled bubbles) are dark, paper is bright.
 * \throws         ImageLoadError if the image is empty or has an unsupported channel count.
 */
cv::Mat alignSheet(const cv::Mat& image, const AlignConfig& config = AlignConfig{}, DebugVisualizer* debugger = nullptr);

//! Decode the file and align it. Throws ImageLoadError if the file cannot be decoded.
cv::Mat loadAndAlign(const std::filesystem::path& path, const AlignConfig& config = AlignConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace bubbler::vision::core
