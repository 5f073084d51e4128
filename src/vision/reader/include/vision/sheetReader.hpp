#pragma once

#include "vision/core/bubbleResolver.hpp"
#include "vision/core/debugVisualizer.hpp"
#include "vision/core/fillClassifier.hpp"
#include "vision/core/sheetAligner.hpp"
#include "vision/core/sheetTemplate.hpp"

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <memory>

namespace bubbler::vision {

struct ReaderConfig {
	core::AlignConfig align{};
	core::ResolverConfig resolver{};
};

/*! Reads the answers of scanned bubble sheets laid out by one template.
 *  Process per sheet:
 *   - Align the scan to the template canvas.
 *   - Crop a patch per templated bubble and classify all of them in one batch.
 *   - Keep the bubbles above the fill threshold and resolve one option per question.
 *  The classifier is chosen once at construction. Reading is synchronous and keeps no state between sheets.
 */
class SheetReader {
public:
	SheetReader(core::SheetTemplate sheet, ReaderConfig config, std::unique_ptr<core::FillClassifier> classifier);

	//! Decode and read a sheet. Throws core::ImageLoadError if the file cannot be decoded.
	core::ResolvedSheet read(const std::filesystem::path& imagePath, core::DebugVisualizer* debugger = nullptr) const;

	//! Read an already decoded scan.
	core::ResolvedSheet read(const cv::Mat& image, core::DebugVisualizer* debugger = nullptr) const;

	//! Resolve answers on a canvas produced by core::alignSheet.
	core::ResolvedSheet readAligned(const cv::Mat& aligned, core::DebugVisualizer* debugger = nullptr) const;

	const core::SheetTemplate& sheetTemplate() const {
		return m_template;
	}
	const ReaderConfig& config() const {
		return m_config;
	}
	const core::FillClassifier& classifier() const {
		return *m_classifier;
	}

private:
	core::SheetTemplate m_template;                     //!< Bubble layout, read-only.
	ReaderConfig m_config;                              //!< Alignment and resolution settings.
	std::unique_ptr<core::FillClassifier> m_classifier; //!< Selected once, never null.
};

} // namespace bubbler::vision
