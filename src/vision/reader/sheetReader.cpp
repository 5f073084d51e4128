#include "vision/sheetReader.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace bubbler::vision {

SheetReader::SheetReader(core::SheetTemplate sheet, ReaderConfig config, std::unique_ptr<core::FillClassifier> classifier)
        : m_template{std::move(sheet)}, m_config{config}, m_classifier{std::move(classifier)} {
	if (!m_classifier) {
		m_classifier = std::make_unique<core::HeuristicClassifier>();
	}
	if (m_template.empty()) {
		throw std::invalid_argument("SheetReader needs a template with at least one bubble");
	}

	// Bubbles outside the canvas still read as blank paper, but they are almost certainly a template mistake.
	const cv::Rect canvas(cv::Point(0, 0), m_config.align.canvasSize);
	for (const auto& entry: m_template.entries()) {
		if (!canvas.contains(cv::Point(cvRound(entry.center.x), cvRound(entry.center.y)))) {
			spdlog::warn("Bubble {}{} at ({}, {}) lies outside the {}x{} canvas", entry.questionNumber, entry.option, entry.center.x, entry.center.y,
			             canvas.width, canvas.height);
		}
	}
}

core::ResolvedSheet SheetReader::read(const std::filesystem::path& imagePath, core::DebugVisualizer* debugger) const {
	spdlog::info("Reading sheet {}", imagePath.string());
	return readAligned(core::loadAndAlign(imagePath, m_config.align, debugger), debugger);
}

core::ResolvedSheet SheetReader::read(const cv::Mat& image, core::DebugVisualizer* debugger) const {
	return readAligned(core::alignSheet(image, m_config.align, debugger), debugger);
}

core::ResolvedSheet SheetReader::readAligned(const cv::Mat& aligned, core::DebugVisualizer* debugger) const {
	const auto observations     = core::inferBubbles(aligned, m_template, *m_classifier, m_config.resolver);
	core::ResolvedSheet resolved = core::resolveAnswers(observations, m_template);

	spdlog::info("Resolved {} of {} questions ({} unanswered)", resolved.answers.size(), m_template.questionCount(), resolved.unanswered.size());

	if (debugger) {
		debugger->beginStage("Classify");
		debugger->add("Bubbles", core::renderResolution(aligned, m_template, observations, resolved, m_config.resolver.patch.size));
		debugger->endStage();
	}
	return resolved;
}

} // namespace bubbler::vision
