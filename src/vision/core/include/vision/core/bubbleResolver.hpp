#pragma once

#include "vision/core/fillClassifier.hpp"
#include "vision/core/patchExtractor.hpp"
#include "vision/core/sheetTemplate.hpp"

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <vector>

namespace bubbler::vision::core {

//! Bubble whose fill probability passed the threshold.
struct BubbleObservation {
	unsigned questionNumber;
	char option;
	float centerX;
	float centerY;
	float confidence; //!< Classifier probability in [0, 1].
};

struct ResolverConfig {
	float fillThreshold{0.7f}; //!< Minimum probability for a bubble to count as marked.
	PatchConfig patch{};
};

//! Winning bubble of one question.
struct ResolvedAnswer {
	BubbleObservation choice;
	std::size_t markedCount{1u}; //!< Passing bubbles of this question. More than one means the sheet was multi-marked.

	bool multiMarked() const {
		return markedCount > 1u;
	}
};

//! Outcome of the resolution for a whole sheet.
struct ResolvedSheet {
	std::vector<ResolvedAnswer> answers; //!< One per answered question, in order of the first passing observation.
	std::vector<unsigned> unanswered;    //!< Template questions without any passing bubble, in template order.

	const ResolvedAnswer* find(unsigned questionNumber) const; //!< Null if the question was not answered.
};

/*! Classify every templated bubble in one batch and keep those passing the fill threshold.
 * \returns Observations in template order.
 */
std::vector<BubbleObservation> inferBubbles(const cv::Mat& aligned, const SheetTemplate& sheet, FillClassifier& classifier,
                                            const ResolverConfig& config = ResolverConfig{});

/*! Pick one observation per question.
 * The strictly highest confidence wins. Equal confidences keep the first-seen observation.
 * Template questions without observations are reported in ResolvedSheet::unanswered.
 */
ResolvedSheet resolveAnswers(const std::vector<BubbleObservation>& observations, const SheetTemplate& sheet);

//! Draw every template bubble on the canvas. Passing bubbles green, winners thick (red if multi-marked), the rest grey.
cv::Mat renderResolution(const cv::Mat& aligned, const SheetTemplate& sheet, const std::vector<BubbleObservation>& observations,
                         const ResolvedSheet& resolved, int patchSize = PatchConfig{}.size);

} // namespace bubbler::vision::core
