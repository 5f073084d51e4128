#include "vision/core/bubbleResolver.hpp"
#include "vision/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <opencv2/imgproc.hpp>

namespace bubbler::vision::core {

const ResolvedAnswer* ResolvedSheet::find(const unsigned questionNumber) const {
	const auto it = std::find_if(answers.begin(), answers.end(), [questionNumber](const ResolvedAnswer& a) { return a.choice.questionNumber == questionNumber; });
	return it == answers.end() ? nullptr : &*it;
}

std::vector<BubbleObservation> inferBubbles(const cv::Mat& aligned, const SheetTemplate& sheet, FillClassifier& classifier, const ResolverConfig& config) {
	const auto& entries = sheet.entries();
	if (entries.empty()) {
		return {};
	}

	const std::vector<cv::Mat> patches = extractPatches(aligned, sheet, config.patch);
	const std::vector<float> probs     = classifier.predict(patches);
	if (probs.size() != patches.size()) {
		throw InferenceError("classifier '" + std::string(classifier.name()) + "' returned " + std::to_string(probs.size()) + " probabilities for " +
		                     std::to_string(patches.size()) + " patches");
	}

	std::vector<BubbleObservation> observations;
	for (std::size_t i = 0; i < entries.size(); ++i) {
		if (!std::isfinite(probs[i])) {
			spdlog::warn("Classifier '{}' returned {} for bubble {}{}, treated as empty", classifier.name(), probs[i], entries[i].questionNumber,
			             entries[i].option);
			continue;
		}
		if (probs[i] < config.fillThreshold) {
			continue;
		}
		const auto& entry = entries[i];
		observations.push_back({entry.questionNumber, entry.option, entry.center.x, entry.center.y, probs[i]});
	}

	spdlog::debug("Classifier '{}': {} of {} bubbles at or above {:.2f}", classifier.name(), observations.size(), entries.size(), config.fillThreshold);
	return observations;
}

ResolvedSheet resolveAnswers(const std::vector<BubbleObservation>& observations, const SheetTemplate& sheet) {
	ResolvedSheet result;
	std::unordered_map<unsigned, std::size_t> slot; //!< Question -> index into result.answers.

	for (const auto& obs: observations) {
		const auto [it, inserted] = slot.try_emplace(obs.questionNumber, result.answers.size());
		if (inserted) {
			result.answers.push_back({obs, 1u});
			continue;
		}

		ResolvedAnswer& current = result.answers[it->second];
		++current.markedCount;
		if (obs.confidence > current.choice.confidence) {
			current.choice = obs;
		}
	}

	for (const unsigned question: sheet.questions()) {
		if (slot.find(question) == slot.end()) {
			result.unanswered.push_back(question);
		}
	}

	for (const auto& answer: result.answers) {
		if (answer.multiMarked()) {
			spdlog::warn("Question {} has {} marked bubbles, kept {} ({:.2f})", answer.choice.questionNumber, answer.markedCount, answer.choice.option,
			             answer.choice.confidence);
		}
	}
	if (!result.unanswered.empty()) {
		spdlog::warn("{} question(s) without a detected answer", result.unanswered.size());
	}

	return result;
}

cv::Mat renderResolution(const cv::Mat& aligned, const SheetTemplate& sheet, const std::vector<BubbleObservation>& observations,
                         const ResolvedSheet& resolved, const int patchSize) {
	static const cv::Scalar GREY(140, 140, 140);
	static const cv::Scalar GREEN(0, 200, 0);
	static const cv::Scalar RED(0, 0, 220);

	cv::Mat overlay;
	if (aligned.channels() == 1) {
		cv::cvtColor(aligned, overlay, cv::COLOR_GRAY2BGR);
	} else {
		overlay = aligned.clone();
	}

	const auto key = [](unsigned question, char option) { return question * 256u + static_cast<unsigned char>(option); };

	std::unordered_set<unsigned> passing;
	for (const auto& obs: observations) {
		passing.insert(key(obs.questionNumber, obs.option));
	}

	const int radius = std::max(2, patchSize / 2);
	for (const auto& entry: sheet.entries()) {
		const cv::Point center(cvRound(entry.center.x), cvRound(entry.center.y));
		const ResolvedAnswer* answer = resolved.find(entry.questionNumber);

		if (answer && answer->choice.option == entry.option) {
			cv::circle(overlay, center, radius, answer->multiMarked() ? RED : GREEN, 3, cv::LINE_AA);
		} else if (passing.count(key(entry.questionNumber, entry.option)) != 0u) {
			cv::circle(overlay, center, radius, GREEN, 1, cv::LINE_AA);
		} else {
			cv::circle(overlay, center, radius, GREY, 1, cv::LINE_AA);
		}
	}

	return overlay;
}

} // namespace bubbler::vision::core
