#pragma once

#include <nlohmann/json.hpp>
#include <opencv2/core/types.hpp>

#include <cstddef>
#include <filesystem>
#include <vector>

namespace bubbler::vision::core {

//! Position of a single answer bubble on the aligned canvas.
struct TemplateEntry {
	unsigned questionNumber; //!< Positive question number.
	char option;             //!< Single uppercase option letter.
	cv::Point2f center;      //!< Bubble center in canvas pixels.
};

/*! Maps (question, option) to a bubble center on the canonical canvas.
 *  Entries keep their insertion order. This order is the template iteration order used when resolving ties.
 *  Invariants: question numbers are positive, options are uppercase letters and unique per question.
 */
class SheetTemplate {
public:
	//! Append a bubble. Throws TemplateError if the entry breaks an invariant.
	void add(unsigned questionNumber, char option, cv::Point2f center);

	const std::vector<TemplateEntry>& entries() const {
		return m_entries;
	}

	std::vector<unsigned> questions() const; //!< Distinct question numbers in order of first appearance.
	std::size_t questionCount() const;
	bool empty() const {
		return m_entries.empty();
	}

	//! Parse a template of the form {"1": {"A": [x, y], ...}, ...}. Keeps the document order.
	static SheetTemplate fromJson(const nlohmann::ordered_json& document);

	//! Read and parse a template file. Throws TemplateError on I/O or format problems.
	static SheetTemplate load(const std::filesystem::path& path);

private:
	std::vector<TemplateEntry> m_entries{};
};

//! Illustrative three question, four option layout. Lets the pipeline run end to end without a real template.
SheetTemplate exampleTemplate();

} // namespace bubbler::vision::core
