#pragma once

#include "report/records.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <string>
#include <vector>

namespace bubbler::report {

//! Inclusive question range belonging to one subject.
struct SubjectBand {
	std::string name;
	unsigned first;
	unsigned last;
};

//! Marking scheme of the grading backend (NEET layout by default).
struct ScoringRules {
	int correctMarks{4};
	int incorrectMarks{-1};
	std::vector<SubjectBand> subjects{
	        {"Physics", 1u, 50u},
	        {"Chemistry", 51u, 100u},
	        {"Biology", 101u, std::numeric_limits<unsigned>::max()},
	};

	//! First band containing the question. Falls back to the last band's name.
	std::string subjectOf(unsigned questionNumber) const;
};

struct WrongAnswer {
	unsigned questionNumber;
	std::string subject;
	char selectedOption;
	char correctOption;
};

struct SubjectMarks {
	std::string subject;
	int marks{0};
};

//! Local preview of the backend's evaluation.
struct ScoreSummary {
	std::vector<SubjectMarks> subjectMarks; //!< One entry per band, in rule order.
	int totalMarks{0};
	unsigned correctCount{0u};
	unsigned incorrectCount{0u};
	unsigned unattemptedCount{0u};
	std::vector<WrongAnswer> wrongQuestions{};
};

/*! Score the student answers against the key without contacting the backend.
 *  Every answer-key question is scored once. A later duplicate key entry replaces the option but keeps the first position.
 *  A key question without a student answer, or with a blank one, counts as unattempted.
 */
ScoreSummary scoreSheet(const EvaluationPayload& payload, const ScoringRules& rules = ScoringRules{});

void to_json(nlohmann::json& j, const ScoreSummary& summary);

} // namespace bubbler::report
