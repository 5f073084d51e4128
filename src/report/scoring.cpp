#include "report/scoring.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <utility>

namespace bubbler::report {

std::string ScoringRules::subjectOf(const unsigned questionNumber) const {
	const auto it = std::find_if(subjects.begin(), subjects.end(), [questionNumber](const SubjectBand& band) {
		return questionNumber >= band.first && questionNumber <= band.last;
	});
	if (it != subjects.end()) {
		return it->name;
	}
	return subjects.empty() ? std::string{} : subjects.back().name;
}

ScoreSummary scoreSheet(const EvaluationPayload& payload, const ScoringRules& rules) {
	// Key in first-seen question order.
	std::vector<std::pair<unsigned, char>> key;
	std::unordered_map<unsigned, std::size_t> keyIndex;
	for (const auto& entry: payload.answerKey) {
		const auto [it, inserted] = keyIndex.try_emplace(entry.questionNumber, key.size());
		if (inserted) {
			key.emplace_back(entry.questionNumber, entry.correctOption);
		} else {
			key[it->second].second = entry.correctOption;
		}
	}

	std::unordered_map<unsigned, std::optional<char>> selected;
	for (const auto& answer: payload.studentAnswers) {
		selected[answer.questionNumber] = answer.selectedOption;
	}

	ScoreSummary summary;
	for (const auto& band: rules.subjects) {
		summary.subjectMarks.push_back({band.name, 0});
	}
	const auto addMarks = [&summary](const std::string& subject, int marks) {
		summary.totalMarks += marks;
		const auto it = std::find_if(summary.subjectMarks.begin(), summary.subjectMarks.end(), [&](const SubjectMarks& s) { return s.subject == subject; });
		if (it != summary.subjectMarks.end()) {
			it->marks += marks;
		}
	};

	for (const auto& [question, correct]: key) {
		const auto studentIt = selected.find(question);
		if (studentIt == selected.end() || !studentIt->second) {
			++summary.unattemptedCount;
			continue;
		}

		const char choice         = *studentIt->second;
		const std::string subject = rules.subjectOf(question);
		if (choice == correct) {
			++summary.correctCount;
			addMarks(subject, rules.correctMarks);
		} else {
			++summary.incorrectCount;
			addMarks(subject, rules.incorrectMarks);
			summary.wrongQuestions.push_back({question, subject, choice, correct});
		}
	}

	return summary;
}

void to_json(nlohmann::json& j, const ScoreSummary& summary) {
	nlohmann::json subjects = nlohmann::json::object();
	for (const auto& s: summary.subjectMarks) {
		subjects[s.subject] = s.marks;
	}

	nlohmann::json wrong = nlohmann::json::array();
	for (const auto& w: summary.wrongQuestions) {
		wrong.push_back(nlohmann::json{
		        {"questionNumber", w.questionNumber},
		        {"subject", w.subject},
		        {"selectedOption", std::string(1, w.selectedOption)},
		        {"correctOption", std::string(1, w.correctOption)},
		});
	}

	j = nlohmann::json{
	        {"subjectMarks", subjects},
	        {"totalMarks", summary.totalMarks},
	        {"correctCount", summary.correctCount},
	        {"incorrectCount", summary.incorrectCount},
	        {"unattemptedCount", summary.unattemptedCount},
	        {"wrongQuestions", wrong},
	};
}

} // namespace bubbler::report
