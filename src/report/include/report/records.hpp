#pragma once

#include "vision/core/bubbleResolver.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bubbler::report {

//! Malformed answer record in a JSON document.
class RecordError : public std::runtime_error {
public:
	explicit RecordError(const std::string& message) : std::runtime_error("Invalid record: " + message) {
	}
};

//! Instructor sheet record: question and its correct option.
struct AnswerKeyEntry {
	unsigned questionNumber;
	char correctOption;
};

//! Student sheet record. Keeps bubble position and confidence for auditing.
struct StudentAnswer {
	unsigned questionNumber;
	std::optional<char> selectedOption; //!< Empty for a blank answer. Scored as unattempted.
	float centerX;
	float centerY;
	float confidence;
};

//! Request body of the grading backend.
struct EvaluationPayload {
	std::vector<AnswerKeyEntry> answerKey;
	std::vector<StudentAnswer> studentAnswers;
};

//! Answer-key shape of a resolved sheet. Same order as sheet.answers.
std::vector<AnswerKeyEntry> buildAnswerKey(const vision::core::ResolvedSheet& sheet);

//! Student-answer shape of a resolved sheet. Same order as sheet.answers.
std::vector<StudentAnswer> buildStudentAnswers(const vision::core::ResolvedSheet& sheet);

// nlohmann::json conversions. Parsing throws RecordError.
void to_json(nlohmann::json& j, const AnswerKeyEntry& entry);
void from_json(const nlohmann::json& j, AnswerKeyEntry& entry);
void to_json(nlohmann::json& j, const StudentAnswer& answer);
void from_json(const nlohmann::json& j, StudentAnswer& answer);
void to_json(nlohmann::json& j, const EvaluationPayload& payload);

} // namespace bubbler::report
