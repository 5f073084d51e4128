#include "report/records.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace bubbler::report {

static const nlohmann::json& requireField(const nlohmann::json& j, const char* field) {
	if (!j.is_object()) {
		throw RecordError("expected an object, got " + std::string(j.type_name()));
	}
	const auto it = j.find(field);
	if (it == j.end() || it->is_null()) {
		throw RecordError(std::string("missing field '") + field + "'");
	}
	return *it;
}

static unsigned readQuestionNumber(const nlohmann::json& j) {
	static constexpr auto MAX_QUESTION = std::numeric_limits<unsigned>::max();

	const auto& value = requireField(j, "questionNumber");
	if (value.is_number_unsigned()) {
		const auto number = value.get<unsigned long long>();
		if (number > 0u && number <= MAX_QUESTION) {
			return static_cast<unsigned>(number);
		}
	} else if (value.is_number_integer()) {
		const auto number = value.get<long long>();
		if (number > 0 && static_cast<unsigned long long>(number) <= MAX_QUESTION) {
			return static_cast<unsigned>(number);
		}
	} else if (value.is_number_float()) {
		const double number = value.get<double>();
		if (number >= 1.0 && number <= static_cast<double>(MAX_QUESTION) && std::floor(number) == number) {
			return static_cast<unsigned>(number);
		}
	}
	throw RecordError("questionNumber must be a positive integer up to " + std::to_string(MAX_QUESTION) + ", got " + value.dump());
}

static char parseOption(const std::string& text, const char* field) {
	if (text.size() != 1u || !std::isalpha(static_cast<unsigned char>(text[0]))) {
		throw RecordError(std::string(field) + " must be a single letter, got '" + text + "'");
	}
	return static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
}

//! Option letters are stored upper case. Lower-case input is accepted.
static char readOption(const nlohmann::json& j, const char* field) {
	const auto& value = requireField(j, field);
	if (!value.is_string()) {
		throw RecordError(std::string(field) + " must be a string");
	}
	return parseOption(value.get_ref<const std::string&>(), field);
}

//! Missing, null or empty means the student left the question blank.
static std::optional<char> readBlankableOption(const nlohmann::json& j, const char* field) {
	const auto it = j.find(field);
	if (it == j.end() || it->is_null()) {
		return std::nullopt;
	}
	if (!it->is_string()) {
		throw RecordError(std::string(field) + " must be a string or null");
	}
	const auto& text = it->get_ref<const std::string&>();
	if (text.empty()) {
		return std::nullopt;
	}
	return parseOption(text, field);
}

static float readNumber(const nlohmann::json& j, const char* field) {
	const auto& value = requireField(j, field);
	if (!value.is_number()) {
		throw RecordError(std::string(field) + " must be a number");
	}
	return value.get<float>();
}

std::vector<AnswerKeyEntry> buildAnswerKey(const vision::core::ResolvedSheet& sheet) {
	std::vector<AnswerKeyEntry> key;
	key.reserve(sheet.answers.size());
	for (const auto& answer: sheet.answers) {
		key.push_back({answer.choice.questionNumber, answer.choice.option});
	}
	return key;
}

std::vector<StudentAnswer> buildStudentAnswers(const vision::core::ResolvedSheet& sheet) {
	std::vector<StudentAnswer> answers;
	answers.reserve(sheet.answers.size());
	for (const auto& answer: sheet.answers) {
		const auto& c = answer.choice;
		answers.push_back({c.questionNumber, c.option, c.centerX, c.centerY, c.confidence});
	}
	return answers;
}

void to_json(nlohmann::json& j, const AnswerKeyEntry& entry) {
	j = nlohmann::json{
	        {"questionNumber", entry.questionNumber},
	        {"correctOption", std::string(1, entry.correctOption)},
	};
}

void from_json(const nlohmann::json& j, AnswerKeyEntry& entry) {
	entry.questionNumber = readQuestionNumber(j);
	entry.correctOption  = readOption(j, "correctOption");
}

void to_json(nlohmann::json& j, const StudentAnswer& answer) {
	j = nlohmann::json{
	        {"questionNumber", answer.questionNumber},
	        {"selectedOption", answer.selectedOption ? nlohmann::json(std::string(1, *answer.selectedOption)) : nlohmann::json(nullptr)},
	        {"centerX", answer.centerX},
	        {"centerY", answer.centerY},
	        {"confidence", answer.confidence},
	};
}

void from_json(const nlohmann::json& j, StudentAnswer& answer) {
	answer.questionNumber = readQuestionNumber(j);
	answer.selectedOption = readBlankableOption(j, "selectedOption");
	// Position and confidence are audit data. Hand-written answer files may leave them out.
	answer.centerX    = j.contains("centerX") ? readNumber(j, "centerX") : 0.0f;
	answer.centerY    = j.contains("centerY") ? readNumber(j, "centerY") : 0.0f;
	answer.confidence = j.contains("confidence") ? readNumber(j, "confidence") : 1.0f;
}

void to_json(nlohmann::json& j, const EvaluationPayload& payload) {
	j = nlohmann::json{
	        {"answerKey", payload.answerKey},
	        {"studentAnswers", payload.studentAnswers},
	};
}

} // namespace bubbler::report
