#include "report/records.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <vector>

namespace bubbler::report {
namespace gtest {

TEST(Records, AnswerKey_JsonFields) {
	const nlohmann::json j = AnswerKeyEntry{12u, 'C'};

	ASSERT_TRUE(j.is_object());
	EXPECT_EQ(j.size(), 2u);
	EXPECT_EQ(j.at("questionNumber"), 12);
	EXPECT_EQ(j.at("correctOption"), "C");
}

TEST(Records, StudentAnswer_JsonFields) {
	const nlohmann::json j = StudentAnswer{3u, 'A', 200.0f, 500.0f, 0.875f};

	EXPECT_EQ(j.size(), 5u);
	EXPECT_EQ(j.at("questionNumber"), 3);
	EXPECT_EQ(j.at("selectedOption"), "A");
	EXPECT_FLOAT_EQ(j.at("centerX").get<float>(), 200.0f);
	EXPECT_FLOAT_EQ(j.at("centerY").get<float>(), 500.0f);
	EXPECT_FLOAT_EQ(j.at("confidence").get<float>(), 0.875f);
}

TEST(Records, Parse_NormalizesLowerCaseOptions) {
	const auto key = nlohmann::json::parse(R"([{"questionNumber": 1, "correctOption": "b"}, {"questionNumber": 2, "correctOption": "D"}])")
	                         .get<std::vector<AnswerKeyEntry>>();
	ASSERT_EQ(key.size(), 2u);
	EXPECT_EQ(key[0].correctOption, 'B');
	EXPECT_EQ(key[1].correctOption, 'D');

	const auto answer = nlohmann::json::parse(R"({"questionNumber": 7, "selectedOption": "c"})").get<StudentAnswer>();
	EXPECT_EQ(answer.questionNumber, 7u);
	EXPECT_EQ(answer.selectedOption, 'C');
	EXPECT_FLOAT_EQ(answer.centerX, 0.0f);
	EXPECT_FLOAT_EQ(answer.centerY, 0.0f);
	EXPECT_FLOAT_EQ(answer.confidence, 1.0f);
}

TEST(Records, Parse_RejectsBrokenRecords) {
	const auto key = [](const char* text) { return nlohmann::json::parse(text).get<AnswerKeyEntry>(); };
	const auto student = [](const char* text) { return nlohmann::json::parse(text).get<StudentAnswer>(); };

	EXPECT_THROW(key(R"({"correctOption": "A"})"), RecordError);
	EXPECT_THROW(key(R"({"questionNumber": 1})"), RecordError);
	EXPECT_THROW(key(R"({"questionNumber": 0, "correctOption": "A"})"), RecordError);
	EXPECT_THROW(key(R"({"questionNumber": -4, "correctOption": "A"})"), RecordError);
	EXPECT_THROW(key(R"({"questionNumber": 1.5, "correctOption": "A"})"), RecordError);
	EXPECT_THROW(key(R"({"questionNumber": "1", "correctOption": "A"})"), RecordError);
	EXPECT_THROW(key(R"({"questionNumber": 1, "correctOption": "AB"})"), RecordError);
	EXPECT_THROW(key(R"({"questionNumber": 1, "correctOption": "3"})"), RecordError);
	EXPECT_THROW(key(R"([1, "A"])"), RecordError);

	EXPECT_THROW(key(R"({"questionNumber": 4294967297, "correctOption": "A"})"), RecordError); // Would wrap to 1.
	EXPECT_THROW(key(R"({"questionNumber": 1e12, "correctOption": "A"})"), RecordError);

	EXPECT_THROW(student(R"({"questionNumber": 1, "selectedOption": 3})"), RecordError);
	EXPECT_THROW(student(R"({"questionNumber": 1, "selectedOption": "AB"})"), RecordError);
	EXPECT_THROW(student(R"({"questionNumber": 1, "selectedOption": "A", "confidence": "high"})"), RecordError);
}

TEST(Records, QuestionNumber_LargestUnsignedAccepted) {
	const auto entry = nlohmann::json::parse(R"({"questionNumber": 4294967295, "correctOption": "A"})").get<AnswerKeyEntry>();
	EXPECT_EQ(entry.questionNumber, 4294967295u);

	const auto whole = nlohmann::json::parse(R"({"questionNumber": 12.0, "correctOption": "A"})").get<AnswerKeyEntry>();
	EXPECT_EQ(whole.questionNumber, 12u);
}

TEST(Records, StudentAnswer_BlankOptionIsUnattempted) {
	for (const char* text: {R"({"questionNumber": 5, "selectedOption": null})", R"({"questionNumber": 5, "selectedOption": ""})",
	                        R"({"questionNumber": 5})"}) {
		SCOPED_TRACE(text);
		const auto answer = nlohmann::json::parse(text).get<StudentAnswer>();
		EXPECT_EQ(answer.questionNumber, 5u);
		EXPECT_FALSE(answer.selectedOption.has_value());
	}

	const nlohmann::json j = StudentAnswer{5u, std::nullopt, 0.0f, 0.0f, 1.0f};
	EXPECT_TRUE(j.at("selectedOption").is_null());
}

TEST(Records, Payload_HasBothArrays) {
	EvaluationPayload payload;
	payload.answerKey      = {{1u, 'A'}, {2u, 'B'}};
	payload.studentAnswers = {{1u, 'A', 10.0f, 20.0f, 0.9f}};

	const nlohmann::json j = payload;
	ASSERT_TRUE(j.contains("answerKey"));
	ASSERT_TRUE(j.contains("studentAnswers"));
	EXPECT_EQ(j.at("answerKey").size(), 2u);
	EXPECT_EQ(j.at("answerKey")[1].at("correctOption"), "B");
	EXPECT_EQ(j.at("studentAnswers").size(), 1u);
	EXPECT_EQ(j.at("studentAnswers")[0].at("selectedOption"), "A");

	const nlohmann::json empty = EvaluationPayload{};
	EXPECT_TRUE(empty.at("answerKey").is_array());
	EXPECT_TRUE(empty.at("studentAnswers").empty());
}

} // namespace gtest
} // namespace bubbler::report
