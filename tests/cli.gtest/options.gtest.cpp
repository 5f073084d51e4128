#include "options.hpp"

#include <gtest/gtest.h>

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <initializer_list>
#include <stdexcept>

namespace bubbler::cli {
namespace gtest {

static Options parse(std::initializer_list<const char*> args) {
	QStringList arguments{QStringLiteral("bubbler")};
	for (const char* arg: args) {
		arguments << QString::fromUtf8(arg);
	}
	return parseOptions(arguments);
}

TEST(Options, StudentMode_Defaults) {
	const Options options = parse({"--mode=student", "--image=sheet.png"});

	EXPECT_EQ(options.mode, Mode::Student);
	ASSERT_TRUE(options.image.has_value());
	EXPECT_EQ(options.image->string(), "sheet.png");
	EXPECT_FALSE(options.modelPath.has_value());
	EXPECT_FALSE(options.submissionId.has_value());
	EXPECT_FLOAT_EQ(options.reader.resolver.fillThreshold, 0.7f);
	EXPECT_EQ(options.reader.resolver.patch.size, 28);
	EXPECT_EQ(options.reader.align.canvasSize, cv::Size(2480, 3508));
	EXPECT_EQ(options.backend.apiBase, backend::BackendConfig{}.apiBase);
	EXPECT_FALSE(options.backend.token.has_value());
}

TEST(Options, Tunables_MappedOntoConfigs) {
	const Options options = parse({"--mode=answer_key", "--image=key.png", "--threshold=0.55", "--canvas=1240x1754", "--patch-size=20",
	                               "--channels-last", "--token=abc", "--api-base=http://grader:9000/api"});

	EXPECT_EQ(options.mode, Mode::AnswerKey);
	EXPECT_FLOAT_EQ(options.reader.resolver.fillThreshold, 0.55f);
	EXPECT_EQ(options.reader.align.canvasSize, cv::Size(1240, 1754));
	EXPECT_EQ(options.reader.resolver.patch.size, 20);
	EXPECT_TRUE(options.model.channelsLast);
	EXPECT_EQ(options.backend.token, "abc");
	EXPECT_EQ(options.backend.apiBase, "http://grader:9000/api");
}

TEST(Options, Threshold_RejectsNonFiniteAndOutOfRange) {
	for (const char* threshold: {"--threshold=nan", "--threshold=inf", "--threshold=-inf", "--threshold=1.5", "--threshold=-0.1", "--threshold=abc"}) {
		SCOPED_TRACE(threshold);
		EXPECT_THROW(parse({"--mode=student", "--image=sheet.png", threshold}), std::invalid_argument);
	}

	EXPECT_NO_THROW(parse({"--mode=student", "--image=sheet.png", "--threshold=0"}));
	EXPECT_NO_THROW(parse({"--mode=student", "--image=sheet.png", "--threshold=1"}));
}

TEST(Options, Canvas_RejectsMalformedSizes) {
	for (const char* canvas: {"--canvas=2480", "--canvas=0x100", "--canvas=axb", "--canvas=10x10x10"}) {
		SCOPED_TRACE(canvas);
		EXPECT_THROW(parse({"--mode=student", "--image=sheet.png", canvas}), std::invalid_argument);
	}
	EXPECT_THROW(parse({"--mode=student", "--image=sheet.png", "--patch-size=0"}), std::invalid_argument);
}

TEST(Options, ModeRequirements) {
	EXPECT_THROW(parse({}), std::invalid_argument);
	EXPECT_THROW(parse({"--mode=grade"}), std::invalid_argument);
	EXPECT_THROW(parse({"--mode=student"}), std::invalid_argument);
	EXPECT_THROW(parse({"--mode=student", "--image=s.png", "--submission-id=7"}), std::invalid_argument);
	EXPECT_NO_THROW(parse({"--mode=student", "--image=s.png", "--submission-id=7", "--answer-key-json=key.json"}));

	EXPECT_THROW(parse({"--mode=evaluate", "--answer-key-json=key.json"}), std::invalid_argument);
	EXPECT_THROW(parse({"--mode=evaluate", "--answer-key-json=key.json", "--student-json=s.json"}), std::invalid_argument);

	const Options offline = parse({"--mode=evaluate", "--answer-key-json=key.json", "--student-json=s.json", "--offline"});
	EXPECT_EQ(offline.mode, Mode::Evaluate);
	EXPECT_TRUE(offline.offline);
}

} // namespace gtest
} // namespace bubbler::cli
