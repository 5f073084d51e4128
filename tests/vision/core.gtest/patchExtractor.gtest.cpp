#include "vision/core/patchExtractor.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <vector>

namespace bubbler::vision::core {
namespace gtest {

static constexpr int PATCH = 28;

static void expectPatchShape(const cv::Mat& patch, int size = PATCH) {
	ASSERT_EQ(patch.rows, size);
	ASSERT_EQ(patch.cols, size);
	ASSERT_EQ(patch.type(), CV_32FC1);

	double minV = 0.0, maxV = 0.0;
	cv::minMaxLoc(patch, &minV, &maxV);
	EXPECT_GE(minV, 0.0);
	EXPECT_LE(maxV, 1.0);
}

TEST(PatchExtractor, Interior_NormalizedToUnitRange) {
	cv::Mat canvas(200, 200, CV_8UC1, cv::Scalar(255));
	cv::rectangle(canvas, cv::Rect(86, 86, 28, 28), cv::Scalar(0), cv::FILLED);

	const cv::Mat dark = cropPatch(canvas, {100.0f, 100.0f});
	expectPatchShape(dark);
	EXPECT_NEAR(cv::mean(dark)[0], 0.0, 1e-6);

	const cv::Mat bright = cropPatch(canvas, {30.0f, 30.0f});
	expectPatchShape(bright);
	EXPECT_NEAR(cv::mean(bright)[0], 1.0, 1e-6);
}

TEST(PatchExtractor, AnyCenter_KeepsFixedShape) {
	const cv::Mat canvas(120, 90, CV_8UC1, cv::Scalar(128));

	const std::vector<cv::Point2f> centers = {
	        {0.0f, 0.0f},   {89.0f, 119.0f}, {5.0f, 60.0f},   {45.0f, 3.0f},    {88.5f, 1.5f},
	        {-10.0f, 50.0f}, {95.0f, 125.0f}, {-500.0f, -500.0f}, {45.0f, 60.0f},
	};
	for (const auto& center: centers) {
		SCOPED_TRACE(::testing::Message() << "center (" << center.x << ", " << center.y << ")");
		expectPatchShape(cropPatch(canvas, center));
	}

	// Every pixel position, including the half-patch band along the border.
	for (int y = 0; y < canvas.rows; y += 7) {
		for (int x = 0; x < canvas.cols; x += 7) {
			const cv::Mat patch = cropPatch(canvas, {static_cast<float>(x), static_cast<float>(y)}, 16);
			ASSERT_EQ(patch.size(), cv::Size(16, 16));
		}
	}
}

TEST(PatchExtractor, EdgeCrop_IsResizedNotPadded) {
	// Black stripe along the left border, white elsewhere.
	cv::Mat canvas(100, 100, CV_8UC1, cv::Scalar(255));
	cv::rectangle(canvas, cv::Rect(0, 0, 10, 100), cv::Scalar(0), cv::FILLED);

	// Crop [-11, 17) is clipped to [0, 17) and stretched over the whole patch.
	const cv::Mat patch = cropPatch(canvas, {3.0f, 50.0f});
	expectPatchShape(patch);

	EXPECT_NEAR(patch.at<float>(PATCH / 2, 0), 0.0f, 1e-3f);
	EXPECT_NEAR(patch.at<float>(PATCH / 2, PATCH - 1), 1.0f, 1e-3f);
	// 7 of the 17 clipped columns are white. White padding would push the mean far higher.
	EXPECT_NEAR(cv::mean(patch)[0], 7.0 / 17.0, 0.08);
}

TEST(PatchExtractor, OutsideCanvas_ReadsAsBlankPaper) {
	const cv::Mat canvas(50, 50, CV_8UC1, cv::Scalar(0));

	const cv::Mat patch = cropPatch(canvas, {500.0f, 500.0f});
	expectPatchShape(patch);
	EXPECT_NEAR(cv::mean(patch)[0], 1.0, 1e-6);
}

TEST(PatchExtractor, ExtractPatches_OnePerEntryInTemplateOrder) {
	cv::Mat canvas(600, 500, CV_8UC1, cv::Scalar(255));
	cv::circle(canvas, cv::Point(260, 450), 18, cv::Scalar(0), cv::FILLED); // Question 2, option B.

	const SheetTemplate sheet = exampleTemplate();
	PatchConfig config;
	config.size = 20;

	const std::vector<cv::Mat> patches = extractPatches(canvas, sheet, config);
	ASSERT_EQ(patches.size(), sheet.entries().size());

	for (std::size_t i = 0; i < patches.size(); ++i) {
		ASSERT_EQ(patches[i].size(), cv::Size(20, 20));
		const auto& entry   = sheet.entries()[i];
		const bool isFilled = entry.questionNumber == 2u && entry.option == 'B';
		EXPECT_NEAR(cv::mean(patches[i])[0], isFilled ? 0.0 : 1.0, 1e-6) << "Bubble " << entry.questionNumber << entry.option;
	}
}

} // namespace gtest
} // namespace bubbler::vision::core
