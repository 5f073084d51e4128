#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace bubbler::vision::core {

//! Single image produced by a pipeline step.
struct DebugStep {
	std::string name; //!< Step label shown above the tile.
	cv::Mat image;    //!< Snapshot of the step output.
};

//! Images of one pipeline stage (Align, Classify, ...).
struct DebugStage {
	std::string name;
	std::vector<DebugStep> images{};
};

//! Optional sink passed through the pipeline functions to collect intermediate images.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< Start a new stage. Ends the active one.
	void add(std::string name, const cv::Mat& img); //!< Store a copy of img under the active stage. Ignored without a stage.
	void endStage();

	//! One column per stage, one row per step. Returns an empty Mat when nothing was collected.
	cv::Mat buildMosaic(int tileSize = 360);

	std::size_t stageCount() const;
	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{};
};

} // namespace bubbler::vision::core
