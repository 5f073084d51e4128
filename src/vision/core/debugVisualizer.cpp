#include "vision/core/debugVisualizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace bubbler::vision::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		spdlog::debug("Debug image '{}' dropped, no active stage", name);
		return;
	}
	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});
}

std::size_t DebugVisualizer::stageCount() const {
	return m_stages.size() + (m_hasActiveStage ? 1u : 0u);
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic(const int tileSize) {
	static constexpr int HEADER_H = 34;
	static constexpr int LABEL_H  = 28;
	static constexpr int PAD      = 4;

	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar BAR(0, 0, 0);
	static const cv::Scalar FG(255, 255, 255);

	if (m_hasActiveStage) {
		endStage();
	}

	std::size_t maxSteps = 0;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.images.size());
	}
	if (m_stages.empty() || maxSteps == 0 || tileSize <= 2 * PAD + LABEL_H) {
		return {};
	}

	const int cols = static_cast<int>(m_stages.size());
	cv::Mat mosaic(HEADER_H + static_cast<int>(maxSteps) * tileSize, cols * tileSize, CV_8UC3, BG);

	for (int c = 0; c < cols; ++c) {
		const auto& stage = m_stages[static_cast<std::size_t>(c)];

		cv::Mat header = mosaic(cv::Rect(c * tileSize, 0, tileSize, HEADER_H));
		header.setTo(BAR);
		cv::putText(header, stage.name, cv::Point(8, HEADER_H - 10), cv::FONT_HERSHEY_SIMPLEX, 0.75, FG, 1, cv::LINE_AA);

		for (std::size_t r = 0; r < stage.images.size(); ++r) {
			const auto& step = stage.images[r];
			cv::Mat cell     = mosaic(cv::Rect(c * tileSize, HEADER_H + static_cast<int>(r) * tileSize, tileSize, tileSize));

			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, LABEL_H), BAR, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(PAD, 20), cv::FONT_HERSHEY_SIMPLEX, 0.55, FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}

			// Letterbox the step image below its label.
			const int availW   = tileSize - 2 * PAD;
			const int availH   = tileSize - LABEL_H - 2 * PAD;
			const cv::Mat vis  = toBgr8U(step.image);
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH);

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
			resized.copyTo(cell(cv::Rect(PAD + (availW - w) / 2, LABEL_H + PAD + (availH - h) / 2, w, h)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// Stretch float patches and probability maps to the full 8 bit range.
	if (in.depth() != CV_8U) {
		double minV = 0.0, maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		if (maxV - minV < 1e-9) {
			in.convertTo(out, CV_8U);
		} else {
			in.convertTo(out, CV_8U, 255.0 / (maxV - minV), -minV * 255.0 / (maxV - minV));
		}
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace bubbler::vision::core
