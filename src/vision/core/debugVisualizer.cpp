#include "vision/core/debugVisualizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace facegate::vision::core {

void DebugVisualizer::setInteractive(bool interactive, unsigned displayTimeMs) {
	m_interactive = interactive;
	m_displayTime = displayTimeMs;
}

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
		spdlog::warn("DebugVisualizer::add('{}') called without an active stage", name);
		return;
	}

	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});

	if (m_interactive) {
		cv::imshow("Debug", toBgr8U(img));
		cv::waitKey(static_cast<int>(m_displayTime));
		cv::destroyWindow("Debug");
	}
}

void DebugVisualizer::note(std::string line) {
	if (!m_hasActiveStage) {
		spdlog::warn("DebugVisualizer::note('{}') called without an active stage", line);
		return;
	}
	m_currentStage.notes.push_back(std::move(line));
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int TILE_W         = 320;
	static constexpr int STAGE_HEADER_H = 34;
	static constexpr int TILE_LABEL_H   = 26;
	static constexpr int NOTE_LINE_H    = 20;
	static constexpr int TILE_PAD       = 4;
	static constexpr int MAX_MOSAIC_W   = 2400;

	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar HEADER_BG(0, 0, 0);
	static const cv::Scalar HEADER_FG(255, 255, 255);
	static const cv::Scalar NOTE_FG(170, 220, 170);

	if (m_hasActiveStage) {
		endStage();
	}

	if (m_stages.empty()) {
		return {};
	}

	std::size_t maxSteps = 0;
	std::size_t maxNotes = 0;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.images.size());
		maxNotes = std::max(maxNotes, stage.notes.size());
	}

	const int cols    = static_cast<int>(m_stages.size());
	const int tileW   = std::min(TILE_W, std::max(1, MAX_MOSAIC_W / cols));
	const int tileH   = tileW;
	const int notesH  = static_cast<int>(maxNotes) * NOTE_LINE_H + (maxNotes > 0 ? TILE_PAD * 2 : 0);
	const int mosaicW = tileW * cols;
	const int mosaicH = STAGE_HEADER_H + static_cast<int>(maxSteps) * tileH + notesH;

	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, BG);

	for (int c = 0; c < cols; ++c) {
		const auto& stage = m_stages[static_cast<std::size_t>(c)];
		const int x       = c * tileW;

		// Header: one stage per column.
		cv::Mat header = mosaic(cv::Rect(x, 0, tileW, STAGE_HEADER_H));
		header.setTo(HEADER_BG);
		const std::string stageName = stage.name.empty() ? "Stage " + std::to_string(c + 1) : stage.name;
		cv::putText(header, stageName, cv::Point(8, STAGE_HEADER_H - 10), cv::FONT_HERSHEY_SIMPLEX, 0.65, HEADER_FG, 1, cv::LINE_AA);

		// Tiles: one row per step index, blank if a stage has fewer steps.
		for (std::size_t r = 0; r < stage.images.size(); ++r) {
			const auto& step = stage.images[r];
			const int y      = STAGE_HEADER_H + static_cast<int>(r) * tileH;
			cv::Mat cell     = mosaic(cv::Rect(x, y, tileW, tileH));

			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, TILE_LABEL_H), HEADER_BG, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(TILE_PAD, 18), cv::FONT_HERSHEY_SIMPLEX, 0.5, HEADER_FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}

			const int availW = std::max(1, tileW - 2 * TILE_PAD);
			const int availH = std::max(1, tileH - TILE_LABEL_H - 2 * TILE_PAD);

			const cv::Mat vis  = toBgr8U(step.image);
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH);

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);

			const int x0 = TILE_PAD + (availW - w) / 2;
			const int y0 = TILE_LABEL_H + TILE_PAD + (availH - h) / 2;
			resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
		}

		// Notes: metric lines under the tiles of this stage.
		const int notesTop = STAGE_HEADER_H + static_cast<int>(maxSteps) * tileH + TILE_PAD;
		for (std::size_t n = 0; n < stage.notes.size(); ++n) {
			const int baseline = notesTop + static_cast<int>(n + 1) * NOTE_LINE_H - 6;
			cv::putText(mosaic, stage.notes[n], cv::Point(x + TILE_PAD, baseline), cv::FONT_HERSHEY_SIMPLEX, 0.45, NOTE_FG, 1, cv::LINE_AA);
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// normalize depth to 8U for visualization
	if (in.depth() != CV_8U) {
		cv::normalize(in, out, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
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

} // namespace facegate::vision::core
