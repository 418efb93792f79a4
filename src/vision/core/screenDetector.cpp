#include "vision/core/screenDetector.hpp"

#include "statistics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace facegate::vision::core {

namespace {

//! Sum of absolute channel differences between two samples (alpha ignored).
int channelDelta(const cv::Vec4b& a, const cv::Vec4b& b) {
	return std::abs(a[0] - b[0]) + std::abs(a[1] - b[1]) + std::abs(a[2] - b[2]);
}

void pushRgb(std::vector<double>& values, const cv::Vec4b& px) {
	values.push_back(px[0]);
	values.push_back(px[1]);
	values.push_back(px[2]);
}

//! R,G,B values of all four borders pooled per border. A screenshot has flat window chrome at every border.
bool bordersUniform(const PixelBuffer& buffer, const ScreenDetectionConfig& config) {
	const int samples = std::min({config.borderSamples, buffer.width(), buffer.height()});
	if (samples * 3 < 9) {
		return false; // Too few values to judge.
	}

	std::vector<double> top, bottom, left, right;
	for (int i = 0; i < samples; ++i) {
		pushRgb(top, buffer.at(i, 0));
		pushRgb(bottom, buffer.at(i, buffer.height() - 1));
		pushRgb(left, buffer.at(0, i));
		pushRgb(right, buffer.at(buffer.width() - 1, i));
	}

	const auto uniform = [&](const std::vector<double>& values) { return variance(values) < config.borderVarianceMax; };
	return uniform(top) && uniform(bottom) && uniform(left) && uniform(right);
}

} // namespace

ScreenResult detectScreenCapture(const PixelBuffer& buffer, const LightingCondition lighting, PointSampler& sampler, const ScreenDetectionConfig& config,
                                 DebugVisualizer* debugger) {
	ScreenResult result{};
	if (buffer.empty()) {
		return result;
	}

	const int width  = buffer.width();
	const int height = buffer.height();
	cv::Mat overlay  = debugger ? buffer.toBgr() : cv::Mat{};

	// 1) Border uniformity
	result.bordersUniform = bordersUniform(buffer, config);
	if (result.bordersUniform) {
		result.score += config.borderWeight;
	}

	// 2) Random pixels: screen-like neutral brights, global brightness, flat neighbourhoods.
	std::size_t subpixelCount = 0, brightCount = 0, flatCount = 0;
	for (int i = 0; i < config.pixelSamples; ++i) {
		const int x         = sampler.below(width);
		const int y         = sampler.below(height);
		const cv::Vec4b& px = buffer.at(x, y);
		const int r         = px[0];
		const int g         = px[1];
		const int b         = px[2];
		const double lum    = luminance(r, g, b);

		if (std::abs(r - g) < config.subpixelChannelDeltaMax && std::abs(g - b) < config.subpixelChannelDeltaMax && r > config.subpixelRedMin) {
			++subpixelCount;
		}
		if (lum > config.brightLuminanceMin) {
			++brightCount;
		}
		if (x < width - 1 && y < height - 1 && channelDelta(px, buffer.at(x + 1, y)) < config.flatNeighbourDeltaMax) {
			++flatCount;
		}

		if (debugger) {
			cv::circle(overlay, cv::Point(x, y), 2, cv::Scalar(255, 200, 0), cv::FILLED);
		}
	}

	const auto pixelSamples = static_cast<std::size_t>(std::max(0, config.pixelSamples));
	result.subpixelRatio    = ratio(subpixelCount, pixelSamples);
	result.brightRatio      = ratio(brightCount, pixelSamples);
	result.flatRatio        = ratio(flatCount, pixelSamples);

	if (result.subpixelRatio > config.subpixelRatioMin) {
		result.score += config.subpixelWeight;
	}
	if (result.brightRatio > config.brightRatioMin && !isLowLight(lighting)) {
		result.score += config.brightWeight;
	}
	if (result.flatRatio > config.flatRatioMin) {
		result.score += config.flatWeight;
	}

	// 3) Perfectly flat short horizontal runs (toolbars, buttons, text boxes).
	std::size_t runCount = 0;
	if (width > config.runLength + 1) {
		for (int i = 0; i < config.runSamples; ++i) {
			const int x = sampler.below(width - config.runLength);
			const int y = sampler.below(height);

			bool flat = true;
			for (int dx = 0; dx < config.runLength && x + dx + 1 < width; ++dx) {
				if (channelDelta(buffer.at(x + dx, y), buffer.at(x + dx + 1, y)) > config.runStepDeltaMax) {
					flat = false;
					break;
				}
			}
			if (flat) {
				++runCount;
				if (debugger) {
					cv::line(overlay, cv::Point(x, y), cv::Point(x + config.runLength, y), cv::Scalar(0, 0, 255), 2);
				}
			}
		}
	}
	result.runRatio = ratio(runCount, static_cast<std::size_t>(std::max(0, config.runSamples)));
	if (result.runRatio > config.runRatioMin) {
		result.score += config.runWeight;
	}

	// 4) Very sharp luminance transitions between horizontal neighbours.
	std::size_t transitionCount = 0;
	if (width > 2 && height > 2) {
		for (int i = 0; i < config.transitionSamples; ++i) {
			const int x = sampler.below(width - 2);
			const int y = sampler.below(height - 2);
			if (std::abs(buffer.luminanceAt(x, y) - buffer.luminanceAt(x + 1, y)) > config.transitionLuminanceMin) {
				++transitionCount;
			}
		}
	}
	result.transitionRatio = ratio(transitionCount, static_cast<std::size_t>(std::max(0, config.transitionSamples)));
	if (result.transitionRatio > config.transitionRatioMin) {
		result.score += config.transitionWeight;
	}

	result.isScreenshot = result.score >= config.flagScore;
	result.confidence   = std::min(result.score / config.maxScore, 1.0);
	result.passed       = !(result.isScreenshot && result.confidence > config.rejectConfidence);

	spdlog::debug("Screen: score={:.1f} conf={:.2f} borders={} subpixel={:.2f} bright={:.2f} flat={:.2f} runs={:.2f} sharp={:.2f}", result.score,
	              result.confidence, result.bordersUniform, result.subpixelRatio, result.brightRatio, result.flatRatio, result.runRatio,
	              result.transitionRatio);

	if (debugger) {
		debugger->beginStage("Screen Capture");
		debugger->add("Samples / flat runs", overlay);
		debugger->note(std::format("score={:.1f} conf={:.2f}", result.score, result.confidence));
		debugger->note(std::format("bordersUniform={}", result.bordersUniform));
		debugger->note(std::format("subpixel={:.2f} bright={:.2f}", result.subpixelRatio, result.brightRatio));
		debugger->note(std::format("flat={:.2f} runs={:.2f} sharp={:.2f}", result.flatRatio, result.runRatio, result.transitionRatio));
		debugger->endStage();
	}

	return result;
}

} // namespace facegate::vision::core
