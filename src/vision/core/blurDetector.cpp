#include "vision/core/blurDetector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <format>

#include <opencv2/imgproc.hpp>

namespace facegate::vision::core {

BlurResult detectBlur(const PixelBuffer& buffer, const LightingCondition lighting, PointSampler& sampler, const BlurDetectionConfig& config,
                      DebugVisualizer* debugger) {
	BlurResult result{};
	if (isLowLight(lighting)) {
		result.skipped    = true;
		result.confidence = 1.0;
		spdlog::debug("Blur: not applied in {} conditions", toString(lighting));
		if (debugger) {
			debugger->beginStage("Blur");
			debugger->note("skipped: low light");
			debugger->endStage();
		}
		return result;
	}

	if (buffer.width() < 3 || buffer.height() < 3 || config.samples <= 0) {
		return result;
	}

	cv::Mat overlay = debugger ? buffer.toBgr() : cv::Mat{};

	double total = 0.0;
	for (int i = 0; i < config.samples; ++i) {
		const int x = sampler.below(buffer.width() - 2);
		const int y = sampler.below(buffer.height() - 2);

		const cv::Vec4b& a = buffer.at(x, y);
		const cv::Vec4b& b = buffer.at(x + 1, y);
		total += std::abs(a[0] - b[0]) + std::abs(a[1] - b[1]) + std::abs(a[2] - b[2]);

		if (debugger) {
			cv::circle(overlay, cv::Point(x, y), 2, cv::Scalar(255, 128, 0), cv::FILLED);
		}
	}

	result.averageDelta = total / static_cast<double>(config.samples);
	result.isBlurry     = result.averageDelta < config.minAverageDelta;
	result.passed       = !result.isBlurry;
	result.confidence   = config.sharpAverageDelta > 0.0 ? std::min(result.averageDelta / config.sharpAverageDelta, 1.0) : 1.0;

	spdlog::debug("Blur: averageDelta={:.1f} -> {}", result.averageDelta, result.isBlurry ? "blurry" : "sharp");

	if (debugger) {
		debugger->beginStage("Blur");
		debugger->add("Neighbour pairs", overlay);
		debugger->note(std::format("avgDelta={:.1f} (min {:.1f})", result.averageDelta, config.minAverageDelta));
		debugger->endStage();
	}

	return result;
}

} // namespace facegate::vision::core
