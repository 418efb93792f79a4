#include "vision/core/liveness.hpp"

#include "statistics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <format>

#include <opencv2/imgproc.hpp>

namespace facegate::vision::core {

LivenessResult estimateLiveness(const PixelBuffer& buffer, const LightingCondition lighting, PointSampler& sampler, const LivenessConfig& config,
                                DebugVisualizer* debugger) {
	LivenessResult result{};
	if (buffer.empty()) {
		return result;
	}

	cv::Mat overlay = debugger ? buffer.toBgr() : cv::Mat{};

	std::size_t varied = 0;
	const auto samples = static_cast<std::size_t>(std::max(0, config.samples));
	for (std::size_t i = 0; i < samples; ++i) {
		const cv::Point a(sampler.below(buffer.width()), sampler.below(buffer.height()));
		const cv::Point b(sampler.below(buffer.width()), sampler.below(buffer.height()));

		const bool natural = std::abs(buffer.luminanceAt(a.x, a.y) - buffer.luminanceAt(b.x, b.y)) > config.variationMin;
		if (natural) {
			++varied;
		}
		if (debugger) {
			cv::line(overlay, a, b, natural ? cv::Scalar(0, 200, 0) : cv::Scalar(0, 0, 255), 1, cv::LINE_AA);
		}
	}

	result.variationRatio = ratio(varied, samples);
	result.confidence     = result.variationRatio;
	const bool varies     = result.variationRatio > config.liveRatioMin;
	result.lowLightExempt = !varies && isLowLight(lighting) && result.variationRatio > config.exemptRatioMin;
	result.isLive         = varies || result.lowLightExempt;
	result.passed         = result.isLive;

	spdlog::debug("Liveness: variation={:.2f} -> {}{}", result.variationRatio, result.isLive ? "live" : "static", result.lowLightExempt ? " (low-light exemption)" : "");

	if (debugger) {
		debugger->beginStage("Liveness");
		debugger->add("Random pairs", overlay);
		debugger->note(std::format("variation={:.2f} (min {:.2f})", result.variationRatio, config.liveRatioMin));
		debugger->note(std::format("isLive={}{}", result.isLive, result.lowLightExempt ? " (exempt)" : ""));
		debugger->endStage();
	}

	return result;
}

} // namespace facegate::vision::core
