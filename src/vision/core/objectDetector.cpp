#include "vision/core/objectDetector.hpp"

#include "statistics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <format>

#include <opencv2/imgproc.hpp>

namespace facegate::vision::core {

ObjectResult detectObject(const PixelBuffer& buffer, const LightingCondition lighting, PointSampler& sampler, const ObjectDetectionConfig& config,
                          DebugVisualizer* debugger) {
	ObjectResult result{};
	if (buffer.width() < 3 || buffer.height() < 3) {
		return result;
	}

	cv::Mat overlay = debugger ? buffer.toBgr() : cv::Mat{};

	std::size_t sharpCount = 0;
	const auto samples     = static_cast<std::size_t>(std::max(0, config.samples));
	for (std::size_t i = 0; i < samples; ++i) {
		const int x = sampler.below(buffer.width() - 2);
		const int y = sampler.below(buffer.height() - 2);

		const double current = buffer.luminanceAt(x, y);
		const double edgeX   = std::abs(current - buffer.luminanceAt(x + 1, y));
		const double edgeY   = std::abs(current - buffer.luminanceAt(x, y + 1));
		const bool sharp     = edgeX > config.sharpEdgeMin || edgeY > config.sharpEdgeMin;
		if (sharp) {
			++sharpCount;
		}

		if (debugger) {
			cv::circle(overlay, cv::Point(x, y), 3, sharp ? cv::Scalar(0, 0, 255) : cv::Scalar(0, 200, 0), cv::FILLED);
		}
	}

	result.sharpEdgeRatio = ratio(sharpCount, samples);
	result.confidence     = result.sharpEdgeRatio;
	result.skipped        = isLowLight(lighting);
	result.isObject       = !result.skipped && result.sharpEdgeRatio > config.flagRatio;
	result.passed         = !(result.isObject && result.confidence > config.rejectConfidence);

	if (result.skipped) {
		spdlog::debug("Object: sharp={:.2f}, not applied in {} conditions", result.sharpEdgeRatio, toString(lighting));
	} else {
		spdlog::debug("Object: sharp={:.2f} -> {}", result.sharpEdgeRatio, result.isObject ? "object" : "organic");
	}

	if (debugger) {
		debugger->beginStage("Object");
		debugger->add("Edge samples", overlay);
		debugger->note(std::format("sharpEdges={:.2f} (flag > {:.2f})", result.sharpEdgeRatio, config.flagRatio));
		debugger->note(result.skipped ? "skipped: low light" : std::format("isObject={}", result.isObject));
		debugger->endStage();
	}

	return result;
}

} // namespace facegate::vision::core
