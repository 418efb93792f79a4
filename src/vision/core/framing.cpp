#include "vision/core/framing.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace facegate::vision::core {

FramingResult checkFraming(const std::optional<FaceCandidate>& candidate, const int width, const int height, const FramingConfig& config) {
	FramingResult result{};
	if (!candidate || width <= 0 || height <= 0) {
		spdlog::debug("Framing: no face candidate");
		return result;
	}

	result.offsetX = std::abs(candidate->centerX - width / 2.0) / width;
	result.offsetY = std::abs(candidate->centerY - height / 2.0) / height;
	result.passed  = result.offsetX < config.maxOffsetFraction && result.offsetY < config.maxOffsetFraction;
	if (config.maxOffsetFraction > 0.0) {
		result.confidence = std::clamp(1.0 - std::max(result.offsetX, result.offsetY) / config.maxOffsetFraction, 0.0, 1.0);
	}

	spdlog::debug("Framing: offset=({:.2f}, {:.2f}) -> {}", result.offsetX, result.offsetY, result.passed ? "centred" : "off-centre");
	return result;
}

} // namespace facegate::vision::core
