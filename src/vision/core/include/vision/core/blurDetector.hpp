#pragma once

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/lighting.hpp"
#include "vision/core/pixelBuffer.hpp"
#include "vision/core/pointSampler.hpp"

namespace facegate::vision::core {

struct BlurDetectionConfig {
	int samples{150};
	double minAverageDelta{10.0}; //!< Average summed channel delta of neighbours below this is blurry.
	double sharpAverageDelta{60.0}; //!< Average delta mapped to full confidence.
};

//! Result of the blur stage.
struct BlurResult {
	bool passed{true};
	double confidence{0.0}; //!< Sharpness confidence, min(averageDelta / sharpAverageDelta, 1).
	double averageDelta{0.0};
	bool isBlurry{false};
	bool skipped{false}; //!< Low light: fine detail is legitimately lost, the stage is not applied.
};

//! Estimate sharpness from horizontally adjacent sample pairs.
BlurResult detectBlur(const PixelBuffer& buffer, LightingCondition lighting, PointSampler& sampler, const BlurDetectionConfig& config = BlurDetectionConfig{},
                      DebugVisualizer* debugger = nullptr);

} // namespace facegate::vision::core
