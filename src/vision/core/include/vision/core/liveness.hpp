#pragma once

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/lighting.hpp"
#include "vision/core/pixelBuffer.hpp"
#include "vision/core/pointSampler.hpp"

namespace facegate::vision::core {

struct LivenessConfig {
	int samples{50};
	double variationMin{20.0}; //!< Luminance difference of a random pair that counts as natural variation.
	double liveRatioMin{0.3};
	double exemptRatioMin{0.0}; //!< The low-light exemption needs a variation ratio above this. A perfectly flat frame is never live.
};

//! Result of the liveness stage.
struct LivenessResult {
	bool passed{false};
	double confidence{0.0}; //!< Variation ratio.
	double variationRatio{0.0};
	bool isLive{false};
	bool lowLightExempt{false}; //!< Live only because of the low-light exemption.
};

/*! Coarse anti-replay signal: a sensor capture varies more between random points than a flat or re-photographed image.
 * \param [in]     buffer   Decoded photo.
 * \param [in]     lighting Lighting condition from analyseLighting(). Low light is accepted unless the frame is flat.
 * \param [in,out] sampler  Random source for the sample pairs.
 * \param [in]     config   Liveness configuration.
 * \param [in,out] debugger Optional debug visualizer for overlays.
 */
LivenessResult estimateLiveness(const PixelBuffer& buffer, LightingCondition lighting, PointSampler& sampler, const LivenessConfig& config = LivenessConfig{},
                                DebugVisualizer* debugger = nullptr);

} // namespace facegate::vision::core
