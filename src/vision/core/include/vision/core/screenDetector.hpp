#pragma once

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/lighting.hpp"
#include "vision/core/pixelBuffer.hpp"
#include "vision/core/pointSampler.hpp"

namespace facegate::vision::core {

//! Screen capture heuristics. Each signal adds its weight to the score when its ratio crosses the threshold.
struct ScreenDetectionConfig {
	// Border uniformity
	int borderSamples{20};
	double borderVarianceMax{60.0};
	double borderWeight{2.0};

	// Random pixel signals
	int pixelSamples{100};
	int subpixelChannelDeltaMax{8}; //!< |r-g| and |g-b| strictly below this.
	int subpixelRedMin{180};        //!< r strictly above this.
	double subpixelRatioMin{0.25};
	double subpixelWeight{1.5};
	double brightLuminanceMin{200.0};
	double brightRatioMin{0.4};
	double brightWeight{1.0}; //!< Not applied in low light.
	int flatNeighbourDeltaMax{10};
	double flatRatioMin{0.3};
	double flatWeight{0.5};

	// Flat horizontal runs (UI chrome)
	int runSamples{30};
	int runLength{10};
	int runStepDeltaMax{15};
	double runRatioMin{0.2};
	double runWeight{1.0};

	// Hard luminance transitions
	int transitionSamples{50};
	double transitionLuminanceMin{100.0};
	double transitionRatioMin{0.3};
	double transitionWeight{0.5};

	double maxScore{5.0};          //!< Confidence = min(score / maxScore, 1).
	double flagScore{4.0};         //!< Score at which the frame counts as a screenshot.
	double rejectConfidence{0.85}; //!< The gate rejects only above this confidence.
};

//! Result of the screen capture stage.
struct ScreenResult {
	bool passed{true};        //!< False if the gate should reject the frame.
	double confidence{0.0};   //!< Screenshot confidence, min(score / maxScore, 1).
	double score{0.0};        //!< Sum of the weights of the signals that fired.
	bool isScreenshot{false}; //!< score >= flagScore.

	bool bordersUniform{false};
	double subpixelRatio{0.0};
	double brightRatio{0.0};
	double flatRatio{0.0};
	double runRatio{0.0};
	double transitionRatio{0.0};
};

/*! Score how much the frame looks like a screenshot or a photo of a screen.
 * \param [in]     buffer    Decoded photo.
 * \param [in]     lighting  Lighting condition from analyseLighting().
 * \param [in,out] sampler   Random source for sample positions.
 * \param [in]     config    Screen detection configuration.
 * \param [in,out] debugger  Optional debug visualizer for overlays.
 */
ScreenResult detectScreenCapture(const PixelBuffer& buffer, LightingCondition lighting, PointSampler& sampler,
                                 const ScreenDetectionConfig& config = ScreenDetectionConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace facegate::vision::core
