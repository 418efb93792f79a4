#pragma once

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/pixelBuffer.hpp"

#include <string_view>

namespace facegate::vision::core {

//! Lighting class of a frame. Decided once by analyseLighting() and used by every later stage to pick its thresholds.
enum class LightingCondition { Normal, LowLight, VeryDark, OverExposed };

std::string_view toString(LightingCondition condition);

//! True for conditions in which the later stages relax their thresholds (dim but usable, or darker).
bool isLowLight(LightingCondition condition);

//! Brightness analysis parameters.
struct LightingConfig {
	int gridDivisions{20};          //!< Sample grid is roughly gridDivisions x gridDivisions points.
	double veryDarkBelow{15.0};     //!< Average luminance under this rejects the frame.
	double lowLightBelow{50.0};     //!< Average luminance under this enables the low-light exemptions.
	double overExposedAbove{240.0}; //!< Average luminance over this rejects the frame.
};

//! Result of the brightness stage.
struct LightingProfile {
	double avgBrightness{0.0};
	double minBrightness{0.0};
	double maxBrightness{0.0};
	bool isLowLight{false};    //!< avg < lowLightBelow (also true for very dark frames).
	bool isVeryDark{false};    //!< avg < veryDarkBelow.
	bool isOverExposed{false}; //!< avg > overExposedAbove.
	LightingCondition condition{LightingCondition::Normal};
	int sampleCount{0};
};

/*! Estimate global brightness from a coarse grid instead of every pixel.
 * \param [in]     buffer   Decoded photo.
 * \param [in]     config   Brightness thresholds.
 * \param [in,out] debugger Optional debug visualizer for overlays.
 * \return         Lighting profile. An empty buffer yields a very dark profile with zero samples.
 */
LightingProfile analyseLighting(const PixelBuffer& buffer, const LightingConfig& config = LightingConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace facegate::vision::core
