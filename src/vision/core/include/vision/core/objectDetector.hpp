#pragma once

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/lighting.hpp"
#include "vision/core/pixelBuffer.hpp"
#include "vision/core/pointSampler.hpp"

namespace facegate::vision::core {

//! Object-not-face heuristic parameters.
struct ObjectDetectionConfig {
	int samples{100};
	double sharpEdgeMin{80.0};     //!< Luminance jump to the right or lower neighbour that counts as a sharp edge.
	double flagRatio{0.6};         //!< Sharp-edge ratio above this flags a geometric object.
	double rejectConfidence{0.7};  //!< The gate rejects only above this confidence.
};

//! Result of the object stage.
struct ObjectResult {
	bool passed{true};
	double confidence{0.0}; //!< Sharp-edge ratio.
	double sharpEdgeRatio{0.0};
	bool isObject{false};
	bool skipped{false}; //!< Low light: noise makes organic images look sharp, the stage never flags.
};

/*! Flag frames dominated by hard edges (boxes, printed patterns, furniture) instead of organic face gradients.
 * \param [in]     buffer   Decoded photo.
 * \param [in]     lighting Lighting condition from analyseLighting().
 * \param [in,out] sampler  Random source for sample positions.
 * \param [in]     config   Object detection configuration.
 * \param [in,out] debugger Optional debug visualizer for overlays.
 */
ObjectResult detectObject(const PixelBuffer& buffer, LightingCondition lighting, PointSampler& sampler, const ObjectDetectionConfig& config = ObjectDetectionConfig{},
                          DebugVisualizer* debugger = nullptr);

} // namespace facegate::vision::core
