#pragma once

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/lighting.hpp"
#include "vision/core/pixelBuffer.hpp"
#include "vision/core/pointSampler.hpp"

#include <optional>

namespace facegate::vision::core {

//! RGB/luminance box a pixel must fall into to count as skin. Channel bounds are exclusive.
struct SkinEnvelope {
	int redMin{0};
	int redMax{255};
	int greenMin{0};
	int greenMax{255};
	int blueMin{0};
	int blueMax{255};
	double luminanceMin{0.0};
	bool requireRedDominant{true}; //!< r > g and r > b, and |r-g| > redGreenGapMin.
	int redGreenGapMin{0};
	int redGreenSpreadMax{0}; //!< Without red dominance: r > g or |r-g| < redGreenSpreadMax.
};

//! Face thresholds for one lighting class.
struct FaceThresholds {
	SkinEnvelope skin{};
	double minSkinRatio{0.0};

	double eyeLuminanceMax{0.0};    //!< Eye-like pixels are darker than this...
	double eyeLuminanceMin{0.0};    //!< ...but brighter than this noise floor...
	int eyeChannelMax{150};         //!< ...and every channel below this.
	double minEyeRatio{0.0};        //!< Eye-like ratio at which eyes count as present.
	double eyeConfidenceRatio{0.0}; //!< Eye confidence = min(eyeRatio / eyeConfidenceRatio * eyeConfidenceGain, 1).
	double eyeConfidenceGain{1.0};
	bool localEyeContrast{false}; //!< Also look for pixels clearly darker than their neighbourhood.
	double eyeLocalDelta{15.0};
	double minEyeRegionRatio{0.003};
	bool eyesExempt{false}; //!< Missing eyes do not block the face.

	double skinWeight{0.0};
	double eyeWeight{0.0};
	double structureWeight{0.0};
	double minConfidence{0.0};

	static FaceThresholds normalLight();
	static FaceThresholds dimLight();
};

//! Face presence detection configuration.
struct FaceDetectionConfig {
	double windowFraction{0.5}; //!< Side of the centred analysis window relative to min(width, height).
	int skinStep{3};
	double eyeBandStart{0.15};  //!< Eye band top, relative to the window height.
	double eyeBandHeight{0.35}; //!< Eye band height, relative to the window height.
	int eyeStep{2};
	int eyeNeighbourhood{2}; //!< Radius of the local contrast neighbourhood (2 -> 5x5).
	int symmetrySamples{20};
	double symmetryDeltaMax{30.0};
	double strongSkinFactor{1.2}; //!< Skin ratio >= factor * minimum stands in for the eye signal.
	double minSizeRatio{0.20};

	FaceThresholds normal{FaceThresholds::normalLight()};
	FaceThresholds lowLight{FaceThresholds::dimLight()};

	//! Threshold table used for a lighting class.
	const FaceThresholds& thresholdsFor(LightingCondition lighting) const;
};

//! Position and size estimate of the face. Consumed by the framing check.
struct FaceCandidate {
	double centerX{0.0};
	double centerY{0.0};
	double approximateSize{0.0};
	double confidence{0.0};
};

//! Result of the face presence stage.
struct FaceResult {
	bool passed{false};
	double confidence{0.0}; //!< Weighted skin / eye / structure confidence, clamped to [0, 1].

	double skinRatio{0.0};
	double eyeRatio{0.0};
	double eyeRegionRatio{0.0};
	double structureScore{0.0};
	double sizeRatio{0.0};
	bool hasSkin{false};
	bool hasEyes{false};

	std::optional<FaceCandidate> candidate; //!< Set only if passed.
};

/*! Look for a face in the centred window using skin tone, dark eye band and left/right symmetry.
 * \param [in]     buffer   Decoded photo.
 * \param [in]     lighting Lighting condition from analyseLighting(). Selects the threshold table.
 * \param [in,out] sampler  Random source for the symmetry pairs.
 * \param [in]     config   Face detection configuration.
 * \param [in,out] debugger Optional debug visualizer for overlays.
 */
FaceResult detectFace(const PixelBuffer& buffer, LightingCondition lighting, PointSampler& sampler, const FaceDetectionConfig& config = FaceDetectionConfig{},
                      DebugVisualizer* debugger = nullptr);

//! True if the pixel falls into the skin envelope.
bool isSkinTone(const cv::Vec4b& px, const SkinEnvelope& envelope);

} // namespace facegate::vision::core
