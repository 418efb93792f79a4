#include "vision/core/faceDetector.hpp"

#include "statistics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>

#include <opencv2/imgproc.hpp>

namespace facegate::vision::core {

FaceThresholds FaceThresholds::normalLight() {
	FaceThresholds t{};
	t.skin = SkinEnvelope{
	        .redMin             = 90,
	        .redMax             = 255,
	        .greenMin           = 35,
	        .greenMax           = 240,
	        .blueMin            = 18,
	        .blueMax            = 200,
	        .luminanceMin       = 45.0,
	        .requireRedDominant = true,
	        .redGreenGapMin     = 12,
	        .redGreenSpreadMax  = 0,
	};
	t.minSkinRatio       = 0.16;
	t.eyeLuminanceMax    = 100.0;
	t.eyeLuminanceMin    = 15.0;
	t.minEyeRatio        = 0.04;
	t.eyeConfidenceRatio = 0.04;
	t.eyeConfidenceGain  = 2.0;
	t.localEyeContrast   = true;
	t.eyesExempt         = false;
	t.skinWeight         = 0.5;
	t.eyeWeight          = 0.3;
	t.structureWeight    = 0.2;
	t.minConfidence      = 0.35;
	return t;
}

// Skin desaturates and sensor noise swamps dark detail in weak light: wider envelope, eyes nearly ignored.
FaceThresholds FaceThresholds::dimLight() {
	FaceThresholds t{};
	t.skin = SkinEnvelope{
	        .redMin             = 20,
	        .redMax             = 255,
	        .greenMin           = 12,
	        .greenMax           = 240,
	        .blueMin            = 8,
	        .blueMax            = 200,
	        .luminanceMin       = 12.0,
	        .requireRedDominant = false,
	        .redGreenGapMin     = 0,
	        .redGreenSpreadMax  = 30,
	};
	t.minSkinRatio       = 0.08;
	t.eyeLuminanceMax    = 140.0;
	t.eyeLuminanceMin    = 5.0;
	t.minEyeRatio        = 0.003;
	t.eyeConfidenceRatio = 0.01;
	t.eyeConfidenceGain  = 1.5;
	t.localEyeContrast   = false;
	t.eyesExempt         = true;
	t.skinWeight         = 0.8;
	t.eyeWeight          = 0.05;
	t.structureWeight    = 0.15;
	t.minConfidence      = 0.25;
	return t;
}

const FaceThresholds& FaceDetectionConfig::thresholdsFor(const LightingCondition lighting) const {
	switch (lighting) {
	case LightingCondition::LowLight:
	case LightingCondition::VeryDark:
		return lowLight;
	case LightingCondition::Normal:
	case LightingCondition::OverExposed:
		return normal;
	}
	return normal;
}

bool isSkinTone(const cv::Vec4b& px, const SkinEnvelope& envelope) {
	const int r = px[0];
	const int g = px[1];
	const int b = px[2];

	if (r <= envelope.redMin || r >= envelope.redMax || g <= envelope.greenMin || g >= envelope.greenMax || b <= envelope.blueMin ||
	    b >= envelope.blueMax) {
		return false;
	}
	if (luminance(r, g, b) <= envelope.luminanceMin) {
		return false;
	}

	if (envelope.requireRedDominant) {
		return r > g && r > b && std::abs(r - g) > envelope.redGreenGapMin;
	}
	return r > g || std::abs(r - g) < envelope.redGreenSpreadMax;
}

namespace {

struct Window {
	int startX{0};
	int startY{0};
	int endX{0}; //!< Exclusive.
	int endY{0}; //!< Exclusive.
	int centerX{0};
	int centerY{0};
	double side{0.0};

	int width() const { return endX - startX; }
	int height() const { return endY - startY; }
};

Window centredWindow(const PixelBuffer& buffer, double fraction) {
	Window w{};
	w.centerX      = buffer.width() / 2;
	w.centerY      = buffer.height() / 2;
	w.side         = static_cast<double>(std::min(buffer.width(), buffer.height())) * fraction;
	const int half = static_cast<int>(std::lround(w.side / 2.0));
	w.startX       = std::max(0, w.centerX - half);
	w.startY       = std::max(0, w.centerY - half);
	w.endX         = std::min(buffer.width(), w.centerX + half);
	w.endY         = std::min(buffer.height(), w.centerY + half);
	return w;
}

//! Mean luminance of the (2r+1)x(2r+1) neighbourhood. Caller keeps it inside the image.
double neighbourhoodMean(const PixelBuffer& buffer, int x, int y, int r) {
	double sum = 0.0;
	int count  = 0;
	for (int dy = -r; dy <= r; ++dy) {
		for (int dx = -r; dx <= r; ++dx) {
			sum += buffer.luminanceAt(x + dx, y + dy);
			++count;
		}
	}
	return sum / static_cast<double>(count);
}

} // namespace

FaceResult detectFace(const PixelBuffer& buffer, const LightingCondition lighting, PointSampler& sampler, const FaceDetectionConfig& config,
                      DebugVisualizer* debugger) {
	FaceResult result{};
	if (buffer.empty()) {
		return result;
	}

	const FaceThresholds& t = config.thresholdsFor(lighting);
	const bool dim          = isLowLight(lighting);
	const Window window     = centredWindow(buffer, config.windowFraction);
	if (window.width() < 2 || window.height() < 2) {
		spdlog::debug("Face: analysis window too small ({}x{})", window.width(), window.height());
		return result;
	}

	cv::Mat overlay = debugger ? buffer.toBgr() : cv::Mat{};
	if (debugger) {
		cv::rectangle(overlay, cv::Rect(window.startX, window.startY, window.width(), window.height()), cv::Scalar(255, 255, 0), 2);
	}

	// 1) Skin tone ratio. The centroid of skin samples is the face centre estimate.
	const int skinStep    = std::max(1, config.skinStep);
	std::size_t skinCount = 0;
	std::size_t skinTotal = 0;
	double skinSumX       = 0.0;
	double skinSumY       = 0.0;
	for (int y = window.startY; y < window.endY; y += skinStep) {
		for (int x = window.startX; x < window.endX; x += skinStep) {
			if (isSkinTone(buffer.at(x, y), t.skin)) {
				++skinCount;
				skinSumX += x;
				skinSumY += y;
				if (debugger) {
					overlay.at<cv::Vec3b>(y, x) = cv::Vec3b(0, 255, 0);
				}
			}
			++skinTotal;
		}
	}
	result.skinRatio = ratio(skinCount, skinTotal);

	// 2) Eye band: dark pixels in the upper part of the window.
	const int eyeStep   = std::max(1, config.eyeStep);
	const int reach     = std::max(0, config.eyeNeighbourhood);
	const int bandTop   = std::clamp(window.startY + static_cast<int>(std::lround(window.height() * config.eyeBandStart)), window.startY, window.endY);
	const int bandEnd   = std::min(window.endY, bandTop + static_cast<int>(std::lround(window.height() * config.eyeBandHeight)));
	const int innerPad  = reach + 3;
	std::size_t eyeLike = 0, eyeRegion = 0, eyeTotal = 0;
	for (int y = bandTop; y < bandEnd; y += eyeStep) {
		for (int x = window.startX; x < window.endX; x += eyeStep) {
			++eyeTotal;

			const cv::Vec4b& px = buffer.at(x, y);
			const double lum    = luminance(px[0], px[1], px[2]);
			if (!(lum < t.eyeLuminanceMax && lum > t.eyeLuminanceMin && px[0] < t.eyeChannelMax && px[1] < t.eyeChannelMax && px[2] < t.eyeChannelMax)) {
				continue;
			}
			++eyeLike;

			const bool interior = x > window.startX + innerPad && x < window.endX - innerPad && y > bandTop + innerPad && y < bandEnd - innerPad;
			if (t.localEyeContrast && interior && lum < neighbourhoodMean(buffer, x, y, reach) - t.eyeLocalDelta) {
				++eyeRegion;
				if (debugger) {
					overlay.at<cv::Vec3b>(y, x) = cv::Vec3b(0, 0, 255);
				}
			}
		}
	}
	result.eyeRatio       = ratio(eyeLike, eyeTotal);
	result.eyeRegionRatio = ratio(eyeRegion, eyeTotal);
	if (debugger) {
		cv::rectangle(overlay, cv::Rect(window.startX, bandTop, window.width(), std::max(1, bandEnd - bandTop)), cv::Scalar(0, 128, 255), 1);
	}

	// 3) Structure: rows sampled at mirrored offsets around the vertical centre line.
	const int halfSpan         = std::min(window.centerX - window.startX, window.endX - 1 - window.centerX);
	std::size_t symmetricPairs = 0;
	const auto symmetrySamples = static_cast<std::size_t>(std::max(0, config.symmetrySamples));
	for (std::size_t i = 0; i < symmetrySamples && halfSpan > 0; ++i) {
		const int y      = window.startY + sampler.below(window.height());
		const int offset = 1 + sampler.below(halfSpan);
		const int leftX  = window.centerX - offset;
		const int rightX = window.centerX + offset;
		if (std::abs(buffer.luminanceAt(leftX, y) - buffer.luminanceAt(rightX, y)) < config.symmetryDeltaMax) {
			++symmetricPairs;
		}
		if (debugger) {
			cv::line(overlay, cv::Point(leftX, y), cv::Point(rightX, y), cv::Scalar(255, 0, 255), 1);
		}
	}
	result.structureScore = ratio(symmetricPairs, symmetrySamples);

	// Decision
	result.hasSkin = result.skinRatio >= t.minSkinRatio;
	result.hasEyes = result.eyeRatio >= t.minEyeRatio || result.eyeRegionRatio >= t.minEyeRegionRatio;
	const bool eyesSatisfied = result.hasEyes || t.eyesExempt || result.skinRatio >= t.minSkinRatio * config.strongSkinFactor;

	const double skinConfidence = t.minSkinRatio > 0.0 ? std::min(result.skinRatio / t.minSkinRatio, 1.0) : 1.0;
	const double eyeConfidence  = t.eyeConfidenceRatio > 0.0 ? std::min(result.eyeRatio / t.eyeConfidenceRatio * t.eyeConfidenceGain, 1.0) : 0.0;
	const double confidence     = skinConfidence * t.skinWeight + eyeConfidence * t.eyeWeight + result.structureScore * t.structureWeight;
	result.confidence           = std::clamp(confidence, 0.0, 1.0);

	result.sizeRatio = window.side / static_cast<double>(std::min(buffer.width(), buffer.height()));
	result.passed    = result.hasSkin && eyesSatisfied && result.sizeRatio > config.minSizeRatio && confidence >= t.minConfidence;

	if (result.passed) {
		FaceCandidate candidate{};
		candidate.centerX         = skinCount > 0 ? skinSumX / static_cast<double>(skinCount) : window.centerX;
		candidate.centerY         = skinCount > 0 ? skinSumY / static_cast<double>(skinCount) : window.centerY;
		candidate.approximateSize = window.side;
		candidate.confidence      = result.confidence;
		result.candidate          = candidate;
	}

	spdlog::debug("Face ({}): skin={:.3f} eyes={:.3f} eyeRegion={:.4f} structure={:.2f} conf={:.2f} -> {}", toString(lighting), result.skinRatio,
	              result.eyeRatio, result.eyeRegionRatio, result.structureScore, result.confidence, result.passed ? "face" : "no face");

	if (debugger) {
		if (result.candidate) {
			cv::drawMarker(overlay, cv::Point(static_cast<int>(result.candidate->centerX), static_cast<int>(result.candidate->centerY)), cv::Scalar(0, 255, 255),
			               cv::MARKER_CROSS, 24, 2);
		}
		debugger->beginStage("Face");
		debugger->add("Window / skin / eyes", overlay);
		debugger->note(std::format("thresholds={}", dim ? "low-light" : "normal"));
		debugger->note(std::format("skin={:.3f} (min {:.2f})", result.skinRatio, t.minSkinRatio));
		debugger->note(std::format("eyes={:.3f} region={:.4f}", result.eyeRatio, result.eyeRegionRatio));
		debugger->note(std::format("structure={:.2f}", result.structureScore));
		debugger->note(std::format("conf={:.2f} (min {:.2f})", result.confidence, t.minConfidence));
		debugger->endStage();
	}

	return result;
}

} // namespace facegate::vision::core
