#pragma once

#include "vision/core/blurDetector.hpp"
#include "vision/core/debugVisualizer.hpp"
#include "vision/core/faceDetector.hpp"
#include "vision/core/framing.hpp"
#include "vision/core/lighting.hpp"
#include "vision/core/liveness.hpp"
#include "vision/core/objectDetector.hpp"
#include "vision/core/pixelBuffer.hpp"
#include "vision/core/screenDetector.hpp"
#include "vision/pixelSampler.hpp"
#include "vision/verdict.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace facegate::vision {

//! The encoded input could not be turned into pixels.
class LoadError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! All tunables of the validation pipeline.
struct GateConfig {
	std::uint32_t seed{0x5EEDu}; //!< Seed of the per-call random source. Same seed and image -> same verdict.
	int minDimension{200};       //!< Smaller width or height is rejected before any analysis.

	core::LightingConfig lighting{};
	core::ScreenDetectionConfig screen{};
	core::FaceDetectionConfig face{};
	core::ObjectDetectionConfig object{};
	core::BlurDetectionConfig blur{};
	core::FramingConfig framing{};
	core::LivenessConfig liveness{};
};

//! Pipeline states in visiting order. Any failing check moves straight to Rejected.
enum class GateState {
	Start,
	Loaded,
	DimensionsChecked,
	BrightnessChecked,
	ScreenshotChecked,
	FaceChecked,
	ObjectChecked,
	BlurChecked,
	FramingChecked,
	LivenessChecked,
	Accepted,
	Rejected,
};

std::string_view toString(GateState state);

//! Verdict plus the trace of one pipeline run.
struct GateReport {
	ValidationVerdict verdict;
	GateState finalState{GateState::Start}; //!< Accepted or Rejected.
	std::optional<GateState> failedAt;      //!< Last state reached before the rejection.
	std::vector<GateState> visited;         //!< States passed through, Start first and the final state last.
	core::LightingProfile lighting{};
};

/*! Decides whether a selfie is acceptable for attendance check-in.
 *  Stages: dimensions, lighting, screen capture, face, object, blur, framing, liveness. The first failing stage rejects.
 *  A FaceGate holds no mutable state; concurrent calls are safe.
 */
class FaceGate {
public:
	explicit FaceGate(GateConfig config = GateConfig{}, std::shared_ptr<const PixelSampler> sampler = makeDefaultPixelSampler());

	//! Validate asynchronously. The future rethrows LoadError from get() if the input cannot be decoded.
	std::future<ValidationVerdict> validate(std::string encoded) const;

	//! Synchronous body of validate(). Throws LoadError on undecodable input.
	ValidationVerdict validateNow(std::string_view encoded) const;

	//! Run the analysis stages on an already decoded buffer.
	ValidationVerdict evaluate(const core::PixelBuffer& buffer) const;

	//! Like evaluate(), also returns the visited states and lighting. Stages draw into the debugger if given.
	GateReport inspect(const core::PixelBuffer& buffer, core::DebugVisualizer* debugger = nullptr) const;

	const GateConfig& config() const { return m_config; }

private:
	GateConfig m_config;
	std::shared_ptr<const PixelSampler> m_sampler;
};

//! Wait for a validation and turn any failure into a rejection: LoadError -> invalid image, anything else -> detection failed.
ValidationVerdict resolveFailClosed(std::future<ValidationVerdict> pending);

} // namespace facegate::vision
