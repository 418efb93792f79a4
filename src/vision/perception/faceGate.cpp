#include "vision/faceGate.hpp"

#include "vision/core/pointSampler.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace facegate::vision {

std::string_view toString(const GateState state) {
	switch (state) {
	case GateState::Start:
		return "Start";
	case GateState::Loaded:
		return "Loaded";
	case GateState::DimensionsChecked:
		return "DimensionsChecked";
	case GateState::BrightnessChecked:
		return "BrightnessChecked";
	case GateState::ScreenshotChecked:
		return "ScreenshotChecked";
	case GateState::FaceChecked:
		return "FaceChecked";
	case GateState::ObjectChecked:
		return "ObjectChecked";
	case GateState::BlurChecked:
		return "BlurChecked";
	case GateState::FramingChecked:
		return "FramingChecked";
	case GateState::LivenessChecked:
		return "LivenessChecked";
	case GateState::Accepted:
		return "Accepted";
	case GateState::Rejected:
		return "Rejected";
	}
	return "Unknown";
}

FaceGate::FaceGate(GateConfig config, std::shared_ptr<const PixelSampler> sampler) : m_config{std::move(config)}, m_sampler{std::move(sampler)} {
	if (!m_sampler) {
		m_sampler = std::make_shared<UnsupportedPixelSampler>();
	}
}

std::future<ValidationVerdict> FaceGate::validate(std::string encoded) const {
	// The task owns a copy of the gate, the future may outlive this instance.
	return std::async(std::launch::async, [gate = *this, encoded = std::move(encoded)]() { return gate.validateNow(encoded); });
}

ValidationVerdict FaceGate::validateNow(const std::string_view encoded) const {
	DecodeResult decoded = m_sampler->decode(encoded);
	switch (decoded.status) {
	case DecodeStatus::Unsupported:
		spdlog::warn("Image decoding unsupported: {}", decoded.message);
		return reject(reasons::PlatformUnsupported);
	case DecodeStatus::InvalidData:
		spdlog::error("Failed to load image: {}", decoded.message);
		throw LoadError(decoded.message);
	case DecodeStatus::Ok:
		break;
	}

	if (decoded.buffer.empty()) {
		throw std::logic_error("Pixel sampler reported success without pixels");
	}
	return evaluate(decoded.buffer);
}

ValidationVerdict FaceGate::evaluate(const core::PixelBuffer& buffer) const {
	return inspect(buffer).verdict;
}

GateReport FaceGate::inspect(const core::PixelBuffer& buffer, core::DebugVisualizer* debugger) const {
	GateReport report{};
	report.visited.push_back(GateState::Start);

	const auto advance = [&](const GateState next) { report.visited.push_back(next); };
	const auto fail    = [&](const std::string_view reason) -> GateReport& {
		report.failedAt   = report.visited.back();
		report.finalState = GateState::Rejected;
		report.verdict    = reject(reason);
		report.visited.push_back(GateState::Rejected);
		spdlog::warn("Rejected after {}: {}", toString(*report.failedAt), reason);
		return report;
	};

	core::PointSampler sampler{m_config.seed};
	advance(GateState::Loaded);

	if (buffer.width() < m_config.minDimension || buffer.height() < m_config.minDimension) {
		return fail(reasons::TooSmall);
	}
	advance(GateState::DimensionsChecked);

	report.lighting                        = core::analyseLighting(buffer, m_config.lighting, debugger);
	const core::LightingCondition lighting = report.lighting.condition;
	if (lighting == core::LightingCondition::VeryDark) {
		return fail(reasons::TooDark);
	}
	if (lighting == core::LightingCondition::OverExposed) {
		return fail(reasons::TooBright);
	}
	advance(GateState::BrightnessChecked);

	const core::ScreenResult screen = core::detectScreenCapture(buffer, lighting, sampler, m_config.screen, debugger);
	if (!screen.passed) {
		return fail(reasons::Screenshot);
	}
	advance(GateState::ScreenshotChecked);

	const core::FaceResult face = core::detectFace(buffer, lighting, sampler, m_config.face, debugger);
	if (!face.passed) {
		return fail(core::isLowLight(lighting) ? reasons::FaceNotDetectedLowLight : reasons::FaceNotDetected);
	}
	advance(GateState::FaceChecked);

	const core::ObjectResult object = core::detectObject(buffer, lighting, sampler, m_config.object, debugger);
	if (!object.passed) {
		return fail(reasons::ObjectDetected);
	}
	advance(GateState::ObjectChecked);

	const core::BlurResult blur = core::detectBlur(buffer, lighting, sampler, m_config.blur, debugger);
	if (!blur.passed) {
		return fail(reasons::Blurry);
	}
	advance(GateState::BlurChecked);

	const core::FramingResult framing = core::checkFraming(face.candidate, buffer.width(), buffer.height(), m_config.framing);
	if (!framing.passed) {
		return fail(reasons::NotCentered);
	}
	advance(GateState::FramingChecked);

	const core::LivenessResult liveness = core::estimateLiveness(buffer, lighting, sampler, m_config.liveness, debugger);
	if (!liveness.passed) {
		return fail(reasons::NotLive);
	}
	advance(GateState::LivenessChecked);

	report.verdict    = accept(face.confidence, liveness.isLive);
	report.finalState = GateState::Accepted;
	advance(GateState::Accepted);

	spdlog::info("Accepted: confidence={:.2f} live={} lighting={}", face.confidence, liveness.isLive, core::toString(lighting));
	return report;
}

ValidationVerdict resolveFailClosed(std::future<ValidationVerdict> pending) {
	try {
		return pending.get();
	} catch (const LoadError& e) {
		spdlog::error("Validation failed, invalid image: {}", e.what());
		return reject(reasons::InvalidImage);
	} catch (const std::exception& e) {
		spdlog::error("Validation failed: {}", e.what());
		return reject(reasons::DetectionFailed);
	}
}

} // namespace facegate::vision
