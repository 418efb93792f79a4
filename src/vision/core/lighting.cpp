#include "vision/core/lighting.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>

#include <opencv2/imgproc.hpp>

namespace facegate::vision::core {

std::string_view toString(const LightingCondition condition) {
	switch (condition) {
	case LightingCondition::Normal:
		return "normal";
	case LightingCondition::LowLight:
		return "low-light";
	case LightingCondition::VeryDark:
		return "very-dark";
	case LightingCondition::OverExposed:
		return "over-exposed";
	}
	return "unknown";
}

bool isLowLight(const LightingCondition condition) {
	switch (condition) {
	case LightingCondition::LowLight:
	case LightingCondition::VeryDark:
		return true;
	case LightingCondition::Normal:
	case LightingCondition::OverExposed:
		return false;
	}
	return false;
}

static LightingCondition classify(const LightingProfile& profile) {
	if (profile.isVeryDark) {
		return LightingCondition::VeryDark;
	}
	if (profile.isOverExposed) {
		return LightingCondition::OverExposed;
	}
	if (profile.isLowLight) {
		return LightingCondition::LowLight;
	}
	return LightingCondition::Normal;
}

LightingProfile analyseLighting(const PixelBuffer& buffer, const LightingConfig& config, DebugVisualizer* debugger) {
	LightingProfile profile{};
	if (buffer.empty()) {
		profile.isLowLight = profile.isVeryDark = true;
		profile.condition                       = LightingCondition::VeryDark;
		return profile;
	}

	const int divisions = std::max(1, config.gridDivisions);
	const int stepX     = std::max(1, buffer.width() / divisions);
	const int stepY     = std::max(1, buffer.height() / divisions);

	double total          = 0.0;
	profile.minBrightness = 255.0;
	profile.maxBrightness = 0.0;

	cv::Mat overlay = debugger ? buffer.toBgr() : cv::Mat{};
	for (int y = 0; y < buffer.height(); y += stepY) {
		for (int x = 0; x < buffer.width(); x += stepX) {
			const double value = buffer.luminanceAt(x, y);
			total += value;
			profile.minBrightness = std::min(profile.minBrightness, value);
			profile.maxBrightness = std::max(profile.maxBrightness, value);
			++profile.sampleCount;

			if (debugger) {
				cv::circle(overlay, cv::Point(x, y), 2, cv::Scalar(0, 255, 255), cv::FILLED);
			}
		}
	}

	profile.avgBrightness = total / static_cast<double>(profile.sampleCount);
	profile.isVeryDark    = profile.avgBrightness < config.veryDarkBelow;
	profile.isLowLight    = profile.avgBrightness < config.lowLightBelow;
	profile.isOverExposed = profile.avgBrightness > config.overExposedAbove;
	profile.condition     = classify(profile);

	spdlog::debug("Lighting: avg={:.1f} min={:.1f} max={:.1f} samples={} -> {}", profile.avgBrightness, profile.minBrightness, profile.maxBrightness,
	              profile.sampleCount, toString(profile.condition));

	if (debugger) {
		debugger->beginStage("Lighting");
		debugger->add("Sample grid", overlay);
		debugger->note(std::format("avg={:.1f}", profile.avgBrightness));
		debugger->note(std::format("min={:.1f} max={:.1f}", profile.minBrightness, profile.maxBrightness));
		debugger->note(std::format("condition={}", toString(profile.condition)));
		debugger->endStage();
	}

	return profile;
}

} // namespace facegate::vision::core
