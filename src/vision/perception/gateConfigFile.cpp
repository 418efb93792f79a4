#include "vision/gateConfigFile.hpp"

#include <spdlog/spdlog.h>

#include <format>
#include <string>
#include <type_traits>
#include <utility>

#include <opencv2/core/persistence.hpp>

namespace facegate::vision {

namespace {

template <typename T>
void readIfPresent(const cv::FileNode& section, const char* key, T& target) {
	if (!section.isMap()) {
		return;
	}
	const cv::FileNode node = section[key];
	if (node.empty() || node.isNone()) {
		return;
	}

	if constexpr (std::is_same_v<T, bool>) {
		if (node.isInt()) {
			target = static_cast<int>(node) != 0;
			return;
		}
		if (node.isString()) {
			const std::string text = static_cast<std::string>(node);
			if (text == "true" || text == "false") {
				target = text == "true";
				return;
			}
		}
	} else if constexpr (std::is_integral_v<T>) {
		if (node.isInt()) {
			target = static_cast<T>(static_cast<int>(node));
			return;
		}
	} else {
		if (node.isInt() || node.isReal()) {
			target = static_cast<T>(static_cast<double>(node));
			return;
		}
	}
	spdlog::warn("Ignoring config key '{}' of section '{}': unexpected type", key, section.name());
}

//! Like readIfPresent, but a value outside [low, high] is reported and the default kept.
void readFractionIfPresent(const cv::FileNode& section, const char* key, double& target, const double low, const double high) {
	double value = target;
	readIfPresent(section, key, value);
	if (value < low || value > high) {
		spdlog::warn("Ignoring config key '{}' of section '{}': {} is outside [{}, {}]", key, section.name(), value, low, high);
		return;
	}
	target = value;
}

void readSkin(const cv::FileNode& section, core::SkinEnvelope& skin) {
	readIfPresent(section, "redMin", skin.redMin);
	readIfPresent(section, "redMax", skin.redMax);
	readIfPresent(section, "greenMin", skin.greenMin);
	readIfPresent(section, "greenMax", skin.greenMax);
	readIfPresent(section, "blueMin", skin.blueMin);
	readIfPresent(section, "blueMax", skin.blueMax);
	readIfPresent(section, "luminanceMin", skin.luminanceMin);
	readIfPresent(section, "requireRedDominant", skin.requireRedDominant);
	readIfPresent(section, "redGreenGapMin", skin.redGreenGapMin);
	readIfPresent(section, "redGreenSpreadMax", skin.redGreenSpreadMax);
}

void readThresholds(const cv::FileNode& section, core::FaceThresholds& table) {
	if (!section.isMap()) {
		return;
	}
	readSkin(section["skin"], table.skin);
	readIfPresent(section, "minSkinRatio", table.minSkinRatio);
	readIfPresent(section, "eyeLuminanceMax", table.eyeLuminanceMax);
	readIfPresent(section, "eyeLuminanceMin", table.eyeLuminanceMin);
	readIfPresent(section, "eyeChannelMax", table.eyeChannelMax);
	readIfPresent(section, "minEyeRatio", table.minEyeRatio);
	readIfPresent(section, "eyeConfidenceRatio", table.eyeConfidenceRatio);
	readIfPresent(section, "eyeConfidenceGain", table.eyeConfidenceGain);
	readIfPresent(section, "localEyeContrast", table.localEyeContrast);
	readIfPresent(section, "eyeLocalDelta", table.eyeLocalDelta);
	readIfPresent(section, "minEyeRegionRatio", table.minEyeRegionRatio);
	readIfPresent(section, "eyesExempt", table.eyesExempt);
	readIfPresent(section, "skinWeight", table.skinWeight);
	readIfPresent(section, "eyeWeight", table.eyeWeight);
	readIfPresent(section, "structureWeight", table.structureWeight);
	readIfPresent(section, "minConfidence", table.minConfidence);
}

void readLighting(const cv::FileNode& section, core::LightingConfig& config) {
	readIfPresent(section, "gridDivisions", config.gridDivisions);
	readIfPresent(section, "veryDarkBelow", config.veryDarkBelow);
	readIfPresent(section, "lowLightBelow", config.lowLightBelow);
	readIfPresent(section, "overExposedAbove", config.overExposedAbove);
}

void readScreen(const cv::FileNode& section, core::ScreenDetectionConfig& config) {
	readIfPresent(section, "borderSamples", config.borderSamples);
	readIfPresent(section, "borderVarianceMax", config.borderVarianceMax);
	readIfPresent(section, "borderWeight", config.borderWeight);
	readIfPresent(section, "pixelSamples", config.pixelSamples);
	readIfPresent(section, "subpixelChannelDeltaMax", config.subpixelChannelDeltaMax);
	readIfPresent(section, "subpixelRedMin", config.subpixelRedMin);
	readIfPresent(section, "subpixelRatioMin", config.subpixelRatioMin);
	readIfPresent(section, "subpixelWeight", config.subpixelWeight);
	readIfPresent(section, "brightLuminanceMin", config.brightLuminanceMin);
	readIfPresent(section, "brightRatioMin", config.brightRatioMin);
	readIfPresent(section, "brightWeight", config.brightWeight);
	readIfPresent(section, "flatNeighbourDeltaMax", config.flatNeighbourDeltaMax);
	readIfPresent(section, "flatRatioMin", config.flatRatioMin);
	readIfPresent(section, "flatWeight", config.flatWeight);
	readIfPresent(section, "runSamples", config.runSamples);
	readIfPresent(section, "runLength", config.runLength);
	readIfPresent(section, "runStepDeltaMax", config.runStepDeltaMax);
	readIfPresent(section, "runRatioMin", config.runRatioMin);
	readIfPresent(section, "runWeight", config.runWeight);
	readIfPresent(section, "transitionSamples", config.transitionSamples);
	readIfPresent(section, "transitionLuminanceMin", config.transitionLuminanceMin);
	readIfPresent(section, "transitionRatioMin", config.transitionRatioMin);
	readIfPresent(section, "transitionWeight", config.transitionWeight);
	readIfPresent(section, "maxScore", config.maxScore);
	readIfPresent(section, "flagScore", config.flagScore);
	readIfPresent(section, "rejectConfidence", config.rejectConfidence);
}

void readFace(const cv::FileNode& section, core::FaceDetectionConfig& config) {
	if (!section.isMap()) {
		return;
	}
	readFractionIfPresent(section, "windowFraction", config.windowFraction, 0.0, 1.0);
	readIfPresent(section, "skinStep", config.skinStep);
	readFractionIfPresent(section, "eyeBandStart", config.eyeBandStart, 0.0, 1.0);
	readFractionIfPresent(section, "eyeBandHeight", config.eyeBandHeight, 0.0, 1.0);
	readIfPresent(section, "eyeStep", config.eyeStep);
	readIfPresent(section, "eyeNeighbourhood", config.eyeNeighbourhood);
	readIfPresent(section, "symmetrySamples", config.symmetrySamples);
	readIfPresent(section, "symmetryDeltaMax", config.symmetryDeltaMax);
	readIfPresent(section, "strongSkinFactor", config.strongSkinFactor);
	readIfPresent(section, "minSizeRatio", config.minSizeRatio);
	readThresholds(section["normal"], config.normal);
	readThresholds(section["lowLight"], config.lowLight);
}

void readObject(const cv::FileNode& section, core::ObjectDetectionConfig& config) {
	readIfPresent(section, "samples", config.samples);
	readIfPresent(section, "sharpEdgeMin", config.sharpEdgeMin);
	readIfPresent(section, "flagRatio", config.flagRatio);
	readIfPresent(section, "rejectConfidence", config.rejectConfidence);
}

void readBlur(const cv::FileNode& section, core::BlurDetectionConfig& config) {
	readIfPresent(section, "samples", config.samples);
	readIfPresent(section, "minAverageDelta", config.minAverageDelta);
	readIfPresent(section, "sharpAverageDelta", config.sharpAverageDelta);
}

void readLiveness(const cv::FileNode& section, core::LivenessConfig& config) {
	readIfPresent(section, "samples", config.samples);
	readIfPresent(section, "variationMin", config.variationMin);
	readIfPresent(section, "liveRatioMin", config.liveRatioMin);
	readIfPresent(section, "exemptRatioMin", config.exemptRatioMin);
}

} // namespace

GateConfig loadGateConfig(const std::filesystem::path& path, GateConfig defaults) {
	cv::FileStorage storage;
	try {
		if (!storage.open(path.string(), cv::FileStorage::READ)) {
			throw ConfigError(std::format("Cannot open config file '{}'", path.string()));
		}
	} catch (const cv::Exception& e) {
		throw ConfigError(std::format("Cannot parse config file '{}': {}", path.string(), e.what()));
	}

	GateConfig config = std::move(defaults);
	const auto root   = storage.root();
	long long seed    = static_cast<long long>(config.seed);
	readIfPresent(root, "seed", seed);
	if (seed < 0) {
		spdlog::warn("Ignoring negative seed {} in '{}'", seed, path.string());
	} else {
		config.seed = static_cast<std::uint32_t>(seed);
	}
	readIfPresent(root, "minDimension", config.minDimension);

	readLighting(root["lighting"], config.lighting);
	readScreen(root["screen"], config.screen);
	readFace(root["face"], config.face);
	readObject(root["object"], config.object);
	readBlur(root["blur"], config.blur);
	readIfPresent(root["framing"], "maxOffsetFraction", config.framing.maxOffsetFraction);
	readLiveness(root["liveness"], config.liveness);

	spdlog::debug("Loaded gate config from '{}'", path.string());
	return config;
}

} // namespace facegate::vision
