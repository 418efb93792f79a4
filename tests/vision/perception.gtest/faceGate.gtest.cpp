#include "vision/faceGate.hpp"

#include "syntheticImages.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace facegate::vision {
namespace gtest {

using core::PixelBuffer;

namespace {

std::string encodePng(const PixelBuffer& buffer) {
	std::vector<unsigned char> png;
	cv::imencode(".png", buffer.toBgr(), png);
	return std::string(png.begin(), png.end());
}

bool visited(const GateReport& report, GateState state) {
	return std::find(report.visited.begin(), report.visited.end(), state) != report.visited.end();
}

//! Reports success without delivering pixels.
class BrokenPixelSampler : public PixelSampler {
public:
	DecodeResult decode(std::string_view) const override { return DecodeResult{.status = DecodeStatus::Ok, .buffer = {}, .message = {}}; }
	bool isSupported() const override { return true; }
};

} // namespace

TEST(FaceGate, AcceptsSyntheticFace) {
	const FaceGate gate;
	const GateReport report = gate.inspect(makeFaceScene());

	ASSERT_TRUE(report.verdict.valid) << report.verdict.errorReason.value_or("");
	ASSERT_TRUE(report.verdict.confidence.has_value());
	ASSERT_TRUE(report.verdict.isLive.has_value());
	EXPECT_GE(*report.verdict.confidence, 0.8);
	EXPECT_TRUE(*report.verdict.isLive);
	EXPECT_FALSE(report.verdict.errorReason.has_value());
	EXPECT_EQ(report.lighting.condition, core::LightingCondition::Normal);

	const std::vector<GateState> expected = {
	        GateState::Start,
	        GateState::Loaded,
	        GateState::DimensionsChecked,
	        GateState::BrightnessChecked,
	        GateState::ScreenshotChecked,
	        GateState::FaceChecked,
	        GateState::ObjectChecked,
	        GateState::BlurChecked,
	        GateState::FramingChecked,
	        GateState::LivenessChecked,
	        GateState::Accepted,
	};
	EXPECT_EQ(report.visited, expected);
	EXPECT_EQ(report.finalState, GateState::Accepted);
	EXPECT_FALSE(report.failedAt.has_value());
}

TEST(FaceGate, DimFacePassesWithLowLightThresholds) {
	const FaceGate gate;
	const GateReport report = gate.inspect(darkened(makeFaceScene(), 0.29));

	EXPECT_EQ(report.lighting.condition, core::LightingCondition::LowLight);
	EXPECT_GT(report.lighting.avgBrightness, 20.0);
	EXPECT_LT(report.lighting.avgBrightness, 40.0);
	ASSERT_TRUE(report.verdict.valid) << report.verdict.errorReason.value_or("");
	EXPECT_TRUE(report.verdict.isLive.value_or(false));
}

TEST(FaceGate, DimFaceFailsOnNormalThresholds) {
	GateConfig config{};
	config.face.lowLight = config.face.normal;

	const GateReport report = FaceGate{config}.inspect(darkened(makeFaceScene(), 0.29));
	EXPECT_FALSE(report.verdict.valid);
	EXPECT_EQ(report.verdict.errorReason, std::string(reasons::FaceNotDetectedLowLight));
	EXPECT_EQ(report.failedAt, GateState::ScreenshotChecked);
}

TEST(FaceGate, DarknessAlwaysWins) {
	const FaceGate gate;
	const PixelBuffer scene = makeFaceScene();
	for (const double factor : {0.02, 0.08, 0.12}) {
		const GateReport report = gate.inspect(darkened(scene, factor));
		EXPECT_EQ(report.verdict.errorReason, std::string(reasons::TooDark)) << "factor " << factor;
		EXPECT_EQ(report.failedAt, GateState::DimensionsChecked);
		EXPECT_FALSE(visited(report, GateState::FaceChecked));
	}
	EXPECT_EQ(gate.evaluate(uniform(300, 300, {5, 5, 5})).errorReason, std::string(reasons::TooDark));
}

TEST(FaceGate, OverExposureAlwaysWins) {
	const FaceGate gate;
	const PixelBuffer scene = makeFaceScene();
	for (const double keep : {0.0, 0.03, 0.05}) {
		EXPECT_EQ(gate.evaluate(washedOut(scene, keep)).errorReason, std::string(reasons::TooBright)) << "keep " << keep;
	}
	EXPECT_EQ(gate.evaluate(uniform(300, 300, {250, 250, 250})).errorReason, std::string(reasons::TooBright));
}

TEST(FaceGate, UniformBuffersNeverValidate) {
	const FaceGate gate;
	const std::vector<vision::gtest::Rgb> colours = {
	        {0, 0, 0}, {5, 5, 5}, {40, 30, 24}, {60, 90, 140}, {128, 128, 128}, {200, 150, 120}, {230, 230, 230}, {255, 255, 255},
	};
	for (const vision::gtest::Rgb& c : colours) {
		const ValidationVerdict verdict = gate.evaluate(uniform(320, 320, c));
		EXPECT_FALSE(verdict.valid) << c.r << "," << c.g << "," << c.b;
		EXPECT_TRUE(verdict.errorReason.has_value());
	}
}

TEST(FaceGate, StageReasons) {
	const FaceGate gate;
	EXPECT_EQ(gate.evaluate(uniform(150, 400, {120, 110, 100})).errorReason, std::string(reasons::TooSmall));
	EXPECT_EQ(gate.evaluate(uniform(400, 400, {230, 230, 230})).errorReason, std::string(reasons::Screenshot));
	EXPECT_EQ(gate.evaluate(uniform(400, 400, {128, 128, 128})).errorReason, std::string(reasons::FaceNotDetected));
	EXPECT_EQ(gate.evaluate(uniform(400, 400, {200, 150, 120})).errorReason, std::string(reasons::Blurry));
	EXPECT_EQ(gate.evaluate(uniform(400, 400, {40, 30, 24})).errorReason, std::string(reasons::NotLive));
}

TEST(FaceGate, LaterStageReasons) {
	const PixelBuffer scene = makeFaceScene();

	GateConfig object{};
	object.object.flagRatio        = -1.0;
	object.object.rejectConfidence = -1.0;
	EXPECT_EQ(FaceGate{object}.evaluate(scene).errorReason, std::string(reasons::ObjectDetected));

	GateConfig framing{};
	framing.framing.maxOffsetFraction = 0.0;
	const GateReport offCentre        = FaceGate{framing}.inspect(scene);
	EXPECT_EQ(offCentre.verdict.errorReason, std::string(reasons::NotCentered));
	EXPECT_EQ(offCentre.failedAt, GateState::BlurChecked);

	GateConfig liveness{};
	liveness.liveness.liveRatioMin = 1.0;
	EXPECT_EQ(FaceGate{liveness}.evaluate(scene).errorReason, std::string(reasons::NotLive));
}

TEST(FaceGate, MinimumDimensionIsConfigurable) {
	GateConfig config{};
	config.minDimension = 500;
	const GateReport report = FaceGate{config}.inspect(makeFaceScene());
	EXPECT_EQ(report.verdict.errorReason, std::string(reasons::TooSmall));
	EXPECT_EQ(report.failedAt, GateState::Loaded);
	EXPECT_EQ(report.visited.back(), GateState::Rejected);
}

TEST(FaceGate, SameInputSameVerdict) {
	const FaceGate gate;
	const PixelBuffer scene = makeFaceScene();
	const PixelBuffer dim   = darkened(scene, 0.29);

	for (const PixelBuffer* buffer : {&scene, &dim}) {
		const ValidationVerdict first  = gate.evaluate(*buffer);
		const ValidationVerdict second = gate.evaluate(*buffer);
		EXPECT_EQ(first.valid, second.valid);
		EXPECT_EQ(first.errorReason, second.errorReason);
		EXPECT_EQ(first.confidence, second.confidence);
		EXPECT_EQ(first.isLive, second.isLive);
	}
}

TEST(FaceGate, ValidatesEncodedImage) {
	const FaceGate gate;
	const PixelBuffer scene = makeFaceScene();

	const ValidationVerdict direct  = gate.evaluate(scene);
	const ValidationVerdict decoded = gate.validate(encodePng(scene)).get();
	EXPECT_TRUE(decoded.valid);
	EXPECT_EQ(decoded.confidence, direct.confidence);
	EXPECT_EQ(decoded.isLive, direct.isLive);
}

TEST(FaceGate, ConcurrentValidationsAgree) {
	const FaceGate gate;
	const std::string png = encodePng(makeFaceScene());

	std::vector<std::future<ValidationVerdict>> pending;
	for (int i = 0; i < 4; ++i) {
		pending.push_back(gate.validate(png));
	}
	std::vector<ValidationVerdict> verdicts;
	for (auto& future : pending) {
		verdicts.push_back(future.get());
	}
	for (const ValidationVerdict& verdict : verdicts) {
		EXPECT_TRUE(verdict.valid);
		EXPECT_EQ(verdict.confidence, verdicts.front().confidence);
	}
}

TEST(FaceGate, FutureOutlivesGate) {
	std::future<ValidationVerdict> pending;
	{
		const FaceGate gate;
		pending = gate.validate(encodePng(makeFaceScene()));
	}
	EXPECT_TRUE(pending.get().valid);
}

TEST(FaceGate, UndecodableInputRejectsTheFuture) {
	const FaceGate gate;
	EXPECT_THROW(gate.validate("definitely not an image").get(), LoadError);
	EXPECT_THROW(gate.validateNow(""), LoadError);

	const ValidationVerdict verdict = resolveFailClosed(gate.validate("definitely not an image"));
	EXPECT_FALSE(verdict.valid);
	EXPECT_EQ(verdict.errorReason, std::string(reasons::InvalidImage));
}

TEST(FaceGate, UnsupportedPlatformFailsClosed) {
	const FaceGate gate{GateConfig{}, std::make_shared<UnsupportedPixelSampler>()};
	const ValidationVerdict verdict = gate.validate(encodePng(makeFaceScene())).get();
	EXPECT_FALSE(verdict.valid);
	EXPECT_EQ(verdict.errorReason, std::string(reasons::PlatformUnsupported));

	const FaceGate noSampler{GateConfig{}, nullptr};
	EXPECT_EQ(noSampler.validateNow("anything").errorReason, std::string(reasons::PlatformUnsupported));
}

TEST(FaceGate, InconsistentDecoderIsAnError) {
	const FaceGate gate{GateConfig{}, std::make_shared<BrokenPixelSampler>()};
	EXPECT_THROW(gate.validateNow("anything"), std::logic_error);

	const ValidationVerdict verdict = resolveFailClosed(gate.validate("anything"));
	EXPECT_FALSE(verdict.valid);
	EXPECT_EQ(verdict.errorReason, std::string(reasons::DetectionFailed));
}

TEST(FaceGate, StateNames) {
	EXPECT_EQ(toString(GateState::BrightnessChecked), "BrightnessChecked");
	EXPECT_EQ(toString(GateState::Rejected), "Rejected");
}

} // namespace gtest
} // namespace facegate::vision
