#include "vision/core/blurDetector.hpp"

#include "syntheticImages.hpp"

#include <gtest/gtest.h>

namespace facegate::vision::core {
namespace gtest {

using vision::gtest::horizontalGradient;
using vision::gtest::makeFaceScene;

TEST(BlurDetector, SmoothGradientIsBlurry) {
	PointSampler sampler{4u};
	const BlurResult result = detectBlur(horizontalGradient(400, 400), LightingCondition::Normal, sampler);
	EXPECT_LT(result.averageDelta, 10.0);
	EXPECT_TRUE(result.isBlurry);
	EXPECT_FALSE(result.passed);
	EXPECT_FALSE(result.skipped);
	EXPECT_LT(result.confidence, 0.2);
}

TEST(BlurDetector, NoisyPhotoIsSharp) {
	PointSampler sampler{4u};
	const BlurResult result = detectBlur(makeFaceScene(), LightingCondition::Normal, sampler);
	EXPECT_GT(result.averageDelta, 30.0);
	EXPECT_FALSE(result.isBlurry);
	EXPECT_TRUE(result.passed);
	EXPECT_GT(result.confidence, 0.5);
	EXPECT_LE(result.confidence, 1.0);
}

TEST(BlurDetector, SkippedInLowLight) {
	PointSampler sampler{4u};
	DebugVisualizer debugger;
	const BlurResult result = detectBlur(horizontalGradient(400, 400), LightingCondition::LowLight, sampler, BlurDetectionConfig{}, &debugger);
	EXPECT_TRUE(result.skipped);
	EXPECT_TRUE(result.passed);
	EXPECT_FALSE(result.isBlurry);

	ASSERT_EQ(debugger.stages().size(), 1u);
	EXPECT_EQ(debugger.stages().front().notes.front(), "skipped: low light");
}

} // namespace gtest
} // namespace facegate::vision::core
