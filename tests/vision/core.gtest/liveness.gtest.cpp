#include "vision/core/liveness.hpp"

#include "syntheticImages.hpp"

#include <gtest/gtest.h>

namespace facegate::vision::core {
namespace gtest {

using vision::gtest::darkened;
using vision::gtest::makeFaceScene;
using vision::gtest::uniform;

TEST(Liveness, NaturalVariationIsLive) {
	PointSampler sampler{9u};
	const LivenessResult result = estimateLiveness(makeFaceScene(), LightingCondition::Normal, sampler);
	EXPECT_GT(result.variationRatio, 0.4);
	EXPECT_TRUE(result.isLive);
	EXPECT_FALSE(result.lowLightExempt);
	EXPECT_TRUE(result.passed);
}

TEST(Liveness, FlatFrameIsStatic) {
	PointSampler sampler{9u};
	const LivenessResult result = estimateLiveness(uniform(400, 400, {120, 110, 100}), LightingCondition::Normal, sampler);
	EXPECT_DOUBLE_EQ(result.variationRatio, 0.0);
	EXPECT_FALSE(result.isLive);
	EXPECT_FALSE(result.passed);
}

TEST(Liveness, LowLightIsExempt) {
	PointSampler sampler{9u};
	const LivenessResult result = estimateLiveness(darkened(makeFaceScene(), 0.29), LightingCondition::LowLight, sampler);
	EXPECT_GT(result.variationRatio, 0.0);
	EXPECT_TRUE(result.isLive);
	EXPECT_TRUE(result.passed);
}

TEST(Liveness, FlatFrameIsNotExemptInLowLight) {
	PointSampler sampler{9u};
	const LivenessResult result = estimateLiveness(uniform(400, 400, {40, 30, 24}), LightingCondition::LowLight, sampler);
	EXPECT_FALSE(result.lowLightExempt);
	EXPECT_FALSE(result.passed);
}

TEST(Liveness, SameSeedSameResult) {
	const PixelBuffer scene = makeFaceScene();
	PointSampler first{21u};
	PointSampler second{21u};
	EXPECT_DOUBLE_EQ(estimateLiveness(scene, LightingCondition::Normal, first).variationRatio,
	                 estimateLiveness(scene, LightingCondition::Normal, second).variationRatio);
}

} // namespace gtest
} // namespace facegate::vision::core
