#include "vision/core/framing.hpp"

#include <gtest/gtest.h>

namespace facegate::vision::core {
namespace gtest {

static FaceCandidate candidateAt(double x, double y) {
	return FaceCandidate{.centerX = x, .centerY = y, .approximateSize = 100.0, .confidence = 0.9};
}

TEST(Framing, CentredFacePasses) {
	const FramingResult result = checkFraming(candidateAt(200.0, 200.0), 400, 400);
	EXPECT_TRUE(result.passed);
	EXPECT_DOUBLE_EQ(result.offsetX, 0.0);
	EXPECT_DOUBLE_EQ(result.confidence, 1.0);
}

TEST(Framing, OffsetsAreRelativeToEachAxis) {
	// 0.25 horizontally, 0.125 vertically on a 400x800 portrait frame.
	const FramingResult result = checkFraming(candidateAt(300.0, 500.0), 400, 800);
	EXPECT_TRUE(result.passed);
	EXPECT_DOUBLE_EQ(result.offsetX, 0.25);
	EXPECT_DOUBLE_EQ(result.offsetY, 0.125);
	EXPECT_NEAR(result.confidence, 1.0 - 0.25 / 0.3, 1e-12);
}

TEST(Framing, FaceNearCornerFails) {
	const FramingResult result = checkFraming(candidateAt(40.0, 40.0), 400, 400);
	EXPECT_FALSE(result.passed);
	EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}

TEST(Framing, BoundaryIsExclusive) {
	EXPECT_FALSE(checkFraming(candidateAt(320.0, 200.0), 400, 400).passed); // Exactly 0.3.
	EXPECT_TRUE(checkFraming(candidateAt(319.0, 200.0), 400, 400).passed);
}

TEST(Framing, MissingCandidateFails) {
	const FramingResult result = checkFraming(std::nullopt, 400, 400);
	EXPECT_FALSE(result.passed);
	EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}

} // namespace gtest
} // namespace facegate::vision::core
