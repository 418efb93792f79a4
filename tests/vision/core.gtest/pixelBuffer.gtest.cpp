#include "vision/core/pixelBuffer.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace facegate::vision::core {
namespace gtest {

TEST(PixelBuffer, WrapsRgbaSamples) {
	const std::vector<std::uint8_t> samples = {10, 20, 30, 255, 200, 100, 50, 255};
	const PixelBuffer buffer                = PixelBuffer::fromRgba(2, 1, samples);

	ASSERT_EQ(buffer.width(), 2);
	ASSERT_EQ(buffer.height(), 1);
	EXPECT_EQ(buffer.at(1, 0)[0], 200);
	EXPECT_EQ(buffer.at(1, 0)[2], 50);
	EXPECT_NEAR(buffer.luminanceAt(0, 0), 10 * 0.299 + 20 * 0.587 + 30 * 0.114, 1e-9);
}

TEST(PixelBuffer, RejectsInconsistentSizes) {
	EXPECT_THROW(PixelBuffer::fromRgba(2, 2, std::vector<std::uint8_t>(15)), std::invalid_argument);
	EXPECT_THROW(PixelBuffer::fromRgba(0, 2, {}), std::invalid_argument);
	EXPECT_THROW(PixelBuffer::fromMat(cv::Mat{}), std::invalid_argument);
	EXPECT_THROW(PixelBuffer::fromMat(cv::Mat(4, 4, CV_32FC3, cv::Scalar::all(0.5))), std::invalid_argument);
}

TEST(PixelBuffer, ConvertsBgrToRgba) {
	const cv::Mat bgr(3, 5, CV_8UC3, cv::Scalar(30, 20, 10)); // B, G, R
	const PixelBuffer buffer = PixelBuffer::fromMat(bgr);

	ASSERT_EQ(buffer.width(), 5);
	ASSERT_EQ(buffer.height(), 3);
	const cv::Vec4b& px = buffer.at(4, 2);
	EXPECT_EQ(px[0], 10);
	EXPECT_EQ(px[1], 20);
	EXPECT_EQ(px[2], 30);
	EXPECT_EQ(px[3], 255);

	const cv::Mat back = buffer.toBgr();
	EXPECT_EQ(back.at<cv::Vec3b>(0, 0), cv::Vec3b(30, 20, 10));
}

TEST(PixelBuffer, ConvertsGray) {
	const PixelBuffer buffer = PixelBuffer::fromMat(cv::Mat(2, 2, CV_8UC1, cv::Scalar(77)));
	EXPECT_EQ(buffer.at(1, 1), cv::Vec4b(77, 77, 77, 255));
}

TEST(PixelBuffer, OwnsItsSamples) {
	std::vector<std::uint8_t> samples(4u * 4u, 50);
	const PixelBuffer buffer = PixelBuffer::fromRgba(2, 2, samples);
	samples[0]               = 0;
	EXPECT_EQ(buffer.at(0, 0)[0], 50);
}

} // namespace gtest
} // namespace facegate::vision::core
