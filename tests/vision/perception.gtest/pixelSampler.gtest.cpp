#include "vision/pixelSampler.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace facegate::vision {
namespace gtest {

namespace {

std::string encodeBase64(const std::vector<unsigned char>& bytes, bool pad = true) {
	static constexpr std::string_view Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

	std::string out;
	unsigned value = 0;
	int bits       = -6;
	for (const unsigned char c : bytes) {
		value = (value << 8) + c;
		bits += 8;
		while (bits >= 0) {
			out.push_back(Alphabet[(value >> bits) & 0x3F]);
			bits -= 6;
		}
	}
	if (bits > -6) {
		out.push_back(Alphabet[((value << 8) >> (bits + 8)) & 0x3F]);
	}
	while (pad && out.size() % 4 != 0) {
		out.push_back('=');
	}
	return out;
}

std::vector<unsigned char> encodePng(const cv::Mat& bgr) {
	std::vector<unsigned char> png;
	cv::imencode(".png", bgr, png);
	return png;
}

cv::Mat smallImage() {
	cv::Mat image(24, 32, CV_8UC3, cv::Scalar(40, 80, 160));
	cv::circle(image, cv::Point(16, 12), 6, cv::Scalar(200, 220, 240), cv::FILLED);
	return image;
}

} // namespace

TEST(PixelSampler, DecodesRawPng) {
	const std::vector<unsigned char> png = encodePng(smallImage());
	const OpenCvPixelSampler sampler;

	const DecodeResult result = sampler.decode(std::string_view(reinterpret_cast<const char*>(png.data()), png.size()));
	ASSERT_EQ(result.status, DecodeStatus::Ok) << result.message;
	EXPECT_EQ(result.buffer.width(), 32);
	EXPECT_EQ(result.buffer.height(), 24);
	EXPECT_EQ(result.buffer.at(0, 0), cv::Vec4b(160, 80, 40, 255)); // BGR source, RGBA buffer.
}

TEST(PixelSampler, DecodesBase64AndDataUrl) {
	const std::string base64 = encodeBase64(encodePng(smallImage()));
	const OpenCvPixelSampler sampler;

	const DecodeResult bare = sampler.decode(base64);
	ASSERT_EQ(bare.status, DecodeStatus::Ok) << bare.message;
	EXPECT_EQ(bare.buffer.width(), 32);

	const DecodeResult dataUrl = sampler.decode("data:image/png;base64," + base64);
	ASSERT_EQ(dataUrl.status, DecodeStatus::Ok) << dataUrl.message;
	EXPECT_EQ(dataUrl.buffer.height(), 24);
}

TEST(PixelSampler, ToleratesLineBreaksAndMissingPadding) {
	std::string base64 = encodeBase64(encodePng(smallImage()), false);
	for (std::size_t pos = 76; pos < base64.size(); pos += 77) {
		base64.insert(pos, "\n");
	}

	const DecodeResult result = OpenCvPixelSampler{}.decode(base64);
	EXPECT_EQ(result.status, DecodeStatus::Ok) << result.message;
}

TEST(PixelSampler, RejectsUndecodableInput) {
	const OpenCvPixelSampler sampler;
	EXPECT_EQ(sampler.decode("").status, DecodeStatus::InvalidData);
	EXPECT_EQ(sampler.decode("data:image/png;base64,@@@@").status, DecodeStatus::InvalidData);
	EXPECT_EQ(sampler.decode("data:image/png,%89PNG").status, DecodeStatus::InvalidData);
	EXPECT_EQ(sampler.decode("data:image/png;base64").status, DecodeStatus::InvalidData);
	EXPECT_EQ(sampler.decode("QUJD=QUJD").status, DecodeStatus::InvalidData); // Data after padding.
	EXPECT_EQ(sampler.decode("QUJDR").status, DecodeStatus::InvalidData);     // Impossible length.
	EXPECT_EQ(sampler.decode("bm90IGFuIGltYWdl").status, DecodeStatus::InvalidData); // Valid base64, not an image.
	EXPECT_EQ(sampler.decode("\x89PNG but truncated").status, DecodeStatus::InvalidData);
}

TEST(PixelSampler, RejectsOversizedPayload) {
	const std::string huge(OpenCvPixelSampler::MaxEncodedBytes + 1u, '\xFF');
	const DecodeResult result = OpenCvPixelSampler{}.decode(huge);
	EXPECT_EQ(result.status, DecodeStatus::InvalidData);
	EXPECT_NE(result.message.find("exceeds"), std::string::npos);
}

TEST(PixelSampler, UnsupportedPlatformFailsClosed) {
	const std::vector<unsigned char> png = encodePng(smallImage());
	const UnsupportedPixelSampler sampler;

	EXPECT_FALSE(sampler.isSupported());
	const DecodeResult result = sampler.decode(std::string_view(reinterpret_cast<const char*>(png.data()), png.size()));
	EXPECT_EQ(result.status, DecodeStatus::Unsupported);
	EXPECT_TRUE(result.buffer.empty());
}

TEST(PixelSampler, DefaultSamplerDecodes) {
	const auto sampler = makeDefaultPixelSampler();
	ASSERT_NE(sampler, nullptr);
	EXPECT_TRUE(sampler->isSupported());
}

} // namespace gtest
} // namespace facegate::vision
