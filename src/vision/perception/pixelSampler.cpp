#include "vision/pixelSampler.hpp"

#include "base64.hpp"

#include <spdlog/spdlog.h>

#include <format>
#include <optional>
#include <vector>

#include <opencv2/imgcodecs.hpp>

namespace facegate::vision {

namespace {

constexpr std::string_view DataUrlPrefix = "data:";

DecodeResult invalid(std::string message) {
	return DecodeResult{.status = DecodeStatus::InvalidData, .buffer = {}, .message = std::move(message)};
}

//! Encoded image bytes from a data URL, base64 text or raw binary. Empty if the text is not valid base64.
std::optional<std::vector<unsigned char>> extractBytes(std::string_view encoded) {
	if (encoded.starts_with(DataUrlPrefix)) {
		const std::size_t comma = encoded.find(',');
		if (comma == std::string_view::npos) {
			return std::nullopt;
		}
		const std::string_view header = encoded.substr(0, comma);
		if (!header.ends_with(";base64")) {
			return std::nullopt; // Percent-encoded data URLs never carry camera images.
		}
		return decodeBase64(encoded.substr(comma + 1));
	}

	if (looksLikeBase64(encoded)) {
		return decodeBase64(encoded);
	}
	return std::vector<unsigned char>(encoded.begin(), encoded.end());
}

} // namespace

DecodeResult OpenCvPixelSampler::decode(const std::string_view encoded) const {
	if (encoded.empty()) {
		return invalid("empty input");
	}

	const auto bytes = extractBytes(encoded);
	if (!bytes) {
		return invalid("malformed base64 payload");
	}
	if (bytes->empty()) {
		return invalid("empty image payload");
	}
	if (bytes->size() > MaxEncodedBytes) {
		return invalid(std::format("image payload of {} bytes exceeds {} bytes", bytes->size(), MaxEncodedBytes));
	}

	cv::Mat image;
	try {
		image = cv::imdecode(*bytes, cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		return invalid(std::format("decoder error: {}", e.what()));
	}
	if (image.empty()) {
		return invalid("payload is not a decodable image");
	}

	spdlog::debug("Decoded {}x{} image from {} bytes", image.cols, image.rows, bytes->size());
	return DecodeResult{.status = DecodeStatus::Ok, .buffer = core::PixelBuffer::fromMat(image), .message = {}};
}

DecodeResult UnsupportedPixelSampler::decode(std::string_view) const {
	return DecodeResult{.status = DecodeStatus::Unsupported, .buffer = {}, .message = "no image decoder available"};
}

std::shared_ptr<const PixelSampler> makeDefaultPixelSampler() {
	return std::make_shared<OpenCvPixelSampler>();
}

} // namespace facegate::vision
