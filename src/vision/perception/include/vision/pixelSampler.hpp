#pragma once

#include "vision/core/pixelBuffer.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace facegate::vision {

enum class DecodeStatus {
	Ok,
	InvalidData, //!< Not decodable: bad base64, empty, oversized or not an image.
	Unsupported, //!< This sampler cannot decode anything on the current platform.
};

struct DecodeResult {
	DecodeStatus status{DecodeStatus::InvalidData};
	core::PixelBuffer buffer; //!< Set only if status is Ok.
	std::string message;      //!< Human readable cause for the log if status is not Ok.
};

/*! Turns an encoded image into RGBA pixels.
 *  Accepts a data URL (data:image/...;base64,...), bare base64 text or the raw bytes of an encoded image.
 *  Implementations are stateless and may be shared between threads.
 */
class PixelSampler {
public:
	virtual ~PixelSampler() = default;

	virtual DecodeResult decode(std::string_view encoded) const = 0;

	//! False if decode() always reports Unsupported.
	virtual bool isSupported() const = 0;
};

//! Decodes everything OpenCV's imgcodecs can read (PNG, JPEG, BMP, WebP, ...).
class OpenCvPixelSampler : public PixelSampler {
public:
	static constexpr std::size_t MaxEncodedBytes = 10u * 1024u * 1024u;

	DecodeResult decode(std::string_view encoded) const override;
	bool isSupported() const override { return true; }
};

//! Fail-closed sampler for platforms without a decoder. Every input is Unsupported.
class UnsupportedPixelSampler : public PixelSampler {
public:
	DecodeResult decode(std::string_view encoded) const override;
	bool isSupported() const override { return false; }
};

std::shared_ptr<const PixelSampler> makeDefaultPixelSampler();

} // namespace facegate::vision
