#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace facegate::vision {

//! Outcome of one validation. valid == true always carries confidence and isLive.
struct ValidationVerdict {
	bool valid{false};
	std::optional<std::string> errorReason; //!< User-facing rejection reason, one of vision::reasons.
	std::optional<double> confidence;
	std::optional<bool> isLive;
};

//! Stable user-facing rejection messages.
namespace reasons {

inline constexpr std::string_view TooSmall                = "Image is too small. Please capture a clear photo of your face.";
inline constexpr std::string_view TooDark                 = "Image is too dark. Please ensure your face is visible with some lighting.";
inline constexpr std::string_view TooBright               = "Image is too bright. Please reduce lighting or move to a better location.";
inline constexpr std::string_view Screenshot              = "Please capture a live photo with your face, not a screenshot or photo of a mobile screen.";
inline constexpr std::string_view FaceNotDetected         = "Face not detected. Please ensure your face is clearly visible in the center of the camera.";
inline constexpr std::string_view FaceNotDetectedLowLight = "Face not detected. Please ensure your face is visible in the camera frame.";
inline constexpr std::string_view ObjectDetected          = "Please capture a photo of your face, not an object or other item.";
inline constexpr std::string_view Blurry                  = "Image is too blurry. Please hold the camera steady and ensure good lighting.";
inline constexpr std::string_view NotCentered             = "Please position your face in the center of the camera frame.";
inline constexpr std::string_view NotLive                 = "Please capture a live photo. Static images or photos of photos are not allowed.";
inline constexpr std::string_view InvalidImage            = "Invalid image. Please try again.";
inline constexpr std::string_view PlatformUnsupported     = "Face verification is not supported on this device. Please try a different device or browser.";
inline constexpr std::string_view DetectionFailed         = "Face detection failed. Please try again.";

} // namespace reasons

inline ValidationVerdict accept(const double confidence, const bool isLive) {
	return ValidationVerdict{.valid = true, .errorReason = std::nullopt, .confidence = confidence, .isLive = isLive};
}

inline ValidationVerdict reject(const std::string_view reason) {
	return ValidationVerdict{.valid = false, .errorReason = std::string(reason), .confidence = std::nullopt, .isLive = std::nullopt};
}

} // namespace facegate::vision
