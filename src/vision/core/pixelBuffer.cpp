#include "vision/core/pixelBuffer.hpp"

#include <opencv2/imgproc.hpp>

#include <stdexcept>
#include <string>

namespace facegate::vision::core {

PixelBuffer::PixelBuffer(cv::Mat rgba) : m_rgba(std::move(rgba)) {
}

PixelBuffer PixelBuffer::fromRgba(const int width, const int height, const std::vector<std::uint8_t>& samples) {
	if (width <= 0 || height <= 0) {
		throw std::invalid_argument("PixelBuffer dimensions must be positive, got " + std::to_string(width) + "x" + std::to_string(height));
	}

	const std::size_t expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
	if (samples.size() != expected) {
		throw std::invalid_argument("PixelBuffer expects " + std::to_string(expected) + " samples, got " + std::to_string(samples.size()));
	}

	// Wrap then clone so the buffer owns its memory.
	const cv::Mat view(height, width, CV_8UC4, const_cast<std::uint8_t*>(samples.data()));
	return PixelBuffer(view.clone());
}

PixelBuffer PixelBuffer::fromMat(const cv::Mat& image) {
	if (image.empty()) {
		throw std::invalid_argument("PixelBuffer cannot be created from an empty image");
	}

	cv::Mat rgba;
	switch (image.type()) {
	case CV_8UC1:
		cv::cvtColor(image, rgba, cv::COLOR_GRAY2RGBA);
		break;
	case CV_8UC3:
		cv::cvtColor(image, rgba, cv::COLOR_BGR2RGBA);
		break;
	case CV_8UC4:
		cv::cvtColor(image, rgba, cv::COLOR_BGRA2RGBA);
		break;
	default:
		throw std::invalid_argument("PixelBuffer supports 8-bit gray, BGR and BGRA images only");
	}

	if (!rgba.isContinuous()) {
		rgba = rgba.clone();
	}
	return PixelBuffer(std::move(rgba));
}

cv::Mat PixelBuffer::toBgr() const {
	cv::Mat bgr;
	if (!m_rgba.empty()) {
		cv::cvtColor(m_rgba, bgr, cv::COLOR_RGBA2BGR);
	}
	return bgr;
}

} // namespace facegate::vision::core
