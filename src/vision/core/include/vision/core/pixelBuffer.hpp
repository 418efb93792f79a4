#pragma once

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <vector>

namespace facegate::vision::core {

//! Perceptual brightness of an RGB triple on a 0..255 scale.
inline double luminance(const double r, const double g, const double b) {
	return r * 0.299 + g * 0.587 + b * 0.114;
}

/*! Decoded photograph handed to the analysis stages.
 *  Samples are stored row-major as R,G,B,A bytes in a continuous CV_8UC4 matrix (note: RGBA, not OpenCV's usual BGR).
 *  The buffer is immutable once constructed and owns its samples.
 */
class PixelBuffer {
public:
	PixelBuffer() = default;

	//! Wrap raw RGBA samples. Throws std::invalid_argument unless samples.size() == width * height * 4.
	static PixelBuffer fromRgba(int width, int height, const std::vector<std::uint8_t>& samples);

	//! Convert an OpenCV image (8-bit gray, BGR or BGRA) to an RGBA buffer. Throws std::invalid_argument for other types.
	static PixelBuffer fromMat(const cv::Mat& image);

	int width() const { return m_rgba.cols; }
	int height() const { return m_rgba.rows; }
	bool empty() const { return m_rgba.empty(); }

	//! RGBA sample at column x, row y. No bounds check.
	const cv::Vec4b& at(int x, int y) const { return m_rgba.at<cv::Vec4b>(y, x); }

	//! Luminance of the sample at column x, row y.
	double luminanceAt(int x, int y) const {
		const cv::Vec4b& px = at(x, y);
		return luminance(px[0], px[1], px[2]);
	}

	const cv::Mat& rgba() const { return m_rgba; }

	//! BGR copy for drawing debug overlays.
	cv::Mat toBgr() const;

private:
	explicit PixelBuffer(cv::Mat rgba);

private:
	cv::Mat m_rgba; //!< CV_8UC4, continuous, RGBA channel order.
};

} // namespace facegate::vision::core
