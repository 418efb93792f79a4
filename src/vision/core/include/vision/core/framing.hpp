#pragma once

#include "vision/core/faceDetector.hpp"

#include <optional>

namespace facegate::vision::core {

struct FramingConfig {
	double maxOffsetFraction{0.3}; //!< Allowed distance of the face centre from the image centre, per axis, relative to that axis.
};

//! Result of the framing stage.
struct FramingResult {
	bool passed{false};
	double confidence{0.0}; //!< 1 at the exact centre, 0 at the tolerance border.
	double offsetX{0.0};    //!< |cx - W/2| / W
	double offsetY{0.0};    //!< |cy - H/2| / H
};

//! Check that the face candidate sits near the image centre. No candidate fails.
FramingResult checkFraming(const std::optional<FaceCandidate>& candidate, int width, int height, const FramingConfig& config = FramingConfig{});

} // namespace facegate::vision::core
