#pragma once

#include "gateStep.hpp"

#include "vision/faceGate.hpp"

#include <opencv2/core/mat.hpp>

#include <string>

namespace facegate::vision {

struct AnalysisView {
	cv::Mat mosaic;      //!< Debug mosaic of the selected stage.
	std::string verdict; //!< One line summary of the full pipeline run.
};

//! Runs the gate with the DebugVisualizer attached to the desired GateStep.
class Analyser {
public:
	explicit Analyser(GateConfig config = GateConfig{});

	AnalysisView analyse(const cv::Mat& frame, GateStep step) const;

private:
	FaceGate m_gate;
};

} // namespace facegate::vision
