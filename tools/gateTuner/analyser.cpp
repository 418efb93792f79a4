#include "analyser.hpp"

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/pointSampler.hpp"

#include <opencv2/imgproc.hpp>

#include <format>
#include <string>
#include <utility>

namespace facegate::vision {


static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

static std::string describe(const GateReport& report) {
	if (report.verdict.valid) {
		return std::format("ACCEPTED  confidence={:.2f}  live={}  lighting={}", report.verdict.confidence.value_or(0.0), report.verdict.isLive.value_or(false),
		                   core::toString(report.lighting.condition));
	}
	return std::format("REJECTED after {}: {}", report.failedAt ? toString(*report.failedAt) : std::string_view("?"), report.verdict.errorReason.value_or(""));
}


Analyser::Analyser(GateConfig config) : m_gate(std::move(config)) {
}

AnalysisView Analyser::analyse(const cv::Mat& frame, const GateStep step) const {
	if (frame.empty()) {
		return {buildInfoTile("Input Error", "Could not load image."), {}};
	}

	const core::PixelBuffer buffer = core::PixelBuffer::fromMat(frame);
	const GateConfig& config       = m_gate.config();

	core::DebugVisualizer debugger;
	debugger.setInteractive(false);

	// Single stages run on their own, independent of the earlier gates.
	const core::LightingCondition lighting = core::analyseLighting(buffer, config.lighting).condition;
	core::PointSampler sampler{config.seed};

	GateReport report{};
	switch (step) {
	case GateStep::Lighting:
		core::analyseLighting(buffer, config.lighting, &debugger);
		break;
	case GateStep::ScreenCapture:
		core::detectScreenCapture(buffer, lighting, sampler, config.screen, &debugger);
		break;
	case GateStep::Face:
		core::detectFace(buffer, lighting, sampler, config.face, &debugger);
		break;
	case GateStep::Object:
		core::detectObject(buffer, lighting, sampler, config.object, &debugger);
		break;
	case GateStep::Blur:
		core::detectBlur(buffer, lighting, sampler, config.blur, &debugger);
		break;
	case GateStep::Liveness:
		core::estimateLiveness(buffer, lighting, sampler, config.liveness, &debugger);
		break;
	case GateStep::All:
		report = m_gate.inspect(buffer, &debugger);
		break;
	}

	if (step != GateStep::All) {
		report = m_gate.inspect(buffer);
	}

	cv::Mat mosaic = debugger.buildMosaic();
	if (mosaic.empty()) {
		mosaic = buildInfoTile("No Debug Output", "Selected stage produced no visuals.");
	}
	return {std::move(mosaic), describe(report)};
}


} // namespace facegate::vision
