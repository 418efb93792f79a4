#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace facegate::vision::core {

//! Each step in a stage.
struct DebugStep {
	std::string name; //!< Some name.
	cv::Mat image;    //!< BGR image produced by the step (overlay on the input photo).
};

//! The gate runs multiple stages. We collect images and metric notes per stage.
struct DebugStage {
	std::string name;                 //!< Name of the stage.
	std::vector<DebugStep> images{};  //!< Image name pair for every step that was added.
	std::vector<std::string> notes{}; //!< Metric lines ("skinRatio=0.41") shown below the images.
};

//! Can be passed to the analysis functions to get intermediate images and metrics for tuning.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< New stage starts. Ends the active one.
	void add(std::string name, const cv::Mat& img); //!< Add a BGR image given some step name. Show image in interactive mode.
	void note(std::string line);                    //!< Add a metric line to the active stage.
	void endStage();

	cv::Mat buildMosaic(); //!< Returns mosaic of all debug images. Ends currently active stage.

	const std::vector<DebugStage>& stages() const { return m_stages; }

	void setInteractive(bool interactive, unsigned displayTimeMs = 0u); //!< Enable immediate image display in add().
	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	bool m_interactive{false};  //!< Immediately show image when it's added.
	unsigned m_displayTime{0u}; //!< How many ms to show the image in interactive mode. 0->inf.

	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Collection of debug info for all stages.
};

} // namespace facegate::vision::core
