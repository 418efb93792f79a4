#include "analyser.hpp"
#include "mainWindow.hpp"
#include "webcamAnalysisLoop.hpp"

#include "vision/gateConfigFile.hpp"

#include <QApplication>

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>

// Usage: gateTuner [image-file] [config-file]
// Without an image the tuner starts on the webcam. Changing the stage re-renders the current frame.
int main(int argc, char** argv) {
	QApplication application(argc, argv);
	spdlog::set_level(spdlog::level::debug);

	facegate::vision::GateConfig config{};
	if (argc > 2) {
		try {
			config = facegate::vision::loadGateConfig(std::filesystem::path(argv[2]));
		} catch (const facegate::vision::ConfigError& e) {
			spdlog::error("{}", e.what());
			return 2;
		}
	}

	const facegate::vision::Analyser analyser{config};
	facegate::MainWindow window;
	facegate::WebcamAnalysisLoop webcam{window, analyser};

	cv::Mat still;
	if (argc > 1) {
		const std::filesystem::path inputPath = argv[1];
		still                                 = cv::imread(inputPath.string(), cv::IMREAD_COLOR);
		if (still.empty()) {
			spdlog::error("Failed to load image: {}", inputPath.string());
		}
	}

	const auto showStill = [&]() {
		const facegate::vision::AnalysisView view = analyser.analyse(still, window.selectedGateStep());
		window.setImage(view.mosaic);
		window.setVerdict(QString::fromStdString(view.verdict));
	};
	bool live = still.empty();

	window.setGateStepChangedCallback([&](facegate::GateStep) {
		if (live) {
			webcam.refreshFromLastFrame();
		} else {
			showStill();
		}
	});
	window.setSourceChangedCallback([&](facegate::MainWindow::Source source) {
		live = source == facegate::MainWindow::Source::Webcam;
		if (live) {
			if (!webcam.start()) {
				window.setVerdict("Camera not available.");
			}
		} else {
			webcam.stop();
			showStill();
		}
	});

	if (live) {
		if (!webcam.start()) {
			window.setVerdict("No image given and camera not available.");
		}
	} else {
		showStill();
	}

	window.resize(1400, 900);
	window.show();

	return application.exec();
}
