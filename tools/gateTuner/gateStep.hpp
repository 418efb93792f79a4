#pragma once

#include <array>
#include <string_view>

namespace facegate {

//! Pipeline stage shown in the tuner.
enum class GateStep {
	Lighting,
	ScreenCapture,
	Face,
	Object,
	Blur,
	Liveness,
	All,
};

inline constexpr std::array<GateStep, 7> AllGateSteps{
        GateStep::Lighting, GateStep::ScreenCapture, GateStep::Face, GateStep::Object, GateStep::Blur, GateStep::Liveness, GateStep::All,
};

inline std::string_view toString(const GateStep step) {
	switch (step) {
	case GateStep::Lighting:
		return "Lighting";
	case GateStep::ScreenCapture:
		return "Screen Capture";
	case GateStep::Face:
		return "Face";
	case GateStep::Object:
		return "Object";
	case GateStep::Blur:
		return "Blur";
	case GateStep::Liveness:
		return "Liveness";
	case GateStep::All:
		return "All";
	}
	return "Unknown";
}

} // namespace facegate
