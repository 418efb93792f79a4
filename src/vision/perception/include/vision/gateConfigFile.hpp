#pragma once

#include "vision/faceGate.hpp"

#include <filesystem>
#include <stdexcept>

namespace facegate::vision {

//! The configuration file could not be opened or parsed.
class ConfigError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/*! Read pipeline settings from a YAML or JSON file (cv::FileStorage format).
 *  Every key is optional, missing keys keep the defaults of \p defaults. Keys with the wrong type are logged and ignored.
 *  Sections: seed, minDimension, lighting, screen, face (with normal and lowLight tables), object, blur, framing, liveness.
 * \throws ConfigError if the file cannot be opened or is not valid YAML/JSON.
 */
GateConfig loadGateConfig(const std::filesystem::path& path, GateConfig defaults = GateConfig{});

} // namespace facegate::vision
