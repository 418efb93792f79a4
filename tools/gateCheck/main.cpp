#include "vision/faceGate.hpp"
#include "vision/gateConfigFile.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct Arguments {
	std::filesystem::path image;
	std::optional<std::filesystem::path> config;
	bool verbose{false};
};

void printUsage() {
	std::cerr << "Usage: gateCheck <image-file> [--config <file>] [--verbose]\n"
	          << "  <image-file>  Encoded image, or a text file holding base64 or a data URL.\n"
	          << "Exit code: 0 accepted, 1 rejected, 2 usage or config error.\n";
}

std::optional<Arguments> parseArguments(int argc, char** argv) {
	Arguments args{};
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		if (arg == "--verbose" || arg == "-v") {
			args.verbose = true;
		} else if (arg == "--config") {
			if (i + 1 >= argc) {
				return std::nullopt;
			}
			args.config = argv[++i];
		} else if (arg.starts_with("-") || !args.image.empty()) {
			return std::nullopt;
		} else {
			args.image = arg;
		}
	}
	if (args.image.empty()) {
		return std::nullopt;
	}
	return args;
}

std::optional<std::string> readFile(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		return std::nullopt;
	}
	return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char** argv) {
	const std::optional<Arguments> args = parseArguments(argc, argv);
	if (!args) {
		printUsage();
		return 2;
	}
	spdlog::set_level(args->verbose ? spdlog::level::debug : spdlog::level::warn);

	facegate::vision::GateConfig config{};
	if (args->config) {
		try {
			config = facegate::vision::loadGateConfig(*args->config);
		} catch (const facegate::vision::ConfigError& e) {
			spdlog::error("{}", e.what());
			return 2;
		}
	}

	std::optional<std::string> encoded = readFile(args->image);
	if (!encoded) {
		spdlog::error("Cannot read '{}'", args->image.string());
		return 2;
	}

	const facegate::vision::FaceGate gate{config};
	const facegate::vision::ValidationVerdict verdict = facegate::vision::resolveFailClosed(gate.validate(std::move(*encoded)));

	if (verdict.valid) {
		std::cout << "ACCEPTED confidence=" << verdict.confidence.value_or(0.0) << " live=" << (verdict.isLive.value_or(false) ? "yes" : "no") << "\n";
		return 0;
	}
	std::cout << "REJECTED " << verdict.errorReason.value_or("") << "\n";
	return 1;
}
