#include "vision/gateConfigFile.hpp"

#include <gtest/gtest.h>
#include <opencv2/core/persistence.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace facegate::vision {
namespace gtest {

//! Temporary file removed at scope exit.
class TempFile {
public:
	explicit TempFile(const std::string& extension) {
		const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
		m_path = std::filesystem::temp_directory_path() / (std::string("facegate_") + info->name() + extension);
	}
	~TempFile() {
		std::error_code ignored;
		std::filesystem::remove(m_path, ignored);
	}

	const std::filesystem::path& path() const { return m_path; }

private:
	std::filesystem::path m_path;
};

TEST(GateConfigFile, ReadsYamlOverrides) {
	const TempFile file(".yml");
	{
		cv::FileStorage fs(file.path().string(), cv::FileStorage::WRITE);
		fs << "seed" << 42;
		fs << "minDimension" << 320;
		fs << "lighting" << "{" << "lowLightBelow" << 60.5 << "}";
		fs << "screen" << "{" << "rejectConfidence" << 0.9 << "runSamples" << 12 << "}";
		fs << "face" << "{";
		fs << "windowFraction" << 0.6;
		fs << "normal" << "{" << "minSkinRatio" << 0.3 << "localEyeContrast" << 0 << "skin" << "{" << "redMin" << 100 << "}" << "}";
		fs << "lowLight" << "{" << "eyesExempt" << 0 << "}";
		fs << "}";
		fs << "framing" << "{" << "maxOffsetFraction" << 0.25 << "}";
		fs << "liveness" << "{" << "samples" << 80 << "exemptRatioMin" << 0.05 << "}";
	}

	const GateConfig config = loadGateConfig(file.path());
	EXPECT_EQ(config.seed, 42u);
	EXPECT_EQ(config.minDimension, 320);
	EXPECT_DOUBLE_EQ(config.lighting.lowLightBelow, 60.5);
	EXPECT_DOUBLE_EQ(config.screen.rejectConfidence, 0.9);
	EXPECT_EQ(config.screen.runSamples, 12);
	EXPECT_DOUBLE_EQ(config.face.windowFraction, 0.6);
	EXPECT_DOUBLE_EQ(config.face.normal.minSkinRatio, 0.3);
	EXPECT_FALSE(config.face.normal.localEyeContrast);
	EXPECT_EQ(config.face.normal.skin.redMin, 100);
	EXPECT_FALSE(config.face.lowLight.eyesExempt);
	EXPECT_DOUBLE_EQ(config.framing.maxOffsetFraction, 0.25);
	EXPECT_EQ(config.liveness.samples, 80);
	EXPECT_DOUBLE_EQ(config.liveness.exemptRatioMin, 0.05);

	// Untouched keys keep their defaults.
	const GateConfig defaults{};
	EXPECT_DOUBLE_EQ(config.lighting.veryDarkBelow, defaults.lighting.veryDarkBelow);
	EXPECT_EQ(config.face.normal.skin.greenMin, defaults.face.normal.skin.greenMin);
	EXPECT_DOUBLE_EQ(config.face.lowLight.minSkinRatio, defaults.face.lowLight.minSkinRatio);
	EXPECT_EQ(config.blur.samples, defaults.blur.samples);
}

TEST(GateConfigFile, ReadsJson) {
	const TempFile file(".json");
	{
		std::ofstream out(file.path());
		out << R"({ "blur": { "samples": 10, "minAverageDelta": 4.5 }, "object": { "flagRatio": 0.75 } })";
	}

	const GateConfig config = loadGateConfig(file.path());
	EXPECT_EQ(config.blur.samples, 10);
	EXPECT_DOUBLE_EQ(config.blur.minAverageDelta, 4.5);
	EXPECT_DOUBLE_EQ(config.object.flagRatio, 0.75);
}

TEST(GateConfigFile, WrongTypesKeepDefaults) {
	const TempFile file(".json");
	{
		std::ofstream out(file.path());
		out << R"({ "minDimension": "large", "seed": -3, "liveness": { "samples": 1.5 } })";
	}

	const GateConfig config = loadGateConfig(file.path());
	const GateConfig defaults{};
	EXPECT_EQ(config.minDimension, defaults.minDimension);
	EXPECT_EQ(config.seed, defaults.seed);
	EXPECT_EQ(config.liveness.samples, defaults.liveness.samples);
}

TEST(GateConfigFile, OutOfRangeFractionsKeepDefaults) {
	const TempFile file(".json");
	{
		std::ofstream out(file.path());
		out << R"({ "face": { "eyeBandStart": -0.6, "windowFraction": 1.5, "eyeBandHeight": 0.4 } })";
	}

	const GateConfig config = loadGateConfig(file.path());
	const GateConfig defaults{};
	EXPECT_DOUBLE_EQ(config.face.eyeBandStart, defaults.face.eyeBandStart);
	EXPECT_DOUBLE_EQ(config.face.windowFraction, defaults.face.windowFraction);
	EXPECT_DOUBLE_EQ(config.face.eyeBandHeight, 0.4);
}

TEST(GateConfigFile, StartsFromGivenDefaults) {
	const TempFile file(".json");
	{
		std::ofstream out(file.path());
		out << R"({ "minDimension": 100 })";
	}

	GateConfig base{};
	base.seed = 7u;
	const GateConfig config = loadGateConfig(file.path(), base);
	EXPECT_EQ(config.seed, 7u);
	EXPECT_EQ(config.minDimension, 100);
}

TEST(GateConfigFile, MissingFileThrows) {
	EXPECT_THROW(loadGateConfig(std::filesystem::temp_directory_path() / "facegate_does_not_exist.yml"), ConfigError);
}

} // namespace gtest
} // namespace facegate::vision
