#include <gtest/gtest.h>

#include "utils/config.h"
#include "utils/errors.h"

using namespace fieldmap;

TEST(CompressionTest, ParsesCaseInsensitively) {
	EXPECT_EQ(config::compressionFromString("deflate"), config::Compression::Deflate);
	EXPECT_EQ(config::compressionFromString("LZW"), config::Compression::LZW);
	EXPECT_EQ(config::compressionFromString("Zstd"), config::Compression::ZSTD);
	EXPECT_EQ(config::compressionFromString("none"), config::Compression::None);
	EXPECT_EQ(config::compressionAsString(config::Compression::JPEG), "JPEG");
}

TEST(CompressionTest, UnknownCodecIsConfigError) {
	EXPECT_THROW(config::compressionFromString("LERC_ZIP"), error::ConfigError);
}

TEST(CompressionTest, OnlyJPEGIsLossy) {
	EXPECT_TRUE(config::isLossless(config::Compression::Deflate));
	EXPECT_TRUE(config::isLossless(config::Compression::None));
	EXPECT_FALSE(config::isLossless(config::Compression::JPEG));
}

TEST(PreviewOptionsTest, Defaults) {
	config::PreviewOptions options;
	EXPECT_EQ(options.decimation, 10);
	EXPECT_EQ(options.threads, 4);
}

TEST(PreviewOptionsTest, RejectsNonPositiveValues) {
	EXPECT_THROW(config::PreviewOptions(0, 4), error::ConfigError);
	EXPECT_THROW(config::PreviewOptions(10, 0), error::ConfigError);
	EXPECT_NO_THROW(config::PreviewOptions(1, 1));
}

TEST(COGProfileTest, TileSizeMustBePowerOfTwo) {
	EXPECT_THROW(config::COGProfile(500, config::Compression::Deflate), error::ConfigError);
	EXPECT_THROW(config::COGProfile(0, config::Compression::Deflate), error::ConfigError);
	EXPECT_THROW(config::COGProfile(8, config::Compression::Deflate), error::ConfigError);
	EXPECT_NO_THROW(config::COGProfile(256, config::Compression::Deflate));
}

TEST(COGProfileTest, OverviewFactorsMustIncreaseByPowersOfTwo) {
	EXPECT_THROW(config::COGProfile(512, config::Compression::LZW, {2, 3}), error::ConfigError);
	EXPECT_THROW(config::COGProfile(512, config::Compression::LZW, {4, 2}), error::ConfigError);
	EXPECT_THROW(config::COGProfile(512, config::Compression::LZW, {1, 2}), error::ConfigError);
	EXPECT_THROW(config::COGProfile(512, config::Compression::LZW, {2, 2}), error::ConfigError);

	config::COGProfile profile(512, config::Compression::LZW, {2, 8});
	EXPECT_TRUE(profile.hasExplicitOverviews());
	EXPECT_EQ(profile.getOverviewFactors(), std::vector<int>({2, 8}));
}

TEST(COGProfileTest, ReservedDriverOptionsAreRejected) {
	EXPECT_THROW(
		config::COGProfile(512, config::Compression::Deflate, {}, {{"compress", "LZW"}}),
		error::ConfigError
	);
	EXPECT_THROW(
		config::COGProfile(512, config::Compression::Deflate, {}, {{"BLOCKXSIZE", "128"}}),
		error::ConfigError
	);
}

TEST(COGProfileTest, DriverOptionKeysAreUppercased) {
	config::COGProfile profile(512, config::Compression::Deflate, {}, {{"predictor", "2"}});
	const std::map<std::string, std::string>& options = profile.getDriverOptions();
	ASSERT_EQ(options.count("PREDICTOR"), 1u);
	EXPECT_EQ(options.at("PREDICTOR"), "2");
	EXPECT_FALSE(profile.hasExplicitOverviews());
	EXPECT_STREQ(config::COGProfile::resampling(), "AVERAGE");
}

TEST(OverlayStyleTest, ValidatesDomainAndOpacity) {
	EXPECT_THROW(config::OverlayStyle(ramp::RdYlGn(), 1.0, -1.0, 0.7), error::ConfigError);
	EXPECT_THROW(config::OverlayStyle(ramp::RdYlGn(), 0.0, 0.0, 0.7), error::ConfigError);
	EXPECT_THROW(config::OverlayStyle(ramp::RdYlGn(), -1.0, 1.0, 1.5), error::ConfigError);
	EXPECT_THROW(config::OverlayStyle(ramp::RdYlGn(), -1.0, 1.0, -0.1), error::ConfigError);
}

TEST(OverlayStyleTest, DefaultsMatchDashboard) {
	config::OverlayStyle ndvi = config::defaultNDVIStyle();
	EXPECT_EQ(ndvi.ramp.getName(), "RdYlGn");
	EXPECT_DOUBLE_EQ(ndvi.opacity, 0.7);
	EXPECT_DOUBLE_EQ(ndvi.neutral(), 0.0);

	EXPECT_EQ(config::defaultNDWIStyle().ramp.getName(), "BrBG");
	EXPECT_EQ(config::defaultEVIStyle().ramp.getName(), "YlGn");
	EXPECT_DOUBLE_EQ(config::defaultCompositeOpacity(), 0.8);
}

TEST(PipelineOptionsTest, OutputsRequireDirectory) {
	config::PipelineOptions options;
	EXPECT_NO_THROW(options.validate());

	options.writeOverlays = true;
	EXPECT_THROW(options.validate(), error::ConfigError);

	options.outputDir = "/tmp/fieldmap";
	EXPECT_NO_THROW(options.validate());

	options.compositeOpacity = 2.0;
	EXPECT_THROW(options.validate(), error::ConfigError);
}

TEST(PipelineOptionsTest, ConfigErrorIsInvalidArgument) {
	config::PipelineOptions options;
	options.writeIndexRasters = true;
	EXPECT_THROW(options.validate(), std::invalid_argument);
}
