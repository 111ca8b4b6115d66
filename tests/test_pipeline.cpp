#include <cmath>
#include <filesystem>

#include <gtest/gtest.h>

#include "pipeline/pipeline.h"
#include "test_util.h"

using namespace fieldmap;

namespace {

config::PipelineOptions
previewOptions(int decimation) {
	config::PipelineOptions options;
	options.preview = config::PreviewOptions(decimation, 2);
	return options;
}

} //namespace

TEST(PipelineTest, PreviewProducesFourOverlays) {
	test::TempDir tmp;
	test::RasterLayout layout;
	std::string source = test::writeRaster(tmp.file("field.tif"), layout);

	pipeline::PreviewResult result = pipeline::runPreview(source, previewOptions(4));

	EXPECT_EQ(result.width, 16);
	EXPECT_EQ(result.height, 12);
	EXPECT_EQ(result.indices.ndvi.getWidth(), 16);
	EXPECT_EQ(result.invalidPixels, 0u);
	ASSERT_EQ(result.stats.size(), 3u);
	EXPECT_EQ(result.stats[0].valid, 16u * 12u);
	EXPECT_TRUE(result.writtenFiles.empty());

	ASSERT_EQ(result.overlays.size(), 4u);
	EXPECT_EQ(result.overlays[0].name, "NDVI");
	EXPECT_EQ(result.overlays[1].name, "NDWI");
	EXPECT_EQ(result.overlays[2].name, "EVI");
	EXPECT_EQ(result.overlays[3].name, "RGB");
	EXPECT_DOUBLE_EQ(result.overlays[0].opacity, 0.7);
	EXPECT_DOUBLE_EQ(result.overlays[3].opacity, 0.8);

	for (const overlay::Overlay& layer : result.overlays) {
		EXPECT_EQ(layer.image.width, 16) << layer.name;
		EXPECT_EQ(layer.image.height, 12) << layer.name;
		EXPECT_DOUBLE_EQ(layer.bounds.north, result.bounds.north) << layer.name;
		EXPECT_DOUBLE_EQ(layer.bounds.west, result.bounds.west) << layer.name;
	}
}

TEST(PipelineTest, NoDataPixelsAreTransparent) {
	test::TempDir tmp;
	test::RasterLayout layout;
	layout.nodata = 0.0;
	layout.value = [](int band, int x, int y) {
		return x < 32 ? 0.0 : static_cast<double>(100 * (band + 1) + y);
	};
	std::string source = test::writeRaster(tmp.file("field.tif"), layout);

	pipeline::PreviewResult result = pipeline::runPreview(source, previewOptions(4));
	EXPECT_EQ(result.invalidPixels, 8u * 12u);

	EXPECT_TRUE(std::isnan(result.indices.ndvi.at(0, 0)));
	EXPECT_FALSE(std::isnan(result.indices.ndvi.at(15, 0)));
	for (const overlay::Overlay& layer : result.overlays) {
		EXPECT_EQ(layer.image.alpha(0, 0), 0) << layer.name;
		EXPECT_GT(layer.image.alpha(15, 0), 0) << layer.name;
	}
}

TEST(PipelineTest, WritesRequestedOutputs) {
	test::TempDir tmp;
	test::RasterLayout layout;
	std::string source = test::writeRaster(tmp.file("field.tif"), layout);

	config::PipelineOptions options = previewOptions(2);
	options.outputDir = tmp.file("out");
	options.writeIndexRasters = true;
	options.writeOverlays = true;

	pipeline::PreviewResult result = pipeline::runPreview(source, options);
	EXPECT_EQ(result.writtenFiles.size(), 7u);

	for (const char *name : {"ndvi.tif", "ndwi.tif", "evi.tif", "ndvi.png", "ndwi.png", "evi.png", "rgb.png"}) {
		EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(options.outputDir) / name)) << name;
	}

	//index rasters keep the source grid, overlays the preview grid
	raster::GDALRasterWrapper ndvi(tmp.file("out/ndvi.tif"));
	EXPECT_EQ(ndvi.getWidth(), 64);
	EXPECT_EQ(ndvi.getHeight(), 48);
	EXPECT_DOUBLE_EQ(ndvi.getPixelWidth(), 10.0);

	raster::GDALRasterWrapper rgb(tmp.file("out/rgb.png"));
	EXPECT_EQ(rgb.getWidth(), 32);
	EXPECT_EQ(rgb.getBandCount(), 4);
}

TEST(PipelineTest, RejectsThreeBandRaster) {
	test::TempDir tmp;
	test::RasterLayout layout;
	layout.bands = 3;
	std::string source = test::writeRaster(tmp.file("rgb.tif"), layout);

	EXPECT_THROW(pipeline::runPreview(source, previewOptions(4)), error::BandCountError);
}

TEST(PipelineTest, RejectsRasterWithoutCRS) {
	test::TempDir tmp;
	test::RasterLayout layout;
	layout.georeferenced = false;
	std::string source = test::writeRaster(tmp.file("plain.tif"), layout);

	EXPECT_THROW(pipeline::runPreview(source, previewOptions(4)), error::ProjectionError);
}

TEST(PipelineTest, InvalidOptionsFailBeforeOpening) {
	config::PipelineOptions options;
	options.writeOverlays = true;
	EXPECT_THROW(pipeline::runPreview("/nonexistent/field.tif", options), error::ConfigError);
}

TEST(PipelineTest, CancelledPreviewWritesNothing) {
	test::TempDir tmp;
	test::RasterLayout layout;
	std::string source = test::writeRaster(tmp.file("field.tif"), layout);

	config::PipelineOptions options = previewOptions(4);
	options.outputDir = tmp.file("out");
	options.writeIndexRasters = true;

	CancellationToken token;
	token.cancel();
	EXPECT_THROW(pipeline::runPreview(source, options, &token), error::CancelledError);
	EXPECT_FALSE(std::filesystem::exists(tmp.file("out/ndvi.tif")));
}

TEST(PipelineTest, FailedOutputRemovesEarlierOutputs) {
	test::TempDir tmp;
	test::RasterLayout layout;
	std::string source = test::writeRaster(tmp.file("field.tif"), layout);

	config::PipelineOptions options = previewOptions(1);
	options.outputDir = tmp.file("out");
	options.writeIndexRasters = true;
	options.writeOverlays = true;

	//a directory in the way of the second index raster
	std::filesystem::create_directories(tmp.file("out/ndwi.tif"));

	EXPECT_THROW(pipeline::runPreview(source, options), error::EncodingError);
	EXPECT_FALSE(std::filesystem::exists(tmp.file("out/ndvi.tif")));
	EXPECT_FALSE(std::filesystem::exists(tmp.file("out/evi.tif")));
	EXPECT_FALSE(std::filesystem::exists(tmp.file("out/ndvi.png")));
	EXPECT_TRUE(std::filesystem::is_directory(tmp.file("out/ndwi.tif")));
}

TEST(PipelineTest, DefaultCOGPath) {
	EXPECT_EQ(pipeline::defaultCOGPath("/data/field.tif"), "/data/field_cog.tif");
	EXPECT_EQ(pipeline::defaultCOGPath("/data/scene"), "/data/scene_cog");
}

TEST(PipelineTest, RunCOGWritesBesideSource) {
	test::TempDir tmp;
	test::RasterLayout layout;
	std::string source = test::writeRaster(tmp.file("field.tif"), layout);

	cog::COGInfo info = pipeline::runCOG(source, "", config::COGProfile(16, config::Compression::Deflate));
	EXPECT_TRUE(std::filesystem::exists(tmp.file("field_cog.tif")));
	EXPECT_EQ(info.tileWidth, 16);
	EXPECT_EQ(info.overviewFactors, std::vector<int>({2}));
}
