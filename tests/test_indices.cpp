#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "calculate/indices/indices.h"
#include "calculate/mask/mask.h"
#include "test_util.h"

using namespace fieldmap;

namespace {

helper::ValidityMask
allValid(const helper::BandSet& bands) {
	return helper::ValidityMask(bands.width(), bands.height(), 0);
}

} //namespace

TEST(IndicesTest, LiteralValues) {
	helper::BandSet bands = test::uniformBands(1, 1, 100, 50, 50, 200);
	helper::ValidityMask mask = allValid(bands);

	EXPECT_NEAR(indices::ndvi(bands, mask).at(0, 0), 1.0 / 3.0, 1e-6);
	EXPECT_NEAR(indices::ndwi(bands, mask).at(0, 0), -0.6, 1e-6);
	EXPECT_NEAR(indices::evi(bands, mask).at(0, 0), 250.0 / 426.0, 1e-6);
}

TEST(IndicesTest, ZeroDenominatorGivesZero) {
	EXPECT_EQ(indices::safeDivide(5.0f, 0.0f), 0.0f);
	EXPECT_EQ(indices::safeDivide(0.0f, 0.0f), 0.0f);

	//valid pixel where nir + red == 0 and green + nir == 0
	helper::BandSet bands = test::uniformBands(1, 1, 0, 0, 7, 0);
	helper::ValidityMask mask = mask::buildMask(bands, std::nullopt);
	ASSERT_EQ(mask.at(0, 0), 0);

	EXPECT_EQ(indices::ndvi(bands, mask).at(0, 0), 0.0f);
	EXPECT_EQ(indices::ndwi(bands, mask).at(0, 0), 0.0f);
	EXPECT_FALSE(std::isnan(indices::evi(bands, mask).at(0, 0)));
}

TEST(IndicesTest, EVIDenominatorZeroIsGuarded) {
	//nir + 6 * red - 7.5 * blue + 1 == 0
	helper::BandSet bands = test::uniformBands(1, 1, 1, 10, 2, 8);
	EXPECT_EQ(indices::evi(bands, allValid(bands)).at(0, 0), 0.0f);
}

TEST(IndicesTest, MaskedPixelsAreNaN) {
	helper::BandSet bands = test::uniformBands(2, 1, 100, 50, 50, 200);
	bands.red.at(1, 0) = 0;
	bands.green.at(1, 0) = 0;
	bands.blue.at(1, 0) = 0;
	bands.nir.at(1, 0) = 0;

	helper::ValidityMask mask = mask::buildMask(bands, std::nullopt);
	indices::IndexSet all = indices::computeAll(bands, mask, 3);

	for (const indices::IndexGrid *p_grid : {&all.ndvi, &all.ndwi, &all.evi}) {
		EXPECT_FALSE(std::isnan(p_grid->at(0, 0))) << p_grid->getName();
		EXPECT_TRUE(std::isnan(p_grid->at(1, 0))) << p_grid->getName();
	}
}

TEST(IndicesTest, ValuesAreClippedToUnitRange) {
	//EVI exceeds 1 before clipping: 2.5 * 1000 / (1000 + 0 - 7.5 + 1)
	helper::BandSet bands = test::uniformBands(1, 1, 0, 10, 1, 1000);
	float v = indices::evi(bands, allValid(bands)).at(0, 0);
	EXPECT_EQ(v, 1.0f);

	//EVI below -1: 2.5 * (0 - 100) / (0 + 600 - 600 + 1)
	helper::BandSet low = test::uniformBands(1, 1, 100, 10, 80, 0);
	EXPECT_EQ(indices::evi(low, allValid(low)).at(0, 0), -1.0f);
}

TEST(IndicesTest, RangeHoldsOverVariedInput) {
	helper::BandSet bands = test::uniformBands(16, 16, 0, 0, 0, 0);
	for (int y = 0; y < 16; y++) {
		for (int x = 0; x < 16; x++) {
			bands.red.at(x, y) = static_cast<float>(x * 37 % 11);
			bands.green.at(x, y) = static_cast<float>(y * 13 % 7);
			bands.blue.at(x, y) = static_cast<float>((x + y) % 5) * 40.0f;
			bands.nir.at(x, y) = static_cast<float>(x * y % 17);
		}
	}

	helper::ValidityMask mask = mask::buildMask(bands, std::nullopt);
	indices::IndexSet all = indices::computeAll(bands, mask, 2);
	for (const indices::IndexGrid *p_grid : {&all.ndvi, &all.ndwi, &all.evi}) {
		for (float v : p_grid->getValues().data) {
			if (!std::isnan(v)) {
				EXPECT_GE(v, -1.0f);
				EXPECT_LE(v, 1.0f);
			}
		}
	}
}

TEST(IndicesTest, RecomputationIsIdentical) {
	helper::BandSet bands = test::uniformBands(4, 4, 120, 80, 60, 300);
	bands.nir.at(2, 3) = 10;
	helper::ValidityMask mask = mask::buildMask(bands, std::nullopt);

	indices::IndexGrid first = indices::computeIndex(indices::IndexKind::NDVI, bands, mask);
	indices::IndexGrid second = indices::computeIndex(indices::IndexKind::NDVI, bands, mask);
	EXPECT_EQ(first.getValues().data, second.getValues().data);
}

TEST(IndicesTest, ShapeMismatchThrows) {
	helper::BandSet bands = test::uniformBands(2, 2, 1, 1, 1, 1);
	helper::ValidityMask mask(3, 3, 0);
	EXPECT_THROW(indices::ndvi(bands, mask), std::invalid_argument);
}

TEST(IndicesTest, StatsSkipNaN) {
	helper::Grid<float> values(3, 1);
	values.data = {-0.5f, 0.5f, std::numeric_limits<float>::quiet_NaN()};
	indices::IndexStats stats = indices::computeStats(indices::IndexGrid(indices::IndexKind::NDWI, values));

	EXPECT_EQ(stats.valid, 2u);
	EXPECT_EQ(stats.invalid, 1u);
	EXPECT_DOUBLE_EQ(stats.min, -0.5);
	EXPECT_DOUBLE_EQ(stats.max, 0.5);
	EXPECT_DOUBLE_EQ(stats.mean, 0.0);
}

TEST(IndicesTest, StatsOfFullyMaskedGrid) {
	helper::Grid<float> values(2, 2, std::numeric_limits<float>::quiet_NaN());
	indices::IndexStats stats = indices::computeStats(indices::IndexGrid(indices::IndexKind::EVI, values));
	EXPECT_EQ(stats.valid, 0u);
	EXPECT_TRUE(std::isnan(stats.mean));
}

TEST(IndicesTest, IndexRasterKeepsExtent) {
	test::TempDir tmp;
	test::RasterLayout layout;
	layout.width = 40;
	layout.height = 20;
	std::string source = test::writeRaster(tmp.file("source.tif"), layout);

	raster::GDALRasterWrapper raster(source);
	helper::BandSet bands = raster.readBands(4, 2);
	helper::ValidityMask mask = mask::buildMask(bands, raster.getNoDataValue());
	indices::IndexGrid grid = indices::ndvi(bands, mask);

	std::string out = tmp.file("ndvi.tif");
	indices::writeIndexRaster(grid, raster, out);

	raster::GDALRasterWrapper written(out);
	EXPECT_EQ(written.getWidth(), 10);
	EXPECT_EQ(written.getHeight(), 5);
	EXPECT_EQ(written.getDataType(), "Float32");
	EXPECT_DOUBLE_EQ(written.getPixelWidth(), 40.0);
	EXPECT_DOUBLE_EQ(written.getXMin(), raster.getXMin());
	EXPECT_DOUBLE_EQ(written.getYMax(), raster.getYMax());
	EXPECT_DOUBLE_EQ(written.getXMax(), raster.getXMax());

	std::optional<double> nodata = written.getNoDataValue();
	ASSERT_TRUE(nodata.has_value());
	EXPECT_TRUE(std::isnan(*nodata));

	helper::Band values = written.readBand(0);
	EXPECT_FLOAT_EQ(values.at(3, 2), grid.at(3, 2));
}
