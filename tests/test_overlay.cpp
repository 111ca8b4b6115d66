#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "calculate/mask/mask.h"
#include "render/overlay/overlay.h"
#include "test_util.h"

using namespace fieldmap;

TEST(OverlayTest, OpacityToAlpha) {
	EXPECT_EQ(overlay::opacityToAlpha(0.0), 0);
	EXPECT_EQ(overlay::opacityToAlpha(1.0), 255);
	EXPECT_EQ(overlay::opacityToAlpha(0.8), 204);
}

TEST(OverlayTest, MaskedPixelsAreTransparent) {
	const float nan = std::numeric_limits<float>::quiet_NaN();
	helper::Grid<float> values(3, 1);
	values.data = {1.0f, nan, -1.0f};
	indices::IndexGrid grid(indices::IndexKind::NDVI, values);

	config::OverlayStyle style = config::defaultNDVIStyle();
	overlay::RGBAImage image = overlay::render(grid, style);

	ASSERT_EQ(image.width, 3);
	ASSERT_EQ(image.height, 1);

	uint8_t alpha = overlay::opacityToAlpha(style.opacity);
	EXPECT_EQ(image.alpha(0, 0), alpha);
	EXPECT_EQ(image.alpha(1, 0), 0);
	EXPECT_EQ(image.alpha(2, 0), alpha);

	//+1 is the green end of RdYlGn, -1 the red end
	EXPECT_EQ(image.pixel(0, 0)[1], 0x68);
	EXPECT_EQ(image.pixel(2, 0)[0], 0xa5);

	//masked pixel takes the midpoint color but stays invisible
	EXPECT_EQ(image.pixel(1, 0)[0], 0xff);
	EXPECT_EQ(image.pixel(1, 0)[2], 0xbf);
}

TEST(OverlayTest, FullyMaskedGridIsFullyTransparent) {
	helper::Grid<float> values(4, 4, std::numeric_limits<float>::quiet_NaN());
	overlay::RGBAImage image = overlay::render(indices::IndexGrid(indices::IndexKind::EVI, values), config::defaultEVIStyle());
	for (int y = 0; y < 4; y++) {
		for (int x = 0; x < 4; x++) {
			EXPECT_EQ(image.alpha(x, y), 0);
		}
	}
}

TEST(OverlayTest, Percentile) {
	std::vector<float> values = {10, 0, 9, 1, 8, 2, 7, 3, 6, 4, 5};

	std::vector<float> copy = values;
	EXPECT_DOUBLE_EQ(overlay::percentile(copy, 50.0), 5.0);
	copy = values;
	EXPECT_NEAR(overlay::percentile(copy, 98.0), 9.8, 1e-9);
	copy = values;
	EXPECT_DOUBLE_EQ(overlay::percentile(copy, 0.0), 0.0);
	copy = values;
	EXPECT_DOUBLE_EQ(overlay::percentile(copy, 100.0), 10.0);

	std::vector<float> empty;
	EXPECT_TRUE(std::isnan(overlay::percentile(empty, 98.0)));
}

TEST(OverlayTest, CompositeStretchesAndMasks) {
	helper::BandSet bands = test::uniformBands(10, 10, 0, 0, 0, 0);
	for (int y = 0; y < 10; y++) {
		for (int x = 0; x < 10; x++) {
			float v = static_cast<float>(y * 10 + x);
			bands.red.at(x, y) = v;
			bands.green.at(x, y) = v;
			bands.blue.at(x, y) = v;
			bands.nir.at(x, y) = v;
		}
	}

	//pixel (0, 0) is all zero and therefore masked
	helper::ValidityMask mask = mask::buildMask(bands, std::nullopt);
	ASSERT_EQ(mask::countInvalid(mask), 1u);

	overlay::RGBAImage image = overlay::renderComposite(bands, mask, 0.8);
	EXPECT_EQ(image.alpha(0, 0), 0);
	EXPECT_EQ(image.pixel(0, 0)[0], 0);

	//the brightest pixel saturates, valid pixels carry the composite opacity
	EXPECT_EQ(image.pixel(9, 9)[0], 255);
	EXPECT_EQ(image.alpha(9, 9), 204);

	//values below the 98th percentile are scaled linearly
	uint8_t mid = image.pixel(0, 5)[1];
	EXPECT_GT(mid, 120);
	EXPECT_LT(mid, 140);
}

TEST(OverlayTest, CompositeWithNoValidPixels) {
	helper::BandSet bands = test::uniformBands(3, 3, 0, 0, 0, 0);
	helper::ValidityMask mask = mask::buildMask(bands, std::nullopt);

	overlay::RGBAImage image = overlay::renderComposite(bands, mask, 0.8);
	for (int y = 0; y < 3; y++) {
		for (int x = 0; x < 3; x++) {
			EXPECT_EQ(image.alpha(x, y), 0);
		}
	}
}

TEST(OverlayTest, WritePNG) {
	test::TempDir tmp;

	overlay::RGBAImage image(5, 3);
	image.pixel(2, 1)[0] = 200;
	image.pixel(2, 1)[3] = 179;

	std::string path = tmp.file("overlay.png");
	overlay::writePNG(image, path);

	raster::GDALRasterWrapper written(path);
	EXPECT_EQ(written.getDriver().substr(0, 3), "PNG");
	EXPECT_EQ(written.getWidth(), 5);
	EXPECT_EQ(written.getHeight(), 3);
	ASSERT_EQ(written.getBandCount(), 4);

	EXPECT_FLOAT_EQ(written.readBand(0).at(2, 1), 200.0f);
	EXPECT_FLOAT_EQ(written.readBand(3).at(2, 1), 179.0f);
	EXPECT_FLOAT_EQ(written.readBand(3).at(0, 0), 0.0f);
}
