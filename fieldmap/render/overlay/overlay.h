/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: render index grids and band composites to RGBA overlays
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup overlay overlay
 * @ingroup render
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "calculate/indices/indices.h"
#include "utils/config.h"
#include "utils/helper.h"
#include "utils/raster.h"

namespace fieldmap {
namespace overlay {

/**
 * @ingroup overlay
 * An 8 bit RGBA image, pixels interleaved and stored row major:
 * pixels[4 * (y * width + x) + c] for channel c in {r, g, b, a}.
 */
struct RGBAImage {
	int width = 0;
	int height = 0;
	std::vector<uint8_t> pixels;

	RGBAImage() = default;

	RGBAImage(int width, int height) :
		width(width),
		height(height),
		pixels(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0)
	{}

	uint8_t *pixel(int x, int y) {
		return &this->pixels[4 * (static_cast<size_t>(y) * this->width + x)];
	}

	const uint8_t *pixel(int x, int y) const {
		return &this->pixels[4 * (static_cast<size_t>(y) * this->width + x)];
	}

	uint8_t alpha(int x, int y) const {
		return this->pixel(x, y)[3];
	}
};

/**
 * @ingroup overlay
 * One layer to be drawn over the basemap: the image, where it goes,
 * and how opaque it is.
 */
struct Overlay {
	std::string name;
	RGBAImage image;
	raster::GeoBounds bounds;
	double opacity;
};

/**
 * @ingroup overlay
 * The 8 bit alpha of a valid pixel drawn at the given opacity.
 */
uint8_t opacityToAlpha(double opacity);

/**
 * @ingroup overlay
 * Renders an index grid through the style's ramp.
 *
 * Not-a-number pixels are looked up at the domain midpoint purely to give
 * them a color, and their alpha is forced to 0 so that masked regions are
 * transparent. Valid pixels receive the style's opacity as alpha.
 *
 * @param const indices::IndexGrid& grid
 * @param const config::OverlayStyle& style
 * @returns RGBAImage with the grid's dimensions
 */
RGBAImage render(const indices::IndexGrid& grid, const config::OverlayStyle& style);

/**
 * @ingroup overlay
 * The p-th percentile (0 to 100) of values, using linear interpolation
 * between the two nearest order statistics. Returns not-a-number if
 * values is empty. The vector is reordered.
 */
double percentile(std::vector<float>& values, double p);

/**
 * @ingroup overlay
 * Renders a true color composite from the red, green and blue bands.
 *
 * Each band is divided by its 98th percentile over valid pixels and scaled
 * to [0, 255] (clipped). A band with no valid pixels uses 1 as its
 * percentile. Masked pixels get RGB 0 and alpha 0; valid pixels get the
 * given opacity as alpha.
 *
 * @param const helper::BandSet& bands
 * @param const helper::ValidityMask& mask
 * @param double opacity
 * @returns RGBAImage
 */
RGBAImage renderComposite(const helper::BandSet& bands, const helper::ValidityMask& mask, double opacity);

/**
 * @ingroup overlay
 * Encodes the image as a four band PNG. The image is wrapped in an
 * in-memory (MEM) dataset which is then copied with the PNG driver.
 *
 * @param const RGBAImage& image
 * @param std::string filename
 * @throws error::EncodingError
 */
void writePNG(const RGBAImage& image, std::string filename);

} //namespace overlay
} //namespace fieldmap
