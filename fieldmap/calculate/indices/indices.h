/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: normalized vegetation and water indices
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup indices indices
 * @ingroup calculate
 */

#pragma once

#include <string>

#include "utils/helper.h"
#include "utils/raster.h"

namespace fieldmap {
namespace indices {

/**
 * @ingroup indices
 * The indices which may be derived from the four bands.
 */
enum class IndexKind {
	NDVI,
	NDWI,
	EVI
};

/**
 * @ingroup indices
 * "NDVI", "NDWI" or "EVI".
 */
std::string indexName(IndexKind kind);

/**
 * @ingroup indices
 * A named grid of index values. Every value is either within [-1, 1],
 * or not-a-number where the validity mask flagged the pixel invalid.
 * The grid is created once by the calculator and only read afterwards.
 */
class IndexGrid {
	private:
	IndexKind kind = IndexKind::NDVI;
	helper::Grid<float> values;

	public:
	IndexGrid() = default;

	IndexGrid(IndexKind kind, helper::Grid<float> values) :
		kind(kind),
		values(std::move(values))
	{}

	IndexKind getKind() const { return this->kind; }
	std::string getName() const { return indexName(this->kind); }
	const helper::Grid<float>& getValues() const { return this->values; }
	int getWidth() const { return this->values.width; }
	int getHeight() const { return this->values.height; }
	float at(int x, int y) const { return this->values.at(x, y); }
};

/**
 * @ingroup indices
 * The three indices derived from one set of bands.
 */
struct IndexSet {
	IndexGrid ndvi;
	IndexGrid ndwi;
	IndexGrid evi;
};

/**
 * @ingroup indices
 * Summary of an index grid over its valid (not-a-number free) pixels.
 * min, max and mean are not-a-number if there are no valid pixels.
 */
struct IndexStats {
	double min;
	double max;
	double mean;
	size_t valid;
	size_t invalid;
};

/**
 * @ingroup indices
 * Division with the zero denominator guard used by every index:
 * the result is 0 wherever the denominator is exactly 0.
 */
inline float
safeDivide(float numerator, float denominator) {
	return denominator == 0.0f ? 0.0f : numerator / denominator;
}

/**
 * @ingroup indices
 * Elementwise safeDivide over two grids of identical shape.
 *
 * @throws std::invalid_argument if the grids differ in size
 */
helper::Grid<float> safeDivide(const helper::Grid<float>& numerator, const helper::Grid<float>& denominator);

/**
 * @ingroup indices
 * Clip every value into [lo, hi]. Not-a-number values are left as they are.
 */
void clip(helper::Grid<float>& grid, float lo, float hi);

/**
 * @ingroup indices
 * Overwrite every value flagged invalid by the mask with not-a-number.
 *
 * @throws std::invalid_argument if the mask and grid differ in size
 */
void applyMask(helper::Grid<float>& grid, const helper::ValidityMask& mask);

/**
 * @ingroup indices
 * NDVI = (nir - red) / (nir + red)
 *
 * The zero denominator guard is applied first, then values are clipped
 * to [-1, 1], then masked pixels are set to not-a-number.
 */
IndexGrid ndvi(const helper::BandSet& bands, const helper::ValidityMask& mask);

/**
 * @ingroup indices
 * NDWI = (green - nir) / (green + nir)
 *
 * Same guard, clip and mask order as ndvi().
 */
IndexGrid ndwi(const helper::BandSet& bands, const helper::ValidityMask& mask);

/**
 * @ingroup indices
 * EVI = 2.5 * (nir - red) / (nir + 6 * red - 7.5 * blue + 1)
 *
 * Same guard, clip and mask order as ndvi().
 */
IndexGrid evi(const helper::BandSet& bands, const helper::ValidityMask& mask);

/**
 * @ingroup indices
 * Dispatch to ndvi(), ndwi() or evi().
 */
IndexGrid computeIndex(IndexKind kind, const helper::BandSet& bands, const helper::ValidityMask& mask);

/**
 * @ingroup indices
 * Compute all three indices. None of the calculations write to the
 * bands or mask, so each runs as an independent task on a thread pool.
 *
 * @param const helper::BandSet& bands
 * @param const helper::ValidityMask& mask
 * @param int threads
 * @returns IndexSet
 */
IndexSet computeAll(const helper::BandSet& bands, const helper::ValidityMask& mask, int threads);

/**
 * @ingroup indices
 * min, max and mean over valid pixels, plus valid and invalid counts.
 */
IndexStats computeStats(const IndexGrid& grid);

/**
 * @ingroup indices
 * Writes an index grid as a single band Float32 GeoTIFF, compressed with
 * LZW, with not-a-number declared as the nodata value.
 *
 * The geotransform is taken from the reference raster and rescaled to
 * the grid's pixel size, so a grid computed from a decimated read is
 * placed over the same extent. The projection is copied.
 *
 * If writing fails the partial file is removed.
 *
 * @param const IndexGrid& grid
 * @param raster::GDALRasterWrapper& reference
 * @param std::string filename
 * @throws error::EncodingError
 */
void writeIndexRaster(const IndexGrid& grid, raster::GDALRasterWrapper& reference, std::string filename);

} //namespace indices
} //namespace fieldmap
