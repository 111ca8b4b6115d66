/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: normalized vegetation and water indices
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <algorithm>
#include <cmath>
#include <limits>

#include "calculate/indices/indices.h"

namespace fieldmap {
namespace indices {

namespace {

/**
 * Shared tail of every index calculation: guard, clip, mask, in that order.
 */
IndexGrid
finish(
	IndexKind kind,
	const helper::Grid<float>& numerator,
	const helper::Grid<float>& denominator,
	const helper::ValidityMask& mask)
{
	helper::Grid<float> values = safeDivide(numerator, denominator);
	clip(values, -1.0f, 1.0f);
	applyMask(values, mask);
	return IndexGrid(kind, std::move(values));
}

void
checkInputs(const helper::BandSet& bands, const helper::ValidityMask& mask) {
	bands.checkShape();
	if (!mask.sameShape(bands.red)) {
		throw std::invalid_argument("validity mask dimensions do not match band dimensions.");
	}
}

} //namespace

/******************************************************************************
				  indexName()
******************************************************************************/
std::string indexName(IndexKind kind) {
	switch (kind) {
		case IndexKind::NDVI:
			return "NDVI";
		case IndexKind::NDWI:
			return "NDWI";
		case IndexKind::EVI:
			return "EVI";
	}
	throw std::invalid_argument("unknown index kind.");
}

/******************************************************************************
				 safeDivide()
******************************************************************************/
helper::Grid<float> safeDivide(const helper::Grid<float>& numerator, const helper::Grid<float>& denominator) {
	if (!numerator.sameShape(denominator)) {
		throw std::invalid_argument("numerator and denominator grids must have identical dimensions.");
	}

	helper::Grid<float> retval(numerator.width, numerator.height);
	for (size_t i = 0; i < retval.size(); i++) {
		retval.data[i] = safeDivide(numerator.data[i], denominator.data[i]);
	}
	return retval;
}

/******************************************************************************
				    clip()
******************************************************************************/
void clip(helper::Grid<float>& grid, float lo, float hi) {
	for (float& v : grid.data) {
		if (v < lo) {
			v = lo;
		}
		else if (v > hi) {
			v = hi;
		}
	}
}

/******************************************************************************
				  applyMask()
******************************************************************************/
void applyMask(helper::Grid<float>& grid, const helper::ValidityMask& mask) {
	if (!grid.sameShape(mask)) {
		throw std::invalid_argument("validity mask dimensions do not match grid dimensions.");
	}

	const float nan = std::numeric_limits<float>::quiet_NaN();
	for (size_t i = 0; i < grid.size(); i++) {
		if (mask.data[i]) {
			grid.data[i] = nan;
		}
	}
}

/******************************************************************************
				    ndvi()
******************************************************************************/
IndexGrid ndvi(const helper::BandSet& bands, const helper::ValidityMask& mask) {
	checkInputs(bands, mask);

	helper::Grid<float> num(bands.width(), bands.height());
	helper::Grid<float> den(bands.width(), bands.height());
	for (size_t i = 0; i < num.size(); i++) {
		float red = bands.red.data[i];
		float nir = bands.nir.data[i];
		num.data[i] = nir - red;
		den.data[i] = nir + red;
	}

	return finish(IndexKind::NDVI, num, den, mask);
}

/******************************************************************************
				    ndwi()
******************************************************************************/
IndexGrid ndwi(const helper::BandSet& bands, const helper::ValidityMask& mask) {
	checkInputs(bands, mask);

	helper::Grid<float> num(bands.width(), bands.height());
	helper::Grid<float> den(bands.width(), bands.height());
	for (size_t i = 0; i < num.size(); i++) {
		float green = bands.green.data[i];
		float nir = bands.nir.data[i];
		num.data[i] = green - nir;
		den.data[i] = green + nir;
	}

	return finish(IndexKind::NDWI, num, den, mask);
}

/******************************************************************************
				     evi()
******************************************************************************/
IndexGrid evi(const helper::BandSet& bands, const helper::ValidityMask& mask) {
	checkInputs(bands, mask);

	helper::Grid<float> num(bands.width(), bands.height());
	helper::Grid<float> den(bands.width(), bands.height());
	for (size_t i = 0; i < num.size(); i++) {
		float red = bands.red.data[i];
		float blue = bands.blue.data[i];
		float nir = bands.nir.data[i];
		num.data[i] = 2.5f * (nir - red);
		den.data[i] = nir + 6.0f * red - 7.5f * blue + 1.0f;
	}

	return finish(IndexKind::EVI, num, den, mask);
}

/******************************************************************************
				computeIndex()
******************************************************************************/
IndexGrid computeIndex(IndexKind kind, const helper::BandSet& bands, const helper::ValidityMask& mask) {
	switch (kind) {
		case IndexKind::NDVI:
			return ndvi(bands, mask);
		case IndexKind::NDWI:
			return ndwi(bands, mask);
		case IndexKind::EVI:
			return evi(bands, mask);
	}
	throw std::invalid_argument("unknown index kind.");
}

/******************************************************************************
				 computeAll()
******************************************************************************/
IndexSet computeAll(const helper::BandSet& bands, const helper::ValidityMask& mask, int threads) {
	checkInputs(bands, mask);

	IndexSet retval;
	std::vector<std::function<void()>> tasks = {
		[&] { retval.ndvi = ndvi(bands, mask); },
		[&] { retval.ndwi = ndwi(bands, mask); },
		[&] { retval.evi = evi(bands, mask); }
	};
	helper::runParallel(threads, tasks);

	return retval;
}

/******************************************************************************
				computeStats()
******************************************************************************/
IndexStats computeStats(const IndexGrid& grid) {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	IndexStats retval{nan, nan, nan, 0, 0};

	double sum = 0;
	double min = std::numeric_limits<double>::infinity();
	double max = -std::numeric_limits<double>::infinity();
	for (float v : grid.getValues().data) {
		if (std::isnan(v)) {
			retval.invalid++;
			continue;
		}
		min = std::min(min, static_cast<double>(v));
		max = std::max(max, static_cast<double>(v));
		sum += static_cast<double>(v);
		retval.valid++;
	}

	if (retval.valid > 0) {
		retval.min = min;
		retval.max = max;
		retval.mean = sum / static_cast<double>(retval.valid);
	}
	return retval;
}

/******************************************************************************
			       writeIndexRaster()
******************************************************************************/
void writeIndexRaster(const IndexGrid& grid, raster::GDALRasterWrapper& reference, std::string filename) {
	int width = grid.getWidth();
	int height = grid.getHeight();

	//rescale the pixel size of the reference to the grid
	double *refGT = reference.getGeotransform();
	double sx = static_cast<double>(reference.getWidth()) / static_cast<double>(width);
	double sy = static_cast<double>(reference.getHeight()) / static_cast<double>(height);
	double geotransform[6] = {
		refGT[0], refGT[1] * sx, refGT[2] * sy,
		refGT[3], refGT[4] * sx, refGT[5] * sy
	};

	std::map<std::string, std::string> driverOptions = {{"COMPRESS", "LZW"}};

	try {
		GDALDatasetUniquePtr p_dataset = helper::createDataset(
			filename,
			"GTiff",
			width,
			height,
			1,
			GDT_Float32,
			reference.isGeoreferenced() ? geotransform : nullptr,
			reference.getProjection(),
			0,
			driverOptions
		);

		GDALRasterBand *p_band = p_dataset->GetRasterBand(1);
		p_band->SetDescription(grid.getName().c_str());
		if (p_band->SetNoDataValue(std::numeric_limits<double>::quiet_NaN()) != CE_None) {
			throw error::EncodingError(error::withGDALMessage("unable to set nodata value on '" + filename + "'."));
		}

		CPLErr err = p_band->RasterIO(
			GF_Write,
			0,
			0,
			width,
			height,
			const_cast<float *>(grid.getValues().data.data()),
			width,
			height,
			GDT_Float32,
			0,
			0
		);
		if (err) {
			throw error::EncodingError(error::withGDALMessage("unable to write " + grid.getName() + " to '" + filename + "'."));
		}

		//closing flushes the remaining strips
		CPLErrorReset();
		p_dataset.reset();
		if (CPLGetLastErrorType() == CE_Failure || CPLGetLastErrorType() == CE_Fatal) {
			throw error::EncodingError(error::withGDALMessage("unable to finalize '" + filename + "'."));
		}
	}
	catch (const error::EncodingError&) {
		helper::discardDataset("GTiff", filename);
		throw;
	}

	CPLDebug("FIELDMAP", "wrote %s to %s", grid.getName().c_str(), filename.c_str());
}

} //namespace indices
} //namespace fieldmap
