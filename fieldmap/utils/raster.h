/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: GDALDataset wrapper for raster operations
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup raster raster
 * @ingroup utils
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <gdal_priv.h>

#include "utils/helper.h"

namespace fieldmap {
namespace raster {

/**
 * @ingroup raster
 * Number of bands the index path requires (red, green, blue, near-infrared).
 */
constexpr int REQUIRED_BANDS = 4;

/**
 * @ingroup raster
 * A bounding box in geographic coordinates (degrees, WGS84), in the
 * order an image overlay expects: south, west, north, east.
 */
struct GeoBounds {
	double south = 0;
	double west = 0;
	double north = 0;
	double east = 0;
};

/**
 * @ingroup raster
 * Wrapper class for a GDAL dataset containing a raster image.
 *
 * This class provides getter methods for important raster data and metadata,
 * as well as a way to read bands as 32 bit float grids, either at full
 * resolution or decimated for display.
 *
 * The dataset is owned by a smart pointer and closed when the wrapper
 * is destroyed. GDAL datasets are not safe to read from multiple threads
 * at once, so every RasterIO call on the dataset is made while holding
 * the wrapper's mutex. This allows readBands() to read the four bands
 * in parallel worker tasks; decoding and type conversion of each band
 * happen inside RasterIO, so the lock only orders the calls.
 */
class GDALRasterWrapper {
	private:
	GDALDatasetUniquePtr p_dataset;
	std::string filename;
	std::mutex datasetMutex;

	double geotransform[6] = {0, 1, 0, 0, 0, 1};
	bool hasGeotransform = false;

	public:
	/**
	 * Constructor for GDALRasterWrapper class.
	 * Registers the drivers and opens the file read-only.
	 *
	 * @param std::string filename
	 * @throws error::InputError if the file is missing, unreadable, or not a raster
	 */
	GDALRasterWrapper(std::string filename);

	GDALRasterWrapper(const GDALRasterWrapper&) = delete;
	GDALRasterWrapper& operator=(const GDALRasterWrapper&) = delete;

	/**
	 * Getter method for wrapped dataset.
	 *
	 * @returns GDALDataset *pointer to the underlying dataset
	 */
	GDALDataset *getDataset();

	/**
	 * Getter method for the mutex which guards the wrapped dataset.
	 */
	std::mutex& getMutex();

	/**
	 * @returns std::string the filename the raster was opened from
	 */
	std::string getFilename();

	/**
	 * Getter method for the raster driver.
	 *
	 * @returns std::string of short and long names of the raster driver
	 */
	std::string getDriver();

	/**
	 * Getter method for the projection as wkt. The string is empty
	 * if the raster has no coordinate reference.
	 *
	 * @returns std::string projection
	 */
	std::string getProjection();

	/**
	 * Get the CRS name, or an empty string if the raster has no
	 * coordinate reference.
	 *
	 * @returns std::string CRS name
	 */
	std::string getCRSName();

	/**
	 * Getter method for the raster width.
	 *
	 * @returns int raster width (x)
	 */
	int getWidth();

	/**
	 * Getter method for the raster height.
	 *
	 * @returns int raster height (y)
	 */
	int getHeight();

	/**
	 * Getter method for the number of raster bands.
	 *
	 * @returns int number of raster bands
	 */
	int getBandCount();

	/**
	 * Throws BandCountError if the raster has fewer than n bands.
	 *
	 * @param int n
	 * @throws error::BandCountError
	 */
	void requireBands(int n);

	/**
	 * Getter methods for the extent in georeferenced coordinate space.
	 * see https://gdal.org/en/stable/tutorials/geotransforms_tut.html
	 */
	double getXMin();
	double getXMax();
	double getYMin();
	double getYMax();

	/**
	 * Getter method for the pixel width. Scalar (absolute) value is given.
	 *
	 * @returns double pixel width
	 */
	double getPixelWidth();

	/**
	 * Getter method for the pixel height. Scalar (absolute) value is given.
	 *
	 * @returns double pixel height
	 */
	double getPixelHeight();

	/**
	 * Getter method for geotransform.
	 *
	 * @returns double *array of 6 doubles representing GDAL geotransform
	 */
	double *getGeotransform();

	/**
	 * Getter method for geotransform, as a vector (for the Python side).
	 */
	std::vector<double> getGeotransformArray();

	/**
	 * Whether the dataset declares a geotransform.
	 */
	bool isGeoreferenced();

	/**
	 * Getter method for a specific (0-indexed) bands nodata value.
	 *
	 * @param int band zero-indexed
	 * @returns std::optional<double> nodata value, empty if none is declared
	 */
	std::optional<double> getBandNoDataValue(int band);

	/**
	 * The nodata sentinel of the raster, taken from the first band.
	 */
	std::optional<double> getNoDataValue();

	/**
	 * Getter method for the pixel data type of a (0-indexed) band.
	 */
	GDALDataType getRasterBandType(int band);

	/**
	 * Getter method for the pixel data type name of the first band.
	 */
	std::string getDataType();

	/**
	 * The dimensions of a band read with the given decimation factor:
	 * floor(dimension / decimation).
	 *
	 * @param int decimation
	 * @returns std::pair<int, int> width, height
	 * @throws error::InputError if either dimension would be zero
	 */
	std::pair<int, int> decimatedSize(int decimation);

	/**
	 * Reads one (0-indexed) band into a float grid. If decimation is
	 * greater than 1 the band is resampled by area average to
	 * floor(width / decimation) x floor(height / decimation) so the
	 * preview does not alias.
	 *
	 * @param int band zero-indexed
	 * @param int decimation
	 * @returns helper::Band
	 * @throws error::InputError if the band does not exist or the read fails
	 */
	helper::Band readBand(int band, int decimation = 1);

	/**
	 * Reads bands 1 to 4 as red, green, blue and near-infrared. Each band
	 * is read by its own task on a thread pool of the given size.
	 *
	 * @param int decimation
	 * @param int threads
	 * @returns helper::BandSet
	 * @throws error::BandCountError if fewer than four bands are present
	 * @throws error::InputError if a read fails
	 */
	helper::BandSet readBands(int decimation, int threads);

	/**
	 * Reprojects the native extent to geographic coordinates (WGS84,
	 * longitude/latitude order) for overlay placement. The whole edge
	 * of the extent is densified so curved edges are contained.
	 *
	 * @returns GeoBounds
	 * @throws error::ProjectionError if the coordinate reference is undefined or can not be transformed
	 */
	GeoBounds boundsInGeographic();

	/**
	 * Closes the dataset. Further calls on the wrapper are invalid.
	 */
	void close();
};

} //namespace raster
} //namespace fieldmap
