/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: helper types and functions
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup helper helper functions
 * @ingroup utils
 */

#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>
#include <gdal_priv.h>
#include <cpl_string.h>

#include "utils/errors.h"

namespace fieldmap {
namespace helper {

/**
 * @ingroup helper
 * A rectangular grid of samples stored row major:
 * data[y * width + x].
 */
template <typename T>
struct Grid {
	int width = 0;
	int height = 0;
	std::vector<T> data;

	Grid() = default;

	Grid(int width, int height, T fill = T()) :
		width(width),
		height(height),
		data(static_cast<size_t>(width) * static_cast<size_t>(height), fill)
	{}

	size_t size() const {
		return this->data.size();
	}

	bool sameShape(int w, int h) const {
		return this->width == w && this->height == h;
	}

	template <typename U>
	bool sameShape(const Grid<U>& other) const {
		return this->sameShape(other.width, other.height);
	}

	T& at(int x, int y) {
		return this->data[static_cast<size_t>(y) * this->width + x];
	}

	const T& at(int x, int y) const {
		return this->data[static_cast<size_t>(y) * this->width + x];
	}
};

/**
 * @ingroup helper
 * A single spectral band. Samples are stored as 32 bit floats
 * regardless of the source pixel type so that index arithmetic
 * cannot overflow.
 */
typedef Grid<float> Band;

/**
 * @ingroup helper
 * Per pixel validity, same dimensions as the bands it was built from.
 * A value of 1 means the pixel is INVALID, 0 means it is valid.
 */
typedef Grid<uint8_t> ValidityMask;

/**
 * @ingroup helper
 * The four bands required by the index calculations. Band to channel
 * assignment is fixed by position in the source raster:
 * 1 = red, 2 = green, 3 = blue, 4 = near-infrared.
 */
struct BandSet {
	Band red;
	Band green;
	Band blue;
	Band nir;

	int width() const { return this->red.width; }
	int height() const { return this->red.height; }

	/**
	 * Throws std::invalid_argument if the four bands differ in size.
	 */
	void checkShape() const {
		if (!this->red.sameShape(this->green) || 
		    !this->red.sameShape(this->blue) ||
		    !this->red.sameShape(this->nir)) {
			throw std::invalid_argument("red, green, blue and nir bands must have identical dimensions.");
		}
	}
};

/**
 * @ingroup helper
 * Run every task on a boost::asio::thread_pool with the given number
 * of threads, and join. Tasks must not depend on one another's order.
 *
 * If any task throws, the first exception (in task order) is rethrown
 * on the calling thread after every task has finished.
 *
 * @param int threads
 * @param std::vector<std::function<void()>> tasks
 */
inline void
runParallel(int threads, std::vector<std::function<void()>>& tasks) {
	std::vector<std::exception_ptr> errors(tasks.size());

	{
		boost::asio::thread_pool pool(static_cast<size_t>(threads < 1 ? 1 : threads));
		for (size_t i = 0; i < tasks.size(); i++) {
			boost::asio::post(pool, [&tasks, &errors, i] {
				try {
					tasks[i]();
				}
				catch (...) {
					errors[i] = std::current_exception();
				}
			});
		}
		pool.join();
	}

	for (const std::exception_ptr& p_error : errors) {
		if (p_error) {
			std::rethrow_exception(p_error);
		}
	}
}

/**
 * @ingroup helper
 * This helper function creates a dataset using the given GDAL driver.
 * If tiles should be used, the TILED, BLOCKXSIZE and BLOCKYSIZE creation
 * options are added. User-given driver options are then added to the
 * creation option list.
 *
 * The geotransform and projection are set on the new dataset. An empty
 * projection is allowed, in which case none is written.
 *
 * @param std::string filename
 * @param std::string driverName
 * @param int width
 * @param int height
 * @param int bandCount
 * @param GDALDataType type
 * @param const double *geotransform may be null
 * @param std::string projection
 * @param int tileSize 0 for a striped layout
 * @param std::map<std::string, std::string>& driverOptions
 * @returns GDALDatasetUniquePtr
 * @throws error::EncodingError if the driver is missing or the dataset can not be created
 */
inline GDALDatasetUniquePtr
createDataset(
	std::string filename,
	std::string driverName,
	int width,
	int height,
	int bandCount,
	GDALDataType type,
	const double *geotransform,
	std::string projection,
	int tileSize,
	const std::map<std::string, std::string>& driverOptions)
{
	GDALDriver *p_driver = GetGDALDriverManager()->GetDriverByName(driverName.c_str());
	if (!p_driver) {
		throw error::EncodingError("unable to find " + driverName + " dataset driver.");
	}

	char **papszOptions = nullptr;
	if (tileSize > 0) {
		std::string blockSize = std::to_string(tileSize);
		papszOptions = CSLSetNameValue(papszOptions, "TILED", "YES");
		papszOptions = CSLSetNameValue(papszOptions, "BLOCKXSIZE", blockSize.c_str());
		papszOptions = CSLSetNameValue(papszOptions, "BLOCKYSIZE", blockSize.c_str());
	}

	for (auto const& [key, val] : driverOptions) {
		papszOptions = CSLSetNameValue(papszOptions, key.c_str(), val.c_str());
	}

	GDALDatasetUniquePtr p_dataset(p_driver->Create(
		filename.c_str(),
		width,
		height,
		bandCount,
		type,
		papszOptions
	));
	CSLDestroy(papszOptions);

	if (!p_dataset) {
		throw error::EncodingError(error::withGDALMessage("unable to create dataset '" + filename + "' with driver " + driverName + "."));
	}

	if (geotransform) {
		double gt[6] = {
			geotransform[0], geotransform[1], geotransform[2],
			geotransform[3], geotransform[4], geotransform[5]
		};
		CPLErr err = p_dataset->SetGeoTransform(gt);
		if (err) {
			throw error::EncodingError(error::withGDALMessage("error setting geotransform on '" + filename + "'."));
		}
	}

	if (!projection.empty()) {
		CPLErr err = p_dataset->SetProjection(projection.c_str());
		if (err) {
			throw error::EncodingError(error::withGDALMessage("error setting projection on '" + filename + "'."));
		}
	}

	return p_dataset;
}

/**
 * @ingroup helper
 * Removes a dataset written by a GDAL driver, including any sidecar
 * files the driver created. Missing files are not an error. Used to
 * discard partially written outputs.
 *
 * @param std::string driverName
 * @param std::string filename
 */
inline void
discardDataset(const std::string& driverName, const std::string& filename) {
	VSIStatBufL stat;
	if (VSIStatL(filename.c_str(), &stat) != 0) {
		return;
	}

	GDALDriver *p_driver = GetGDALDriverManager()->GetDriverByName(driverName.c_str());
	CPLErrorReset();
	if (!p_driver || p_driver->Delete(filename.c_str()) != CE_None) {
		//fall back to removing the file itself if the driver can not identify it
		if (VSIUnlink(filename.c_str()) != 0) {
			CPLDebug("FIELDMAP", "unable to remove %s", filename.c_str());
		}
	}
}

/**
 * @ingroup helper
 * Returns the size of a file in bytes, or -1 if it does not exist.
 */
inline long long
fileSize(const std::string& filename) {
	VSIStatBufL stat;
	if (VSIStatL(filename.c_str(), &stat) != 0) {
		return -1;
	}
	return static_cast<long long>(stat.st_size);
}

} //namespace helper
} //namespace fieldmap
