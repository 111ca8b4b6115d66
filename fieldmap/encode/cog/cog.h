/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: Cloud Optimized GeoTIFF encoding with an overview pyramid
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup cog cog
 * @ingroup encode
 */

#pragma once

#include <string>
#include <vector>

#include <gdal_priv.h>

#include "utils/cancel.h"
#include "utils/config.h"
#include "utils/raster.h"

namespace fieldmap {
namespace cog {

/**
 * @ingroup cog
 * The stages of an encoding run. Each step of COGEncoder moves the
 * run forward by one state; any failure moves it to Error.
 */
enum class State {
	Opened,
	ProfileComputed,
	BandsCopied,
	OverviewsBuilt,
	Closed,
	Error
};

/**
 * @ingroup cog
 * Name of a state, for messages.
 */
std::string stateName(State state);

/**
 * @ingroup cog
 * Computes the overview factors for a raster: starting at 2, every
 * factor for which max(width, height) / factor is still larger than
 * the tile size is kept, doubling each time.
 *
 * e.g. width=5000, height=3000, tileSize=512 gives {2, 4, 8}, because
 * 5000 / 16 = 312.5 is not larger than 512.
 *
 * @param int width
 * @param int height
 * @param int tileSize
 * @returns std::vector<int> strictly increasing powers of two
 */
std::vector<int> computeOverviewFactors(int width, int height, int tileSize);

/**
 * @ingroup cog
 * What a written COG looks like when read back.
 */
struct COGInfo {
	int width = 0;
	int height = 0;
	int bandCount = 0;
	int tileWidth = 0;
	int tileHeight = 0;
	std::string dataType;
	std::string compression;
	std::string resampling;
	std::vector<int> overviewFactors;
};

/**
 * @ingroup cog
 * Opens a GeoTIFF and reports its layout. Overview factors are the full
 * resolution width divided by each overview's width, rounded.
 *
 * @param std::string filename
 * @returns COGInfo
 * @throws error::InputError if the file can not be opened
 */
COGInfo inspect(std::string filename);

/**
 * @ingroup cog
 * Copies a source raster into a tiled, compressed GeoTIFF with an internal
 * overview pyramid, laid out as a Cloud Optimized GeoTIFF.
 *
 * The run proceeds through the states:
 *
 * Opened -> ProfileComputed -> BandsCopied -> OverviewsBuilt -> Closed
 *
 * computeProfile():
 * 	determine the overview factors, either the profile's explicit list
 * 	or computeOverviewFactors() of the source dimensions.
 *
 * copyBands():
 * 	create a temporary tiled GeoTIFF beside the destination and copy
 * 	every source band into it tile by tile, verbatim. Georeferencing,
 * 	metadata, nodata values, band descriptions and color interpretation
 * 	are carried over.
 *
 * buildOverviews():
 * 	build every overview level inside the temporary file by area
 * 	averaging. This reads back the full resolution data just written,
 * 	so it can only follow copyBands().
 *
 * close():
 * 	copy the temporary file to the destination with COPY_SRC_OVERVIEWS
 * 	so that the overviews are placed ahead of the full resolution data,
 * 	then remove the temporary file.
 *
 * A failure in any step moves the encoder to State::Error, removes the
 * temporary file and, once close() has started writing it, the
 * destination, and rethrows. A file already at the destination is left
 * alone by failures before close().
 * A cancellation request is checked before every tile write and during
 * overview building and the final copy; it is reported as CancelledError.
 *
 * One encoder writes one destination. No other writer may target the
 * same destination while the encoder runs.
 */
class COGEncoder {
	private:
	raster::GDALRasterWrapper *p_source;
	std::string filename;
	std::string tempFilename;
	config::COGProfile profile;
	const CancellationToken *p_token;

	State state = State::Opened;
	bool destinationWritten = false;
	std::vector<int> overviewFactors;
	GDALDatasetUniquePtr p_temp;

	void expect(State expected, const char *step);
	void fail();
	void checkCancelled(const std::string& where);
	std::map<std::string, std::string> creationOptions();

	public:
	/**
	 * @param raster::GDALRasterWrapper *p_source must outlive the encoder
	 * @param std::string filename destination
	 * @param config::COGProfile profile
	 * @param const CancellationToken *p_token may be null
	 */
	COGEncoder(
		raster::GDALRasterWrapper *p_source,
		std::string filename,
		config::COGProfile profile,
		const CancellationToken *p_token = nullptr
	);

	COGEncoder(const COGEncoder&) = delete;
	COGEncoder& operator=(const COGEncoder&) = delete;

	/**
	 * Removes the temporary file if the run did not reach Closed.
	 */
	~COGEncoder();

	State getState() const { return this->state; }
	const std::vector<int>& getOverviewFactors() const { return this->overviewFactors; }
	const std::string& getFilename() const { return this->filename; }

	void computeProfile();
	void copyBands();
	void buildOverviews();
	void close();

	/**
	 * Runs every step in order.
	 *
	 * @throws error::EncodingError, error::CancelledError
	 */
	void encode();
};

/**
 * @ingroup cog
 * Encodes a source raster as a COG and returns the read-back layout.
 *
 * @param raster::GDALRasterWrapper& source
 * @param std::string filename
 * @param const config::COGProfile& profile
 * @param const CancellationToken *p_token may be null
 * @returns COGInfo of the written file
 */
COGInfo encode(
	raster::GDALRasterWrapper& source,
	std::string filename,
	const config::COGProfile& profile,
	const CancellationToken *p_token = nullptr
);

} //namespace cog
} //namespace fieldmap
