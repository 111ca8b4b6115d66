/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: preview and COG processing runs over one source raster
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup pipeline pipeline
 * @ingroup dev
 */

#pragma once

#include <string>
#include <vector>

#include "calculate/indices/indices.h"
#include "encode/cog/cog.h"
#include "render/overlay/overlay.h"
#include "utils/cancel.h"
#include "utils/config.h"
#include "utils/raster.h"

namespace fieldmap {
namespace pipeline {

/**
 * @ingroup pipeline
 * Everything a preview run produces.
 *
 * bounds:
 * 	geographic bounding box the overlays are placed in.
 * indices:
 * 	the NDVI, NDWI and EVI grids at preview resolution.
 * stats:
 * 	summary of each index, in NDVI, NDWI, EVI order.
 * overlays:
 * 	NDVI, NDWI, EVI and RGB composite overlays, in that order.
 * invalidPixels:
 * 	number of pixels flagged by the validity mask.
 * writtenFiles:
 * 	paths of the index rasters and overlay images written, if any.
 */
struct PreviewResult {
	raster::GeoBounds bounds;
	int width = 0;
	int height = 0;
	indices::IndexSet indices;
	std::vector<indices::IndexStats> stats;
	std::vector<overlay::Overlay> overlays;
	size_t invalidPixels = 0;
	std::vector<std::string> writtenFiles;
};

/**
 * @ingroup pipeline
 * Runs the visualization path:
 *
 * open -> check band count -> decimated parallel read of the four bands ->
 * validity mask -> NDVI, NDWI and EVI in parallel -> overlays ->
 * optional index rasters and overlay images.
 *
 * The geographic bounds are computed before any band is read, so a
 * raster without a usable coordinate reference fails early.
 *
 * Index rasters are written on the source pixel grid. If the preview is
 * decimated the indices are computed a second time at full resolution
 * for them; overlays always use the preview resolution.
 *
 * @param std::string filename
 * @param const config::PipelineOptions& options
 * @param const CancellationToken *p_token may be null
 * @returns PreviewResult
 * @throws error::InputError, error::BandCountError, error::ProjectionError,
 * error::EncodingError, error::ConfigError
 */
PreviewResult runPreview(
	std::string filename,
	const config::PipelineOptions& options,
	const CancellationToken *p_token = nullptr
);

/**
 * @ingroup pipeline
 * The default COG destination: the source path with "_cog" inserted
 * before the extension (e.g. field.tif -> field_cog.tif).
 */
std::string defaultCOGPath(const std::string& filename);

/**
 * @ingroup pipeline
 * Runs the storage path: encodes the source raster as a COG.
 *
 * @param std::string filename
 * @param std::string outFilename empty for defaultCOGPath(filename)
 * @param const config::COGProfile& profile
 * @param const CancellationToken *p_token may be null
 * @returns cog::COGInfo read back from the written file
 */
cog::COGInfo runCOG(
	std::string filename,
	std::string outFilename,
	const config::COGProfile& profile,
	const CancellationToken *p_token = nullptr
);

} //namespace pipeline
} //namespace fieldmap
