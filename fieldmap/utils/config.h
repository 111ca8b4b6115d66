/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: validated configuration structures
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup config config
 * @ingroup utils
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "render/ramp/ramp.h"

namespace fieldmap {
namespace config {

/**
 * @ingroup config
 * Compression codecs supported for the COG output.
 */
enum class Compression {
	None,
	Deflate,
	LZW,
	ZSTD,
	JPEG
};

/**
 * @ingroup config
 * Parse a codec name (case-insensitive). "NONE", "DEFLATE", "LZW", "ZSTD"
 * and "JPEG" are recognized.
 *
 * @param std::string name
 * @returns Compression
 * @throws error::ConfigError if the name is not recognized
 */
Compression compressionFromString(const std::string& name);

/**
 * @ingroup config
 * The name GDAL's GTiff driver uses for the codec in its COMPRESS option.
 */
std::string compressionAsString(Compression compression);

/**
 * @ingroup config
 * True if decoding the compressed data gives back the exact input.
 */
bool isLossless(Compression compression);

/**
 * @ingroup config
 * Returns true if v is a positive power of two.
 */
bool isPowerOfTwo(int v);

/**
 * @ingroup config
 * Options for the decimated preview read.
 *
 * decimation:
 * 	integer factor by which the band dimensions are divided
 * 	(output dimension = floor(dimension / decimation)).
 * threads:
 * 	number of worker threads used for band reads and
 * 	index computation.
 */
struct PreviewOptions {
	int decimation = 10;
	int threads = 4;

	PreviewOptions() = default;

	/**
	 * @param int decimation must be >= 1
	 * @param int threads must be >= 1
	 * @throws error::ConfigError
	 */
	PreviewOptions(int decimation, int threads);
};

/**
 * @ingroup config
 * Encoding configuration for the COG output.
 *
 * The tile size must be a positive power of two, and at least 16 (TIFF
 * tiles are multiples of 16). The overview factors, if given explicitly,
 * must be strictly increasing powers of two starting from at least 2.
 * If they are not given, the encoder computes them from the source
 * dimensions and the tile size. Overviews are always resampled with an
 * area weighted average.
 *
 * driverOptions are passed through to the GTiff driver as creation options
 * (for example PREDICTOR, ZLEVEL, NUM_THREADS). They may not set any
 * option the profile itself controls.
 */
class COGProfile {
	private:
	int tileSize = 512;
	Compression compression = Compression::Deflate;
	std::vector<int> overviewFactors;
	std::map<std::string, std::string> driverOptions;

	public:
	COGProfile() = default;

	/**
	 * @param int tileSize
	 * @param Compression compression
	 * @param std::vector<int> overviewFactors empty to compute them
	 * @param std::map<std::string, std::string> driverOptions
	 * @throws error::ConfigError if an invariant is violated
	 */
	COGProfile(
		int tileSize,
		Compression compression,
		std::vector<int> overviewFactors = {},
		std::map<std::string, std::string> driverOptions = {}
	);

	int getTileSize() const { return this->tileSize; }
	Compression getCompression() const { return this->compression; }
	const std::vector<int>& getOverviewFactors() const { return this->overviewFactors; }
	bool hasExplicitOverviews() const { return !this->overviewFactors.empty(); }
	const std::map<std::string, std::string>& getDriverOptions() const { return this->driverOptions; }

	/**
	 * The resampling algorithm name passed to GDAL when building overviews.
	 * Fixed to an area weighted average.
	 */
	static const char *resampling() { return "AVERAGE"; }
};

/**
 * @ingroup config
 * How a single overlay is colored and blended.
 *
 * vmin/vmax define the domain the ramp is stretched over; opacity
 * is the alpha applied to valid pixels, in [0, 1].
 */
struct OverlayStyle {
	ramp::ColorRamp ramp;
	double vmin = -1.0;
	double vmax = 1.0;
	double opacity = 0.7;

	/**
	 * @throws error::ConfigError if vmin >= vmax or opacity is outside [0, 1]
	 */
	OverlayStyle(ramp::ColorRamp ramp, double vmin, double vmax, double opacity);

	/**
	 * The value used for color lookup of not-a-number pixels. These
	 * pixels are transparent, so only the lookup needs a value.
	 */
	double neutral() const { return (this->vmin + this->vmax) / 2.0; }
};

/**
 * @ingroup config
 * The default styles of the four dashboard overlays.
 */
OverlayStyle defaultNDVIStyle();
OverlayStyle defaultNDWIStyle();
OverlayStyle defaultEVIStyle();
double defaultCompositeOpacity();

/**
 * @ingroup config
 * Everything a preview run needs.
 *
 * outputDir:
 * 	directory index rasters and overlay images are written into.
 * 	May be empty if neither writeIndexRasters nor writeOverlays is set.
 * writeIndexRasters:
 * 	write ndvi.tif, ndwi.tif and evi.tif.
 * writeOverlays:
 * 	write ndvi.png, ndwi.png, evi.png and rgb.png.
 */
struct PipelineOptions {
	PreviewOptions preview;
	OverlayStyle ndvi = defaultNDVIStyle();
	OverlayStyle ndwi = defaultNDWIStyle();
	OverlayStyle evi = defaultEVIStyle();
	double compositeOpacity = defaultCompositeOpacity();
	std::string outputDir;
	bool writeIndexRasters = false;
	bool writeOverlays = false;

	/**
	 * @throws error::ConfigError if outputs are requested without an
	 * output directory, or the composite opacity is outside [0, 1]
	 */
	void validate() const;
};

} //namespace config
} //namespace fieldmap
