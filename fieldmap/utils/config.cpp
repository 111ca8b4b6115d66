/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: validated configuration structures
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <algorithm>
#include <cctype>

#include "utils/config.h"
#include "utils/errors.h"

namespace fieldmap {
namespace config {

namespace {

//creation options owned by COGProfile, which may not be overridden
const char *RESERVED_OPTIONS[] = {
	"TILED",
	"BLOCKXSIZE",
	"BLOCKYSIZE",
	"COMPRESS",
	"COPY_SRC_OVERVIEWS"
};

std::string
upper(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
		return static_cast<char>(std::toupper(c));
	});
	return s;
}

void
checkOpacity(double opacity) {
	if (!(opacity >= 0.0 && opacity <= 1.0)) {
		throw error::ConfigError("opacity must be within [0, 1], got " + std::to_string(opacity) + ".");
	}
}

} //namespace

/******************************************************************************
			    compressionFromString()
******************************************************************************/
Compression compressionFromString(const std::string& name) {
	std::string key = upper(name);

	if (key == "NONE") {
		return Compression::None;
	}
	if (key == "DEFLATE") {
		return Compression::Deflate;
	}
	if (key == "LZW") {
		return Compression::LZW;
	}
	if (key == "ZSTD") {
		return Compression::ZSTD;
	}
	if (key == "JPEG") {
		return Compression::JPEG;
	}

	throw error::ConfigError("unknown compression codec '" + name + "'.");
}

/******************************************************************************
			     compressionAsString()
******************************************************************************/
std::string compressionAsString(Compression compression) {
	switch (compression) {
		case Compression::None:
			return "NONE";
		case Compression::Deflate:
			return "DEFLATE";
		case Compression::LZW:
			return "LZW";
		case Compression::ZSTD:
			return "ZSTD";
		case Compression::JPEG:
			return "JPEG";
	}
	throw error::ConfigError("unknown compression codec.");
}

/******************************************************************************
				 isLossless()
******************************************************************************/
bool isLossless(Compression compression) {
	return compression != Compression::JPEG;
}

/******************************************************************************
				isPowerOfTwo()
******************************************************************************/
bool isPowerOfTwo(int v) {
	return v > 0 && (v & (v - 1)) == 0;
}

/******************************************************************************
			       PreviewOptions()
******************************************************************************/
PreviewOptions::PreviewOptions(int decimation, int threads) :
	decimation(decimation),
	threads(threads)
{
	if (decimation < 1) {
		throw error::ConfigError("decimation factor must be at least 1, got " + std::to_string(decimation) + ".");
	}
	if (threads < 1) {
		throw error::ConfigError("thread count must be at least 1, got " + std::to_string(threads) + ".");
	}
}

/******************************************************************************
				 COGProfile()
******************************************************************************/
COGProfile::COGProfile(
	int tileSize,
	Compression compression,
	std::vector<int> overviewFactors,
	std::map<std::string, std::string> driverOptions
) :
	tileSize(tileSize),
	compression(compression),
	overviewFactors(std::move(overviewFactors))
{
	if (!isPowerOfTwo(tileSize)) {
		throw error::ConfigError("tile size must be a positive power of two, got " + std::to_string(tileSize) + ".");
	}
	if (tileSize < 16) {
		throw error::ConfigError("tile size must be at least 16, got " + std::to_string(tileSize) + ".");
	}

	int previous = 1;
	for (int factor : this->overviewFactors) {
		if (!isPowerOfTwo(factor) || factor < 2) {
			throw error::ConfigError("overview factor " + std::to_string(factor) + " is not a power of two >= 2.");
		}
		if (factor <= previous) {
			throw error::ConfigError("overview factors must be strictly increasing.");
		}
		previous = factor;
	}

	for (auto const& [key, val] : driverOptions) {
		std::string name = upper(key);
		for (const char *reserved : RESERVED_OPTIONS) {
			if (name == reserved) {
				throw error::ConfigError("driver option " + name + " is controlled by the COG profile.");
			}
		}
		this->driverOptions[name] = val;
	}
}

/******************************************************************************
				OverlayStyle()
******************************************************************************/
OverlayStyle::OverlayStyle(ramp::ColorRamp ramp, double vmin, double vmax, double opacity) :
	ramp(std::move(ramp)),
	vmin(vmin),
	vmax(vmax),
	opacity(opacity)
{
	if (!(vmin < vmax)) {
		throw error::ConfigError("overlay domain must satisfy vmin < vmax.");
	}
	checkOpacity(opacity);
}

/******************************************************************************
			       default styles
******************************************************************************/
OverlayStyle defaultNDVIStyle() {
	return OverlayStyle(ramp::RdYlGn(), -1.0, 1.0, 0.7);
}

OverlayStyle defaultNDWIStyle() {
	return OverlayStyle(ramp::BrBG(), -1.0, 1.0, 0.7);
}

OverlayStyle defaultEVIStyle() {
	return OverlayStyle(ramp::YlGn(), -1.0, 1.0, 0.7);
}

double defaultCompositeOpacity() {
	return 0.8;
}

/******************************************************************************
				  validate()
******************************************************************************/
void PipelineOptions::validate() const {
	if ((this->writeIndexRasters || this->writeOverlays) && this->outputDir.empty()) {
		throw error::ConfigError("an output directory is required to write index rasters or overlays.");
	}
	checkOpacity(this->compositeOpacity);
}

} //namespace config
} //namespace fieldmap
