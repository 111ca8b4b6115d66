/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: Cloud Optimized GeoTIFF encoding with an overview pyramid
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

#include <cpl_string.h>

#include "encode/cog/cog.h"
#include "utils/helper.h"

namespace fieldmap {
namespace cog {

/******************************************************************************
				  stateName()
******************************************************************************/
std::string stateName(State state) {
	switch (state) {
		case State::Opened:
			return "Opened";
		case State::ProfileComputed:
			return "ProfileComputed";
		case State::BandsCopied:
			return "BandsCopied";
		case State::OverviewsBuilt:
			return "OverviewsBuilt";
		case State::Closed:
			return "Closed";
		case State::Error:
			return "Error";
	}
	return "Unknown";
}

/******************************************************************************
			    computeOverviewFactors()
******************************************************************************/
std::vector<int> computeOverviewFactors(int width, int height, int tileSize) {
	std::vector<int> retval;

	double maxDim = static_cast<double>(std::max(width, height));
	int factor = 2;
	while (maxDim / factor > static_cast<double>(tileSize)) {
		retval.push_back(factor);
		factor *= 2;
	}

	return retval;
}

namespace {

/**
 * GDAL sizes an overview as ceil(width / factor), so the factor is the
 * smallest power of two giving that width back. A plain width ratio
 * is wrong once the factor nears the width (100 / 64 -> 2 pixels, 50x).
 */
int
overviewFactor(int width, int overviewWidth) {
	for (long long factor = 2; factor / 2 < width; factor *= 2) {
		if ((width + factor - 1) / factor == overviewWidth) {
			return static_cast<int>(factor);
		}
	}
	return static_cast<int>(std::lround(static_cast<double>(width) / static_cast<double>(overviewWidth)));
}

/**
 * True if both paths exist and name the same file, however spelled.
 */
bool
sameFile(const std::string& a, const std::string& b) {
	std::error_code ec;
	bool same = std::filesystem::equivalent(a, b, ec);
	return !ec && same;
}

} //namespace

/******************************************************************************
				   inspect()
******************************************************************************/
COGInfo inspect(std::string filename) {
	GDALAllRegister();

	CPLErrorReset();
	GDALDatasetUniquePtr p_dataset(GDALDataset::FromHandle(GDALOpenEx(
		filename.c_str(),
		GDAL_OF_RASTER | GDAL_OF_READONLY,
		nullptr,
		nullptr,
		nullptr
	)));
	if (!p_dataset) {
		throw error::InputError(error::withGDALMessage("unable to open '" + filename + "' as a raster dataset."));
	}
	if (p_dataset->GetRasterCount() < 1) {
		throw error::InputError("'" + filename + "' does not contain any raster bands.");
	}

	COGInfo retval;
	retval.width = p_dataset->GetRasterXSize();
	retval.height = p_dataset->GetRasterYSize();
	retval.bandCount = p_dataset->GetRasterCount();

	GDALRasterBand *p_band = p_dataset->GetRasterBand(1);
	p_band->GetBlockSize(&retval.tileWidth, &retval.tileHeight);
	retval.dataType = GDALGetDataTypeName(p_band->GetRasterDataType());

	const char *p_compression = p_dataset->GetMetadataItem("COMPRESSION", "IMAGE_STRUCTURE");
	retval.compression = p_compression ? p_compression : "NONE";

	const char *p_resampling = p_dataset->GetMetadataItem("FIELDMAP_OVERVIEW_RESAMPLING");
	retval.resampling = p_resampling ? p_resampling : "";

	for (int i = 0; i < p_band->GetOverviewCount(); i++) {
		GDALRasterBand *p_overview = p_band->GetOverview(i);
		if (!p_overview || p_overview->GetXSize() == 0) {
			continue;
		}
		retval.overviewFactors.push_back(overviewFactor(retval.width, p_overview->GetXSize()));
	}

	return retval;
}

/******************************************************************************
				 COGEncoder()
******************************************************************************/
COGEncoder::COGEncoder(
	raster::GDALRasterWrapper *p_source,
	std::string filename,
	config::COGProfile profile,
	const CancellationToken *p_token
) :
	p_source(p_source),
	filename(filename),
	tempFilename(filename + ".part.tif"),
	profile(std::move(profile)),
	p_token(p_token)
{
	if (!p_source) {
		throw std::invalid_argument("COG encoder requires a source raster.");
	}
	if (this->filename == p_source->getFilename() || sameFile(this->filename, p_source->getFilename())) {
		throw error::EncodingError("COG destination '" + this->filename + "' is the source raster.");
	}
	GDALAllRegister();
}

/******************************************************************************
				 ~COGEncoder()
******************************************************************************/
COGEncoder::~COGEncoder() {
	if (this->state != State::Closed) {
		this->p_temp.reset();
		helper::discardDataset("GTiff", this->tempFilename);
	}
}

/******************************************************************************
				   expect()
******************************************************************************/
void COGEncoder::expect(State expected, const char *step) {
	if (this->state != expected) {
		throw std::logic_error(
			std::string(step) + " requires state " + stateName(expected) + 
			", encoder is in state " + stateName(this->state) + "."
		);
	}
}

/******************************************************************************
				    fail()
******************************************************************************/
void COGEncoder::fail() {
	this->state = State::Error;
	this->p_temp.reset();
	helper::discardDataset("GTiff", this->tempFilename);
	if (this->destinationWritten) {
		helper::discardDataset("GTiff", this->filename);
	}
}

/******************************************************************************
				checkCancelled()
******************************************************************************/
void COGEncoder::checkCancelled(const std::string& where) {
	if (this->p_token) {
		this->p_token->check(where);
	}
}

/******************************************************************************
			       creationOptions()
******************************************************************************/
std::map<std::string, std::string> COGEncoder::creationOptions() {
	std::map<std::string, std::string> retval = this->profile.getDriverOptions();
	retval["COMPRESS"] = config::compressionAsString(this->profile.getCompression());
	if (retval.find("BIGTIFF") == retval.end()) {
		retval["BIGTIFF"] = "IF_SAFER";
	}
	return retval;
}

/******************************************************************************
			       computeProfile()
******************************************************************************/
void COGEncoder::computeProfile() {
	this->expect(State::Opened, "computeProfile()");

	if (this->profile.hasExplicitOverviews()) {
		this->overviewFactors = this->profile.getOverviewFactors();
	}
	else {
		this->overviewFactors = computeOverviewFactors(
			this->p_source->getWidth(),
			this->p_source->getHeight(),
			this->profile.getTileSize()
		);
	}

	if (!config::isLossless(this->profile.getCompression())) {
		CPLError(CE_Warning, CPLE_AppDefined, "COG '%s' uses lossy %s compression, pixel values will not round trip exactly.",
			this->filename.c_str(),
			config::compressionAsString(this->profile.getCompression()).c_str());
	}

	std::string levels;
	for (int factor : this->overviewFactors) {
		levels += (levels.empty() ? "" : ", ") + std::to_string(factor);
	}
	CPLDebug("FIELDMAP", "COG %s: %d x %d, %d bands, %s, tile %d, overview levels [%s]",
		this->filename.c_str(),
		this->p_source->getWidth(),
		this->p_source->getHeight(),
		this->p_source->getBandCount(),
		this->p_source->getDataType().c_str(),
		this->profile.getTileSize(),
		levels.c_str());

	this->state = State::ProfileComputed;
}

/******************************************************************************
				  copyBands()
******************************************************************************/
void COGEncoder::copyBands() {
	this->expect(State::ProfileComputed, "copyBands()");

	try {
		GDALDataset *p_src = this->p_source->getDataset();
		int width = this->p_source->getWidth();
		int height = this->p_source->getHeight();
		int bandCount = this->p_source->getBandCount();
		int tileSize = this->profile.getTileSize();
		GDALDataType type = this->p_source->getRasterBandType(0);
		size_t typeSize = static_cast<size_t>(GDALGetDataTypeSizeBytes(type));

		this->p_temp = helper::createDataset(
			this->tempFilename,
			"GTiff",
			width,
			height,
			bandCount,
			type,
			this->p_source->isGeoreferenced() ? this->p_source->getGeotransform() : nullptr,
			this->p_source->getProjection(),
			tileSize,
			this->creationOptions()
		);

		char **papszMetadata = p_src->GetMetadata();
		if (papszMetadata && this->p_temp->SetMetadata(papszMetadata) != CE_None) {
			throw error::EncodingError(error::withGDALMessage("unable to copy metadata to '" + this->tempFilename + "'."));
		}

		std::vector<uint8_t> buffer(static_cast<size_t>(tileSize) * static_cast<size_t>(tileSize) * typeSize);
		int xTiles = (width + tileSize - 1) / tileSize;
		int yTiles = (height + tileSize - 1) / tileSize;

		for (int band = 1; band <= bandCount; band++) {
			GDALRasterBand *p_srcBand = p_src->GetRasterBand(band);
			GDALRasterBand *p_dstBand = this->p_temp->GetRasterBand(band);

			int hasNoData = FALSE;
			double nodata = p_srcBand->GetNoDataValue(&hasNoData);
			if (hasNoData && p_dstBand->SetNoDataValue(nodata) != CE_None) {
				throw error::EncodingError(error::withGDALMessage("unable to set nodata value of band " + std::to_string(band) + " on '" + this->tempFilename + "'."));
			}
			p_dstBand->SetDescription(p_srcBand->GetDescription());
			if (p_dstBand->SetColorInterpretation(p_srcBand->GetColorInterpretation()) != CE_None) {
				CPLDebug("FIELDMAP", "color interpretation of band %d not kept in %s", band, this->tempFilename.c_str());
			}

			for (int yTile = 0; yTile < yTiles; yTile++) {
				for (int xTile = 0; xTile < xTiles; xTile++) {
					int xOff = xTile * tileSize;
					int yOff = yTile * tileSize;
					int xValid = std::min(tileSize, width - xOff);
					int yValid = std::min(tileSize, height - yOff);

					this->checkCancelled("COG band copy");

					CPLErr err;
					{
						std::lock_guard<std::mutex> lock(this->p_source->getMutex());
						err = p_srcBand->RasterIO(GF_Read, xOff, yOff, xValid, yValid, buffer.data(), xValid, yValid, type, 0, 0, nullptr);
					}
					if (err) {
						throw error::EncodingError(error::withGDALMessage(
							"unable to read tile (" + std::to_string(xTile) + ", " + std::to_string(yTile) + 
							") of band " + std::to_string(band) + " from '" + this->p_source->getFilename() + "'."
						));
					}

					err = p_dstBand->RasterIO(GF_Write, xOff, yOff, xValid, yValid, buffer.data(), xValid, yValid, type, 0, 0, nullptr);
					if (err) {
						throw error::EncodingError(error::withGDALMessage(
							"unable to write tile (" + std::to_string(xTile) + ", " + std::to_string(yTile) + 
							") of band " + std::to_string(band) + " to '" + this->tempFilename + "'."
						));
					}
				}
			}
		}

		//overview construction reads the full resolution tiles back
		CPLErrorReset();
		this->p_temp->FlushCache();
		if (CPLGetLastErrorType() == CE_Failure) {
			throw error::EncodingError(error::withGDALMessage("unable to flush '" + this->tempFilename + "'."));
		}
	}
	catch (...) {
		this->fail();
		throw;
	}

	this->state = State::BandsCopied;
}

/******************************************************************************
				buildOverviews()
******************************************************************************/
void COGEncoder::buildOverviews() {
	this->expect(State::BandsCopied, "buildOverviews()");

	try {
		if (!this->overviewFactors.empty()) {
			this->checkCancelled("COG overview build");

			std::vector<int> factors = this->overviewFactors;
			CPLErrorReset();
			CPLErr err = GDALBuildOverviews(
				GDALDataset::ToHandle(this->p_temp.get()),
				config::COGProfile::resampling(),
				static_cast<int>(factors.size()),
				factors.data(),
				0,				//all bands
				nullptr,
				CancellationToken::progressCallback,
				const_cast<CancellationToken *>(this->p_token)
			);
			this->checkCancelled("COG overview build");
			if (err) {
				throw error::EncodingError(error::withGDALMessage("unable to build overviews for '" + this->filename + "'."));
			}

			//every level must exist before the file may claim them
			for (int band = 1; band <= this->p_temp->GetRasterCount(); band++) {
				int count = this->p_temp->GetRasterBand(band)->GetOverviewCount();
				if (count != static_cast<int>(factors.size())) {
					throw error::EncodingError(
						"band " + std::to_string(band) + " of '" + this->filename + "' has " + std::to_string(count) +
						" overview(s), expected " + std::to_string(factors.size()) + "."
					);
				}
			}
		}

		if (this->p_temp->SetMetadataItem("FIELDMAP_OVERVIEW_RESAMPLING", config::COGProfile::resampling()) != CE_None) {
			throw error::EncodingError(error::withGDALMessage("unable to tag overview resampling on '" + this->tempFilename + "'."));
		}
	}
	catch (...) {
		this->fail();
		throw;
	}

	this->state = State::OverviewsBuilt;
}

/******************************************************************************
				    close()
******************************************************************************/
void COGEncoder::close() {
	this->expect(State::OverviewsBuilt, "close()");

	try {
		GDALDriver *p_driver = GetGDALDriverManager()->GetDriverByName("GTiff");
		if (!p_driver) {
			throw error::EncodingError("GTiff driver not available.");
		}

		this->checkCancelled("COG finalization");

		std::map<std::string, std::string> options = this->creationOptions();
		std::string blockSize = std::to_string(this->profile.getTileSize());

		char **papszOptions = nullptr;
		papszOptions = CSLSetNameValue(papszOptions, "TILED", "YES");
		papszOptions = CSLSetNameValue(papszOptions, "BLOCKXSIZE", blockSize.c_str());
		papszOptions = CSLSetNameValue(papszOptions, "BLOCKYSIZE", blockSize.c_str());
		papszOptions = CSLSetNameValue(papszOptions, "COPY_SRC_OVERVIEWS", "YES");
		for (auto const& [key, val] : options) {
			papszOptions = CSLSetNameValue(papszOptions, key.c_str(), val.c_str());
		}

		this->destinationWritten = true;
		CPLErrorReset();
		GDALDatasetUniquePtr p_dataset(p_driver->CreateCopy(
			this->filename.c_str(),
			this->p_temp.get(),
			FALSE,
			papszOptions,
			CancellationToken::progressCallback,
			const_cast<CancellationToken *>(this->p_token)
		));
		CSLDestroy(papszOptions);

		this->checkCancelled("COG finalization");
		if (!p_dataset) {
			throw error::EncodingError(error::withGDALMessage("unable to write COG '" + this->filename + "'."));
		}

		CPLErrorReset();
		p_dataset.reset();
		if (CPLGetLastErrorType() == CE_Failure) {
			throw error::EncodingError(error::withGDALMessage("unable to finalize COG '" + this->filename + "'."));
		}

		this->p_temp.reset();
		helper::discardDataset("GTiff", this->tempFilename);
	}
	catch (...) {
		this->fail();
		throw;
	}

	this->state = State::Closed;

	long long inputSize = helper::fileSize(this->p_source->getFilename());
	long long outputSize = helper::fileSize(this->filename);
	if (inputSize > 0 && outputSize >= 0) {
		CPLDebug("FIELDMAP", "COG %s written: input %lld bytes, output %lld bytes, compression ratio %.1f%%",
			this->filename.c_str(),
			inputSize,
			outputSize,
			(1.0 - static_cast<double>(outputSize) / static_cast<double>(inputSize)) * 100.0);
	}
}

/******************************************************************************
				   encode()
******************************************************************************/
void COGEncoder::encode() {
	this->computeProfile();
	this->copyBands();
	this->buildOverviews();
	this->close();
}

COGInfo encode(
	raster::GDALRasterWrapper& source,
	std::string filename,
	const config::COGProfile& profile,
	const CancellationToken *p_token)
{
	COGEncoder encoder(&source, filename, profile, p_token);
	encoder.encode();
	return inspect(filename);
}

} //namespace cog
} //namespace fieldmap
