/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: GDALDataset wrapper for raster operations
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <algorithm>
#include <cmath>
#include <memory>

#include <ogr_spatialref.h>

#include "utils/raster.h"

namespace fieldmap {
namespace raster {

namespace {

struct TransformDeleter {
	void operator()(OGRCoordinateTransformation *p_transform) const {
		OGRCoordinateTransformation::DestroyCT(p_transform);
	}
};

} //namespace

/******************************************************************************
			      GDALRasterWrapper()
******************************************************************************/
GDALRasterWrapper::GDALRasterWrapper(std::string filename) :
	filename(filename)
{
	//must register drivers before trying to open a dataset
	GDALAllRegister();

	VSIStatBufL stat;
	if (VSIStatL(filename.c_str(), &stat) != 0) {
		throw error::InputError("raster file '" + filename + "' does not exist.");
	}

	CPLErrorReset();
	GDALDataset *p_dataset = GDALDataset::FromHandle(GDALOpenEx(
		filename.c_str(),
		GDAL_OF_RASTER | GDAL_OF_READONLY,
		nullptr,
		nullptr,
		nullptr
	));
	if (!p_dataset) {
		throw error::InputError(error::withGDALMessage("unable to open '" + filename + "' as a raster dataset."));
	}
	this->p_dataset = GDALDatasetUniquePtr(p_dataset);

	if (this->p_dataset->GetRasterCount() < 1) {
		throw error::InputError("'" + filename + "' does not contain any raster bands.");
	}

	//geotransform, absent on non georeferenced images
	CPLErr cplerr = this->p_dataset->GetGeoTransform(this->geotransform);
	this->hasGeotransform = cplerr == CE_None;
	
	CPLDebug("FIELDMAP", "opened %s: %d bands, %d x %d, CRS '%s'",
		filename.c_str(),
		this->getBandCount(),
		this->getWidth(),
		this->getHeight(),
		this->getCRSName().c_str());
}

/******************************************************************************
				  getDataset()
******************************************************************************/
GDALDataset *GDALRasterWrapper::getDataset() {
	return this->p_dataset.get();
}

/******************************************************************************
				   getMutex()
******************************************************************************/
std::mutex& GDALRasterWrapper::getMutex() {
	return this->datasetMutex;
}

/******************************************************************************
				 getFilename()
******************************************************************************/
std::string GDALRasterWrapper::getFilename() {
	return this->filename;
}

/******************************************************************************
				  getDriver()
******************************************************************************/
std::string GDALRasterWrapper::getDriver() {
	std::string retval = this->p_dataset->GetDriverName();
	const char *p_longName = this->p_dataset->GetDriver()->GetMetadataItem(GDAL_DMD_LONGNAME);
	if (p_longName) {
		retval += "/" + std::string(p_longName);
	}
	return retval;
}

/******************************************************************************
				getProjection()
******************************************************************************/
std::string GDALRasterWrapper::getProjection() {
	const char *p_wkt = this->p_dataset->GetProjectionRef();
	return p_wkt ? std::string(p_wkt) : std::string();
}

/******************************************************************************
				  getCRSName()
******************************************************************************/
std::string GDALRasterWrapper::getCRSName() {
	const OGRSpatialReference *p_srs = this->p_dataset->GetSpatialRef();
	if (!p_srs || p_srs->IsEmpty()) {
		return "";
	}

	const char *p_name = p_srs->GetName();
	return p_name ? std::string(p_name) : std::string();
}

/******************************************************************************
				   getWidth()
******************************************************************************/
int GDALRasterWrapper::getWidth() {
	return this->p_dataset->GetRasterXSize();
}

/******************************************************************************
				  getHeight()
******************************************************************************/
int GDALRasterWrapper::getHeight() {
	return this->p_dataset->GetRasterYSize();
}

/******************************************************************************
				 getBandCount()
******************************************************************************/
int GDALRasterWrapper::getBandCount() {
	return this->p_dataset->GetRasterCount();
}

/******************************************************************************
				 requireBands()
******************************************************************************/
void GDALRasterWrapper::requireBands(int n) {
	if (this->getBandCount() < n) {
		throw error::BandCountError(this->filename, n, this->getBandCount());
	}
}

/******************************************************************************
				   getXMin()
******************************************************************************/
double GDALRasterWrapper::getXMin() {
	int width = this->getWidth();
	int height = this->getHeight();
	return std::min(
		this->geotransform[0],
		this->geotransform[0] + this->geotransform[1] * width + this->geotransform[2] * height
	);
}

/******************************************************************************
				   getXMax()
******************************************************************************/
double GDALRasterWrapper::getXMax() {
	int width = this->getWidth();
	int height = this->getHeight();
	return std::max(
		this->geotransform[0],
		this->geotransform[0] + this->geotransform[1] * width + this->geotransform[2] * height
	);
}

/******************************************************************************
				   getYMin()
******************************************************************************/
double GDALRasterWrapper::getYMin() {
	int width = this->getWidth();
	int height = this->getHeight();
	return std::min(
		this->geotransform[3],
		this->geotransform[3] + this->geotransform[4] * width + this->geotransform[5] * height
	);
}

/******************************************************************************
				   getYMax()
******************************************************************************/
double GDALRasterWrapper::getYMax() {
	int width = this->getWidth();
	int height = this->getHeight();
	return std::max(
		this->geotransform[3],
		this->geotransform[3] + this->geotransform[4] * width + this->geotransform[5] * height
	);
}

/******************************************************************************
				getPixelWidth()
******************************************************************************/
double GDALRasterWrapper::getPixelWidth() {
	return std::abs(this->geotransform[1]);
}

/******************************************************************************
				getPixelHeight()
******************************************************************************/
double GDALRasterWrapper::getPixelHeight() {
	return std::abs(this->geotransform[5]);
}

/******************************************************************************
				getGeotransform()
******************************************************************************/
double *GDALRasterWrapper::getGeotransform() {
	return this->geotransform;
}

/******************************************************************************
			     getGeotransformArray()
******************************************************************************/
std::vector<double> GDALRasterWrapper::getGeotransformArray() {
	return std::vector<double>(this->geotransform, this->geotransform + 6);
}

/******************************************************************************
				isGeoreferenced()
******************************************************************************/
bool GDALRasterWrapper::isGeoreferenced() {
	return this->hasGeotransform;
}

/******************************************************************************
			      getBandNoDataValue()
******************************************************************************/
std::optional<double> GDALRasterWrapper::getBandNoDataValue(int band) {
	GDALRasterBand *p_band = this->p_dataset->GetRasterBand(band + 1);
	if (!p_band) {
		throw error::InputError("band " + std::to_string(band + 1) + " does not exist in '" + this->filename + "'.");
	}

	int hasNoData = FALSE;
	double nodata = p_band->GetNoDataValue(&hasNoData);
	if (!hasNoData) {
		return std::nullopt;
	}
	return nodata;
}

/******************************************************************************
				getNoDataValue()
******************************************************************************/
std::optional<double> GDALRasterWrapper::getNoDataValue() {
	return this->getBandNoDataValue(0);
}

/******************************************************************************
			       getRasterBandType()
******************************************************************************/
GDALDataType GDALRasterWrapper::getRasterBandType(int band) {
	GDALRasterBand *p_band = this->p_dataset->GetRasterBand(band + 1);
	if (!p_band) {
		throw error::InputError("band " + std::to_string(band + 1) + " does not exist in '" + this->filename + "'.");
	}
	return p_band->GetRasterDataType();
}

/******************************************************************************
				 getDataType()
******************************************************************************/
std::string GDALRasterWrapper::getDataType() {
	return std::string(GDALGetDataTypeName(this->getRasterBandType(0)));
}

/******************************************************************************
				decimatedSize()
******************************************************************************/
std::pair<int, int> GDALRasterWrapper::decimatedSize(int decimation) {
	if (decimation < 1) {
		throw error::InputError("decimation factor must be at least 1, got " + std::to_string(decimation) + ".");
	}

	int width = this->getWidth() / decimation;
	int height = this->getHeight() / decimation;
	if (width == 0 || height == 0) {
		throw error::InputError(
			"decimation factor " + std::to_string(decimation) + 
			" is too large for a " + std::to_string(this->getWidth()) + 
			" x " + std::to_string(this->getHeight()) + " raster."
		);
	}
	return {width, height};
}

/******************************************************************************
				   readBand()
******************************************************************************/
helper::Band GDALRasterWrapper::readBand(int band, int decimation) {
	auto [width, height] = this->decimatedSize(decimation);

	GDALRasterBand *p_band = this->p_dataset->GetRasterBand(band + 1);
	if (!p_band) {
		throw error::InputError("band " + std::to_string(band + 1) + " does not exist in '" + this->filename + "'.");
	}

	helper::Band retval(width, height);

	//decimated reads are resampled by area average, not subsampled
	GDALRasterIOExtraArg extraArg;
	INIT_RASTERIO_EXTRA_ARG(extraArg);
	extraArg.eResampleAlg = decimation > 1 ? GRIORA_Average : GRIORA_NearestNeighbour;

	CPLErr err;
	{
		std::lock_guard<std::mutex> lock(this->datasetMutex);
		err = p_band->RasterIO(
			GF_Read,			//GDALRWFlag eRWFlag
			0,				//int nXOff
			0,				//int nYOff
			this->getWidth(),		//int nXSize
			this->getHeight(),		//int nYSize
			retval.data.data(),		//void *pData
			width,				//int nBufXSize
			height,				//int nBufYSize
			GDT_Float32,			//GDALDataType eBufType
			0,				//GSpacing nPixelSpace
			0,				//GSpacing nLineSpace
			&extraArg			//GDALRasterIOExtraArg *psExtraArg
		);
	}
	if (err) {
		throw error::InputError(error::withGDALMessage("error reading band " + std::to_string(band + 1) + " of '" + this->filename + "'."));
	}

	return retval;
}

/******************************************************************************
				  readBands()
******************************************************************************/
helper::BandSet GDALRasterWrapper::readBands(int decimation, int threads) {
	this->requireBands(REQUIRED_BANDS);

	helper::BandSet retval;
	helper::Band *bands[REQUIRED_BANDS] = {&retval.red, &retval.green, &retval.blue, &retval.nir};

	std::vector<std::function<void()>> tasks;
	for (int band = 0; band < REQUIRED_BANDS; band++) {
		helper::Band *p_out = bands[band];
		tasks.push_back([this, band, decimation, p_out] {
			*p_out = this->readBand(band, decimation);
		});
	}
	helper::runParallel(threads, tasks);

	CPLDebug("FIELDMAP", "read 4 bands of %s at %d x %d (decimation %d)",
		this->filename.c_str(),
		retval.width(),
		retval.height(),
		decimation);

	return retval;
}

/******************************************************************************
			      boundsInGeographic()
******************************************************************************/
GeoBounds GDALRasterWrapper::boundsInGeographic() {
	std::string wkt = this->getProjection();
	if (wkt.empty()) {
		throw error::ProjectionError("raster '" + this->filename + "' has no coordinate reference system.");
	}
	if (!this->hasGeotransform) {
		throw error::ProjectionError("raster '" + this->filename + "' has no geotransform.");
	}

	OGRSpatialReference sourceCRS;
	if (sourceCRS.importFromWkt(wkt.c_str()) != OGRERR_NONE) {
		throw error::ProjectionError("unable to parse the coordinate reference system of '" + this->filename + "'.");
	}

	OGRSpatialReference targetCRS;
	if (targetCRS.importFromEPSG(4326) != OGRERR_NONE) {
		throw error::ProjectionError("unable to create the WGS84 coordinate reference system.");
	}

	//force traditional axis order (lon, lat)
	sourceCRS.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	targetCRS.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

	CPLErrorReset();
	std::unique_ptr<OGRCoordinateTransformation, TransformDeleter> p_transform(
		OGRCreateCoordinateTransformation(&sourceCRS, &targetCRS)
	);
	if (!p_transform) {
		throw error::ProjectionError(error::withGDALMessage("unable to transform the coordinate reference system of '" + this->filename + "' to WGS84."));
	}

	GeoBounds retval;
	int ok = p_transform->TransformBounds(
		this->getXMin(),
		this->getYMin(),
		this->getXMax(),
		this->getYMax(),
		&retval.west,
		&retval.south,
		&retval.east,
		&retval.north,
		21
	);
	if (!ok) {
		throw error::ProjectionError(error::withGDALMessage("unable to transform the bounds of '" + this->filename + "' to WGS84."));
	}

	return retval;
}

/******************************************************************************
				    close()
******************************************************************************/
void GDALRasterWrapper::close() {
	std::lock_guard<std::mutex> lock(this->datasetMutex);
	this->p_dataset.reset();
}

} //namespace raster
} //namespace fieldmap
