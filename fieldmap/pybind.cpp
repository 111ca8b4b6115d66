/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: Create Python bindings from C++ code
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "calculate/indices/indices.h"
#include "calculate/mask/mask.h"
#include "encode/cog/cog.h"
#include "pipeline/pipeline.h"
#include "render/overlay/overlay.h"
#include "render/ramp/ramp.h"
#include "utils/cancel.h"
#include "utils/config.h"
#include "utils/raster.h"

namespace py = pybind11;
using namespace pybind11::literals;

using namespace fieldmap;

/**
 * Read only memoryview over an index grid, shape (height, width), float32.
 * The view does not own the data, the owning object must be kept alive
 * on the Python side for as long as the view is used.
 */
static py::memoryview
gridAsMemView(const indices::IndexGrid& grid) {
	py::ssize_t width = grid.getWidth();
	py::ssize_t height = grid.getHeight();
	py::ssize_t size = sizeof(float);

	//see https://pybind11.readthedocs.io/en/stable/advanced/pycpp/numpy.html#memory-view
	return py::memoryview::from_buffer(
		grid.getValues().data.data(),	//buffer
		{height, width},		//shape
		{size * width, size}		//stride
	);
}

/**
 * Read only memoryview over an RGBA image, shape (height, width, 4), uint8.
 */
static py::memoryview
imageAsMemView(const overlay::RGBAImage& image) {
	py::ssize_t width = image.width;
	py::ssize_t height = image.height;

	return py::memoryview::from_buffer(
		image.pixels.data(),		//buffer
		{height, width, py::ssize_t(4)},	//shape
		{width * 4, py::ssize_t(4), py::ssize_t(1)}	//stride
	);
}

PYBIND11_MODULE(_fieldmap, m) {
	// source code in fieldmap/utils/errors.h
	// translators are tried most recent first, so derived classes come last
	py::register_exception<error::InputError>(m, "InputError", PyExc_ValueError);
	py::register_exception<error::BandCountError>(m, "BandCountError", PyExc_ValueError);
	py::register_exception<error::ProjectionError>(m, "ProjectionError", PyExc_RuntimeError);
	auto encodingError = py::register_exception<error::EncodingError>(m, "EncodingError", PyExc_RuntimeError);
	py::register_exception<error::CancelledError>(m, "CancelledError", encodingError.ptr());
	py::register_exception<error::ConfigError>(m, "ConfigError", PyExc_ValueError);

	// source code in fieldmap/utils/cancel.h
	py::class_<CancellationToken>(m, "CancellationToken")
		.def(py::init<>())
		.def("cancel", &CancellationToken::cancel)
		.def("is_cancelled", &CancellationToken::isCancelled);

	// source code in fieldmap/utils/raster.h
	py::class_<raster::GeoBounds>(m, "GeoBounds")
		.def_readonly("south", &raster::GeoBounds::south)
		.def_readonly("west", &raster::GeoBounds::west)
		.def_readonly("north", &raster::GeoBounds::north)
		.def_readonly("east", &raster::GeoBounds::east);

	py::class_<raster::GDALRasterWrapper>(m, "GDALRasterWrapper")
		.def(py::init<std::string>())
		.def("get_driver", &raster::GDALRasterWrapper::getDriver)
		.def("get_crs", &raster::GDALRasterWrapper::getCRSName)
		.def("get_projection", &raster::GDALRasterWrapper::getProjection)
		.def("get_height", &raster::GDALRasterWrapper::getHeight)
		.def("get_width", &raster::GDALRasterWrapper::getWidth)
		.def("get_band_count", &raster::GDALRasterWrapper::getBandCount)
		.def("get_xmin", &raster::GDALRasterWrapper::getXMin)
		.def("get_xmax", &raster::GDALRasterWrapper::getXMax)
		.def("get_ymin", &raster::GDALRasterWrapper::getYMin)
		.def("get_ymax", &raster::GDALRasterWrapper::getYMax)
		.def("get_pixel_height", &raster::GDALRasterWrapper::getPixelHeight)
		.def("get_pixel_width", &raster::GDALRasterWrapper::getPixelWidth)
		.def("get_band_nodata_value", &raster::GDALRasterWrapper::getBandNoDataValue)
		.def("get_geotransform", &raster::GDALRasterWrapper::getGeotransformArray)
		.def("get_data_type", &raster::GDALRasterWrapper::getDataType)
		.def("get_geographic_bounds", &raster::GDALRasterWrapper::boundsInGeographic)
		.def("close", &raster::GDALRasterWrapper::close);

	// source code in fieldmap/render/ramp/ramp.h
	py::class_<ramp::ColorRamp>(m, "ColorRamp")
		.def_static("by_name", &ramp::byName)
		.def("get_name", &ramp::ColorRamp::getName)
		.def("lookup", [](const ramp::ColorRamp& r, double v, double vmin, double vmax) {
			ramp::Color c = r.lookup(v, vmin, vmax);
			return py::make_tuple(c.r, c.g, c.b);
		});

	// source code in fieldmap/utils/config.h
	py::class_<config::OverlayStyle>(m, "OverlayStyle")
		.def(py::init<ramp::ColorRamp, double, double, double>(),
			pybind11::arg("ramp"),
			pybind11::arg("vmin"),
			pybind11::arg("vmax"),
			pybind11::arg("opacity"))
		.def_readonly("vmin", &config::OverlayStyle::vmin)
		.def_readonly("vmax", &config::OverlayStyle::vmax)
		.def_readonly("opacity", &config::OverlayStyle::opacity);

	py::class_<config::PipelineOptions>(m, "PipelineOptions")
		.def(py::init([](int decimation, int threads, std::string outputDir, bool writeIndexRasters, bool writeOverlays) {
			config::PipelineOptions options;
			options.preview = config::PreviewOptions(decimation, threads);
			options.outputDir = outputDir;
			options.writeIndexRasters = writeIndexRasters;
			options.writeOverlays = writeOverlays;
			options.validate();
			return options;
		}),
			pybind11::arg("decimation") = 10,
			pybind11::arg("threads") = 4,
			pybind11::arg("output_dir") = "",
			pybind11::arg("write_index_rasters") = false,
			pybind11::arg("write_overlays") = false)
		.def_readwrite("ndvi", &config::PipelineOptions::ndvi)
		.def_readwrite("ndwi", &config::PipelineOptions::ndwi)
		.def_readwrite("evi", &config::PipelineOptions::evi)
		.def_readwrite("composite_opacity", &config::PipelineOptions::compositeOpacity);

	py::class_<config::COGProfile>(m, "COGProfile")
		.def(py::init([](int tileSize, std::string compression, std::vector<int> overviewFactors, std::map<std::string, std::string> driverOptions) {
			return config::COGProfile(tileSize, config::compressionFromString(compression), overviewFactors, driverOptions);
		}),
			pybind11::arg("tile_size") = 512,
			pybind11::arg("compression") = "DEFLATE",
			pybind11::arg("overview_factors") = std::vector<int>(),
			pybind11::arg("driver_options") = std::map<std::string, std::string>())
		.def("get_tile_size", &config::COGProfile::getTileSize)
		.def("get_overview_factors", &config::COGProfile::getOverviewFactors);

	// source code in fieldmap/calculate/indices/indices.h
	py::class_<indices::IndexGrid>(m, "IndexGrid")
		.def("get_name", &indices::IndexGrid::getName)
		.def("get_width", &indices::IndexGrid::getWidth)
		.def("get_height", &indices::IndexGrid::getHeight)
		.def("get_values_as_memoryview", &gridAsMemView, py::keep_alive<0, 1>());

	py::class_<indices::IndexStats>(m, "IndexStats")
		.def_readonly("min", &indices::IndexStats::min)
		.def_readonly("max", &indices::IndexStats::max)
		.def_readonly("mean", &indices::IndexStats::mean)
		.def_readonly("valid", &indices::IndexStats::valid)
		.def_readonly("invalid", &indices::IndexStats::invalid);

	// source code in fieldmap/render/overlay/overlay.h
	py::class_<overlay::Overlay>(m, "Overlay")
		.def_readonly("name", &overlay::Overlay::name)
		.def_readonly("bounds", &overlay::Overlay::bounds)
		.def_readonly("opacity", &overlay::Overlay::opacity)
		.def("get_width", [](const overlay::Overlay& o) { return o.image.width; })
		.def("get_height", [](const overlay::Overlay& o) { return o.image.height; })
		.def("get_pixels_as_memoryview", [](const overlay::Overlay& o) {
			return imageAsMemView(o.image);
		}, py::keep_alive<0, 1>());

	m.def("write_png", [](const overlay::Overlay& o, std::string filename) {
		overlay::writePNG(o.image, filename);
	});

	// source code in fieldmap/encode/cog/cog.h
	py::class_<cog::COGInfo>(m, "COGInfo")
		.def_readonly("width", &cog::COGInfo::width)
		.def_readonly("height", &cog::COGInfo::height)
		.def_readonly("band_count", &cog::COGInfo::bandCount)
		.def_readonly("tile_width", &cog::COGInfo::tileWidth)
		.def_readonly("tile_height", &cog::COGInfo::tileHeight)
		.def_readonly("data_type", &cog::COGInfo::dataType)
		.def_readonly("compression", &cog::COGInfo::compression)
		.def_readonly("resampling", &cog::COGInfo::resampling)
		.def_readonly("overview_factors", &cog::COGInfo::overviewFactors);

	m.def("inspect_cog", &cog::inspect);

	// source code in fieldmap/pipeline/pipeline.h
	py::class_<pipeline::PreviewResult>(m, "PreviewResult")
		.def_readonly("bounds", &pipeline::PreviewResult::bounds)
		.def_readonly("width", &pipeline::PreviewResult::width)
		.def_readonly("height", &pipeline::PreviewResult::height)
		.def_property_readonly("ndvi", [](const pipeline::PreviewResult& r) { return r.indices.ndvi; })
		.def_property_readonly("ndwi", [](const pipeline::PreviewResult& r) { return r.indices.ndwi; })
		.def_property_readonly("evi", [](const pipeline::PreviewResult& r) { return r.indices.evi; })
		.def_readonly("stats", &pipeline::PreviewResult::stats)
		.def_readonly("overlays", &pipeline::PreviewResult::overlays)
		.def_readonly("invalid_pixels", &pipeline::PreviewResult::invalidPixels)
		.def_readonly("written_files", &pipeline::PreviewResult::writtenFiles);

	m.def("preview_cpp", &pipeline::runPreview,
		pybind11::arg("filename"),
		pybind11::arg("options"),
		pybind11::arg("p_token").none(true) = nullptr,
		py::call_guard<py::gil_scoped_release>());

	m.def("cog_cpp", [](std::string filename, const config::COGProfile& profile, std::string outFilename, const CancellationToken *p_token) {
		return pipeline::runCOG(filename, outFilename, profile, p_token);
	},
		pybind11::arg("filename"),
		pybind11::arg("profile"),
		pybind11::arg("out_filename") = "",
		pybind11::arg("p_token").none(true) = nullptr,
		py::call_guard<py::gil_scoped_release>());

	m.def("default_cog_path", &pipeline::defaultCOGPath);
}
