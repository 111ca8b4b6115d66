/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: preview and COG processing runs over one source raster
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <cctype>
#include <filesystem>

#include "calculate/mask/mask.h"
#include "pipeline/pipeline.h"

namespace fieldmap {
namespace pipeline {

namespace {

void
checkCancelled(const CancellationToken *p_token, const std::string& where) {
	if (p_token) {
		p_token->check(where);
	}
}

std::string
outputPath(const std::string& dir, const std::string& name) {
	return (std::filesystem::path(dir) / name).string();
}

std::string
lower(std::string s) {
	for (char& c : s) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

void
writeOutputs(
	PreviewResult& result,
	raster::GDALRasterWrapper& source,
	const config::PipelineOptions& options,
	int threads,
	const CancellationToken *p_token)
{
	if (options.writeIndexRasters) {
		//index rasters share the source pixel grid, so a decimated preview needs a full resolution pass
		indices::IndexSet full;
		if (options.preview.decimation == 1) {
			full = result.indices;
		}
		else {
			helper::BandSet fullBands = source.readBands(1, threads);
			checkCancelled(p_token, "band read");
			helper::ValidityMask fullMask = mask::buildMask(fullBands, source.getNoDataValue());
			full = indices::computeAll(fullBands, fullMask, threads);
		}

		for (const indices::IndexGrid *p_grid : {&full.ndvi, &full.ndwi, &full.evi}) {
			checkCancelled(p_token, "index raster output");
			std::string path = outputPath(options.outputDir, lower(p_grid->getName()) + ".tif");
			indices::writeIndexRaster(*p_grid, source, path);
			result.writtenFiles.push_back(path);
		}
	}

	if (options.writeOverlays) {
		for (const overlay::Overlay& layer : result.overlays) {
			checkCancelled(p_token, "overlay output");
			std::string path = outputPath(options.outputDir, lower(layer.name) + ".png");
			overlay::writePNG(layer.image, path);
			result.writtenFiles.push_back(path);
		}
	}
}

void
discardOutputs(const std::vector<std::string>& files) {
	for (const std::string& path : files) {
		bool png = std::filesystem::path(path).extension() == ".png";
		helper::discardDataset(png ? "PNG" : "GTiff", path);
	}
}

} //namespace

/******************************************************************************
				 runPreview()
******************************************************************************/
PreviewResult runPreview(
	std::string filename,
	const config::PipelineOptions& options,
	const CancellationToken *p_token)
{
	options.validate();

	raster::GDALRasterWrapper source(filename);
	source.requireBands(raster::REQUIRED_BANDS);

	PreviewResult retval;
	retval.bounds = source.boundsInGeographic();

	int threads = options.preview.threads;
	helper::BandSet bands = source.readBands(options.preview.decimation, threads);
	retval.width = bands.width();
	retval.height = bands.height();
	checkCancelled(p_token, "band read");

	helper::ValidityMask validity = mask::buildMask(bands, source.getNoDataValue());
	retval.invalidPixels = mask::countInvalid(validity);

	retval.indices = indices::computeAll(bands, validity, threads);
	checkCancelled(p_token, "index calculation");

	const indices::IndexGrid *grids[3] = {&retval.indices.ndvi, &retval.indices.ndwi, &retval.indices.evi};
	const config::OverlayStyle *styles[3] = {&options.ndvi, &options.ndwi, &options.evi};

	for (const indices::IndexGrid *p_grid : grids) {
		indices::IndexStats stats = indices::computeStats(*p_grid);
		CPLDebug("FIELDMAP", "%s range: %.3f to %.3f (%zu valid pixels)",
			p_grid->getName().c_str(),
			stats.min,
			stats.max,
			stats.valid);
		retval.stats.push_back(stats);
	}

	//render the three index overlays in parallel, then the composite
	std::vector<overlay::RGBAImage> images(3);
	std::vector<std::function<void()>> tasks;
	for (int i = 0; i < 3; i++) {
		tasks.push_back([&images, &grids, &styles, i] {
			images[i] = overlay::render(*grids[i], *styles[i]);
		});
	}
	helper::runParallel(threads, tasks);

	for (int i = 0; i < 3; i++) {
		retval.overlays.push_back(overlay::Overlay{
			grids[i]->getName(),
			std::move(images[i]),
			retval.bounds,
			styles[i]->opacity
		});
	}
	retval.overlays.push_back(overlay::Overlay{
		"RGB",
		overlay::renderComposite(bands, validity, options.compositeOpacity),
		retval.bounds,
		options.compositeOpacity
	});

	if (options.writeIndexRasters || options.writeOverlays) {
		std::filesystem::create_directories(options.outputDir);
	}

	try {
		writeOutputs(retval, source, options, threads, p_token);
	}
	catch (...) {
		//a run that does not finish leaves none of its outputs behind
		discardOutputs(retval.writtenFiles);
		retval.writtenFiles.clear();
		throw;
	}

	return retval;
}

/******************************************************************************
				defaultCOGPath()
******************************************************************************/
std::string defaultCOGPath(const std::string& filename) {
	std::filesystem::path path(filename);
	std::filesystem::path out = path.parent_path() / (path.stem().string() + "_cog" + path.extension().string());
	return out.string();
}

/******************************************************************************
				    runCOG()
******************************************************************************/
cog::COGInfo runCOG(
	std::string filename,
	std::string outFilename,
	const config::COGProfile& profile,
	const CancellationToken *p_token)
{
	raster::GDALRasterWrapper source(filename);
	std::string destination = outFilename.empty() ? defaultCOGPath(filename) : outFilename;
	return cog::encode(source, destination, profile, p_token);
}

} //namespace pipeline
} //namespace fieldmap
