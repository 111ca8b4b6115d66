/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: render index grids and band composites to RGBA overlays
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <algorithm>
#include <cmath>
#include <limits>

#include "calculate/mask/mask.h"
#include "render/overlay/overlay.h"

namespace fieldmap {
namespace overlay {

namespace {

uint8_t
stretch(float v, double p98) {
	double scaled = static_cast<double>(v) / p98 * 255.0;
	if (!(scaled > 0.0)) {
		return 0;
	}
	if (scaled >= 255.0) {
		return 255;
	}
	return static_cast<uint8_t>(scaled);
}

double
validPercentile(const helper::Band& band, const helper::ValidityMask& mask, double p) {
	std::vector<float> valid;
	valid.reserve(band.size());
	for (size_t i = 0; i < band.size(); i++) {
		if (!mask.data[i]) {
			valid.push_back(band.data[i]);
		}
	}

	if (valid.empty()) {
		return 1.0;
	}
	return percentile(valid, p);
}

} //namespace

/******************************************************************************
				opacityToAlpha()
******************************************************************************/
uint8_t opacityToAlpha(double opacity) {
	return static_cast<uint8_t>(std::lround(std::clamp(opacity, 0.0, 1.0) * 255.0));
}

/******************************************************************************
				   render()
******************************************************************************/
RGBAImage render(const indices::IndexGrid& grid, const config::OverlayStyle& style) {
	const helper::Grid<float>& values = grid.getValues();
	RGBAImage retval(values.width, values.height);

	uint8_t validAlpha = opacityToAlpha(style.opacity);
	double neutral = style.neutral();

	for (size_t i = 0; i < values.size(); i++) {
		float v = values.data[i];
		bool masked = std::isnan(v);

		ramp::Color color = style.ramp.lookup(masked ? neutral : static_cast<double>(v), style.vmin, style.vmax);
		uint8_t *p_px = &retval.pixels[4 * i];
		p_px[0] = color.r;
		p_px[1] = color.g;
		p_px[2] = color.b;
		p_px[3] = masked ? 0 : validAlpha;
	}

	return retval;
}

/******************************************************************************
				 percentile()
******************************************************************************/
double percentile(std::vector<float>& values, double p) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}

	double rank = std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
	size_t lo = static_cast<size_t>(std::floor(rank));
	size_t hi = std::min(lo + 1, values.size() - 1);
	double frac = rank - static_cast<double>(lo);

	std::nth_element(values.begin(), values.begin() + lo, values.end());
	double loVal = static_cast<double>(values[lo]);
	if (hi == lo || frac == 0.0) {
		return loVal;
	}

	//the smallest element above position lo is the next order statistic
	double hiVal = static_cast<double>(*std::min_element(values.begin() + hi, values.end()));
	return loVal + (hiVal - loVal) * frac;
}

/******************************************************************************
			       renderComposite()
******************************************************************************/
RGBAImage renderComposite(const helper::BandSet& bands, const helper::ValidityMask& mask, double opacity) {
	bands.checkShape();
	if (!mask.sameShape(bands.red)) {
		throw std::invalid_argument("validity mask dimensions do not match band dimensions.");
	}

	double redP98 = validPercentile(bands.red, mask, 98.0);
	double greenP98 = validPercentile(bands.green, mask, 98.0);
	double blueP98 = validPercentile(bands.blue, mask, 98.0);

	if (mask::countInvalid(mask) == mask.size()) {
		CPLError(CE_Warning, CPLE_AppDefined, "RGB composite has no valid pixels, the overlay is fully transparent.");
	}

	RGBAImage retval(bands.width(), bands.height());
	uint8_t validAlpha = opacityToAlpha(opacity);

	for (size_t i = 0; i < mask.size(); i++) {
		uint8_t *p_px = &retval.pixels[4 * i];
		if (mask.data[i]) {
			continue;
		}
		p_px[0] = stretch(bands.red.data[i], redP98);
		p_px[1] = stretch(bands.green.data[i], greenP98);
		p_px[2] = stretch(bands.blue.data[i], blueP98);
		p_px[3] = validAlpha;
	}

	return retval;
}

/******************************************************************************
				  writePNG()
******************************************************************************/
void writePNG(const RGBAImage& image, std::string filename) {
	GDALAllRegister();

	std::map<std::string, std::string> noOptions;
	GDALDatasetUniquePtr p_mem = helper::createDataset(
		"",
		"MEM",
		image.width,
		image.height,
		4,
		GDT_Byte,
		nullptr,
		"",
		0,
		noOptions
	);

	const GDALColorInterp interp[4] = {GCI_RedBand, GCI_GreenBand, GCI_BlueBand, GCI_AlphaBand};
	for (int band = 0; band < 4; band++) {
		GDALRasterBand *p_band = p_mem->GetRasterBand(band + 1);
		p_band->SetColorInterpretation(interp[band]);

		CPLErr err = p_band->RasterIO(
			GF_Write,
			0,
			0,
			image.width,
			image.height,
			const_cast<uint8_t *>(image.pixels.data() + band),
			image.width,
			image.height,
			GDT_Byte,
			4,					//pixel spacing: channels are interleaved
			static_cast<GSpacing>(image.width) * 4,
			nullptr
		);
		if (err) {
			throw error::EncodingError(error::withGDALMessage("unable to stage overlay image for '" + filename + "'."));
		}
	}

	GDALDriver *p_driver = GetGDALDriverManager()->GetDriverByName("PNG");
	if (!p_driver) {
		throw error::EncodingError("PNG driver not available.");
	}

	CPLErrorReset();
	GDALDatasetUniquePtr p_png(p_driver->CreateCopy(filename.c_str(), p_mem.get(), FALSE, nullptr, nullptr, nullptr));
	if (!p_png) {
		helper::discardDataset("PNG", filename);
		throw error::EncodingError(error::withGDALMessage("unable to write overlay image '" + filename + "'."));
	}
	p_png.reset();

	CPLDebug("FIELDMAP", "wrote %d x %d overlay to %s", image.width, image.height, filename.c_str());
}

} //namespace overlay
} //namespace fieldmap
