/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: per pixel validity mask from the four index bands
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <algorithm>
#include <cmath>

#include "calculate/mask/mask.h"

namespace fieldmap {
namespace mask {

/******************************************************************************
				  buildMask()
******************************************************************************/
helper::ValidityMask buildMask(
	const helper::Band& red,
	const helper::Band& green,
	const helper::Band& blue,
	const helper::Band& nir,
	std::optional<double> nodata)
{
	if (!red.sameShape(green) || !red.sameShape(blue) || !red.sameShape(nir)) {
		throw std::invalid_argument("red, green, blue and nir bands must have identical dimensions.");
	}

	helper::ValidityMask retval(red.width, red.height, 0);

	//the sentinel is compared in the band's float representation
	bool hasNoData = nodata.has_value();
	bool nanSentinel = hasNoData && std::isnan(*nodata);
	float nan = hasNoData ? static_cast<float>(*nodata) : 0.0f;

	for (size_t i = 0; i < retval.size(); i++) {
		float r = red.data[i];
		float g = green.data[i];
		float b = blue.data[i];
		float n = nir.data[i];

		bool invalid = r == 0.0f && g == 0.0f && b == 0.0f && n == 0.0f;
		if (nanSentinel) {
			invalid = invalid || std::isnan(r) || std::isnan(g) || std::isnan(b) || std::isnan(n);
		}
		else if (hasNoData) {
			invalid = invalid || r == nan || g == nan || b == nan || n == nan;
		}

		retval.data[i] = invalid ? 1 : 0;
	}

	return retval;
}

helper::ValidityMask buildMask(const helper::BandSet& bands, std::optional<double> nodata) {
	return buildMask(bands.red, bands.green, bands.blue, bands.nir, nodata);
}

/******************************************************************************
				 countInvalid()
******************************************************************************/
size_t countInvalid(const helper::ValidityMask& mask) {
	return static_cast<size_t>(std::count(mask.data.begin(), mask.data.end(), static_cast<uint8_t>(1)));
}

} //namespace mask
} //namespace fieldmap
