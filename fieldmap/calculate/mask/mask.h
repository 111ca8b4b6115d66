/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: per pixel validity mask from the four index bands
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup mask mask
 * @ingroup calculate
 */

#pragma once

#include <optional>

#include "utils/helper.h"

namespace fieldmap {
namespace mask {

/**
 * @ingroup mask
 * Builds the validity mask shared by every index derived from the same
 * four bands. A pixel is flagged invalid (1) if:
 *
 * 	all four band values are exactly zero, OR
 * 	a nodata sentinel is declared and any of the four band values
 * 	equals it.
 *
 * An all zero pixel is treated as invalid even when no nodata sentinel
 * is declared. This matches how orthomosaics are usually padded, but it
 * also flags genuinely black pixels (deep shadow) as invalid.
 *
 * The mask always has the dimensions of the bands.
 *
 * @param const helper::Band& red
 * @param const helper::Band& green
 * @param const helper::Band& blue
 * @param const helper::Band& nir
 * @param std::optional<double> nodata
 * @returns helper::ValidityMask
 * @throws std::invalid_argument if the bands differ in size
 */
helper::ValidityMask buildMask(
	const helper::Band& red,
	const helper::Band& green,
	const helper::Band& blue,
	const helper::Band& nir,
	std::optional<double> nodata
);

/**
 * @ingroup mask
 * Convenience overload taking a BandSet.
 */
helper::ValidityMask buildMask(const helper::BandSet& bands, std::optional<double> nodata);

/**
 * @ingroup mask
 * The number of pixels flagged invalid.
 */
size_t countInvalid(const helper::ValidityMask& mask);

} //namespace mask
} //namespace fieldmap
