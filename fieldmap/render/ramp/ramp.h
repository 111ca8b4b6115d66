/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: value to color ramps used for index overlays
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup ramp ramp
 * @ingroup render
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fieldmap {
namespace ramp {

/**
 * @ingroup ramp
 * An 8 bit per channel RGB color.
 */
struct Color {
	uint8_t r = 0;
	uint8_t g = 0;
	uint8_t b = 0;
};

/**
 * @ingroup ramp
 * A color anchored at a position in [0, 1] along the ramp.
 */
struct Stop {
	double position;
	Color color;
};

/**
 * @ingroup ramp
 * An ordered piecewise linear mapping from [0, 1] to RGB. A ColorRamp
 * holds no state other than its stops, so a single ramp may be shared
 * by concurrently rendering threads.
 */
class ColorRamp {
	private:
	std::string name;
	std::vector<Stop> stops;

	public:
	/**
	 * Create a ramp from ordered stops.
	 *
	 * @param std::string name
	 * @param std::vector<Stop> stops at least two, strictly increasing positions in [0, 1]
	 * @throws error::ConfigError if the stops are invalid
	 */
	ColorRamp(std::string name, std::vector<Stop> stops);

	/**
	 * Create a ramp with evenly spaced stops from a list of hex
	 * colors ("#rrggbb").
	 *
	 * @param std::string name
	 * @param std::vector<std::string> hex
	 * @throws error::ConfigError if fewer than two colors are given or one is malformed
	 */
	static ColorRamp fromHex(std::string name, const std::vector<std::string>& hex);

	/**
	 * Look up the color at position t. Values outside [0, 1] are clamped
	 * to the end colors. Channels are linearly interpolated between the
	 * two surrounding stops and rounded to the nearest integer.
	 *
	 * @param double t
	 * @returns Color
	 */
	Color lookup(double t) const;

	/**
	 * Look up the color of value v on a domain [vmin, vmax].
	 */
	Color lookup(double v, double vmin, double vmax) const;

	const std::string& getName() const { return this->name; }
	const std::vector<Stop>& getStops() const { return this->stops; }
};

/**
 * @ingroup ramp
 * Parse "#rrggbb" (the leading # is optional).
 *
 * @throws error::ConfigError if malformed
 */
Color parseHex(const std::string& hex);

/**
 * @ingroup ramp
 * Diverging red -> yellow -> green (ColorBrewer RdYlGn, 11 classes).
 * Default for NDVI.
 */
ColorRamp RdYlGn();

/**
 * @ingroup ramp
 * Diverging brown -> white -> blue-green (ColorBrewer BrBG, 11 classes).
 * Default for NDWI.
 */
ColorRamp BrBG();

/**
 * @ingroup ramp
 * Sequential yellow -> green (ColorBrewer YlGn, 9 classes).
 * Default for EVI.
 */
ColorRamp YlGn();

/**
 * @ingroup ramp
 * Three stop red, yellow, green ramp used for the NDVI legend.
 */
ColorRamp RedYellowGreen();

/**
 * @ingroup ramp
 * Look up a built-in ramp by name ("RdYlGn", "BrBG", "YlGn", "red-yellow-green").
 *
 * @throws error::ConfigError if there is no such ramp
 */
ColorRamp byName(const std::string& name);

} //namespace ramp
} //namespace fieldmap
