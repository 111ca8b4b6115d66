/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: value to color ramps used for index overlays
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#include <algorithm>
#include <cmath>

#include "render/ramp/ramp.h"
#include "utils/errors.h"

namespace fieldmap {
namespace ramp {

namespace {

int
hexDigit(char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

uint8_t
mix(uint8_t a, uint8_t b, double f) {
	double v = static_cast<double>(a) + (static_cast<double>(b) - static_cast<double>(a)) * f;
	return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
}

} //namespace

/******************************************************************************
				  parseHex()
******************************************************************************/
Color parseHex(const std::string& hex) {
	std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
	if (digits.size() != 6) {
		throw error::ConfigError("color '" + hex + "' is not of the form #rrggbb.");
	}

	uint8_t channels[3];
	for (int i = 0; i < 3; i++) {
		int hi = hexDigit(digits[2 * i]);
		int lo = hexDigit(digits[2 * i + 1]);
		if (hi < 0 || lo < 0) {
			throw error::ConfigError("color '" + hex + "' contains a non hex digit.");
		}
		channels[i] = static_cast<uint8_t>(hi * 16 + lo);
	}

	return Color{channels[0], channels[1], channels[2]};
}

/******************************************************************************
				 ColorRamp()
******************************************************************************/
ColorRamp::ColorRamp(std::string name, std::vector<Stop> stops) :
	name(std::move(name)),
	stops(std::move(stops))
{
	if (this->stops.size() < 2) {
		throw error::ConfigError("color ramp '" + this->name + "' needs at least two stops.");
	}

	for (size_t i = 0; i < this->stops.size(); i++) {
		double pos = this->stops[i].position;
		if (!(pos >= 0.0 && pos <= 1.0)) {
			throw error::ConfigError("color ramp '" + this->name + "' has a stop outside [0, 1].");
		}
		if (i > 0 && !(pos > this->stops[i - 1].position)) {
			throw error::ConfigError("color ramp '" + this->name + "' stops must be strictly increasing.");
		}
	}
}

/******************************************************************************
				  fromHex()
******************************************************************************/
ColorRamp ColorRamp::fromHex(std::string name, const std::vector<std::string>& hex) {
	if (hex.size() < 2) {
		throw error::ConfigError("color ramp '" + name + "' needs at least two colors.");
	}

	std::vector<Stop> stops;
	stops.reserve(hex.size());
	double step = 1.0 / static_cast<double>(hex.size() - 1);
	for (size_t i = 0; i < hex.size(); i++) {
		double pos = (i == hex.size() - 1) ? 1.0 : static_cast<double>(i) * step;
		stops.push_back(Stop{pos, parseHex(hex[i])});
	}

	return ColorRamp(std::move(name), std::move(stops));
}

/******************************************************************************
				   lookup()
******************************************************************************/
Color ColorRamp::lookup(double t) const {
	if (std::isnan(t) || t <= this->stops.front().position) {
		return this->stops.front().color;
	}
	if (t >= this->stops.back().position) {
		return this->stops.back().color;
	}

	//first stop strictly above t, the previous stop is at or below t
	auto upper = std::upper_bound(
		this->stops.begin(), 
		this->stops.end(), 
		t, 
		[](double v, const Stop& s) { return v < s.position; }
	);
	const Stop& hi = *upper;
	const Stop& lo = *(upper - 1);

	double f = (t - lo.position) / (hi.position - lo.position);
	return Color{
		mix(lo.color.r, hi.color.r, f),
		mix(lo.color.g, hi.color.g, f),
		mix(lo.color.b, hi.color.b, f)
	};
}

Color ColorRamp::lookup(double v, double vmin, double vmax) const {
	return this->lookup((v - vmin) / (vmax - vmin));
}

/******************************************************************************
			       built-in ramps
******************************************************************************/
ColorRamp RdYlGn() {
	return ColorRamp::fromHex("RdYlGn", {
		"#a50026", "#d73027", "#f46d43", "#fdae61", "#fee08b", "#ffffbf",
		"#d9ef8b", "#a6d96a", "#66bd63", "#1a9850", "#006837"
	});
}

ColorRamp BrBG() {
	return ColorRamp::fromHex("BrBG", {
		"#543005", "#8c510a", "#bf812d", "#dfc27d", "#f6e8c3", "#f5f5f5",
		"#c7eae5", "#80cdc1", "#35978f", "#01665e", "#003c30"
	});
}

ColorRamp YlGn() {
	return ColorRamp::fromHex("YlGn", {
		"#ffffe5", "#f7fcb9", "#d9f0a3", "#addd8e", "#78c679",
		"#41ab5d", "#238443", "#006837", "#004529"
	});
}

ColorRamp RedYellowGreen() {
	return ColorRamp::fromHex("red-yellow-green", {"#ff0000", "#ffff00", "#008000"});
}

/******************************************************************************
				   byName()
******************************************************************************/
ColorRamp byName(const std::string& name) {
	if (name == "RdYlGn") {
		return RdYlGn();
	}
	if (name == "BrBG") {
		return BrBG();
	}
	if (name == "YlGn") {
		return YlGn();
	}
	if (name == "red-yellow-green") {
		return RedYellowGreen();
	}
	throw error::ConfigError("unknown color ramp '" + name + "'.");
}

} //namespace ramp
} //namespace fieldmap
