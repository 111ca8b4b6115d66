/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: exception types raised by the raster pipeline
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

/**
 * @defgroup errors errors
 * @ingroup utils
 */

#pragma once

#include <stdexcept>
#include <string>

#include <cpl_error.h>

namespace fieldmap {
namespace error {

/**
 * @ingroup errors
 * The source file is missing, unreadable, or not a raster GDAL can open.
 * Raised at open time, before any output exists.
 */
class InputError : public std::runtime_error {
	public:
	explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @ingroup errors
 * The source raster has fewer bands than the index path requires.
 */
class BandCountError : public std::runtime_error {
	private:
	int expected;
	int actual;

	public:
	BandCountError(const std::string& path, int expected, int actual) :
		std::runtime_error(
			"raster '" + path + "' has " + std::to_string(actual) + 
			" band(s), expected at least " + std::to_string(expected) + "."
		),
		expected(expected),
		actual(actual)
	{}

	int getExpected() const { return this->expected; }
	int getActual() const { return this->actual; }
};

/**
 * @ingroup errors
 * The coordinate reference of the source is undefined, or cannot be
 * transformed to geographic coordinates.
 */
class ProjectionError : public std::runtime_error {
	public:
	explicit ProjectionError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @ingroup errors
 * Writing a tile, building an overview level, or finalizing an output
 * raster failed. The output must not be left behind.
 */
class EncodingError : public std::runtime_error {
	public:
	explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @ingroup errors
 * A cancellation request was observed between write operations.
 */
class CancelledError : public EncodingError {
	public:
	explicit CancelledError(const std::string& msg) : EncodingError(msg) {}
};

/**
 * @ingroup errors
 * A configuration value violates its invariant (e.g. a tile size which
 * is not a power of two). Raised when the configuration is constructed.
 */
class ConfigError : public std::invalid_argument {
	public:
	explicit ConfigError(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * @ingroup errors
 * Helper which appends the last GDAL error message (if there is one)
 * to a message, so that the caller sees why GDAL refused.
 *
 * @param std::string msg
 * @returns std::string msg with GDAL detail
 */
inline std::string
withGDALMessage(const std::string& msg) {
	const char *p_last = CPLGetLastErrorMsg();
	if (p_last && p_last[0] != '\0') {
		return msg + " (" + std::string(p_last) + ")";
	}
	return msg;
}

} //namespace error
} //namespace fieldmap
