/******************************************************************************
 *
 * Project: fieldmap
 * Purpose: cooperative cancellation for long running writes
 * Author: fieldmap developers
 * Date: October, 2026
 *
 ******************************************************************************/

#pragma once

#include <atomic>
#include <string>

#include <cpl_progress.h>

#include "utils/errors.h"

namespace fieldmap {

/**
 * @ingroup utils
 * A flag which may be raised from any thread to ask a running
 * pipeline to stop. The pipeline checks the flag between per-band
 * or per-tile write operations, and GDAL checks it through
 * progressCallback() during overview building and dataset copies.
 */
class CancellationToken {
	private:
	std::atomic<bool> cancelled{false};

	public:
	void cancel() {
		this->cancelled.store(true);
	}

	bool isCancelled() const {
		return this->cancelled.load();
	}

	/**
	 * Throws CancelledError if cancellation has been requested.
	 *
	 * @param std::string where the stage being interrupted
	 * @throws error::CancelledError
	 */
	void check(const std::string& where) const {
		if (this->isCancelled()) {
			throw error::CancelledError("cancelled during " + where + ".");
		}
	}

	/**
	 * GDALProgressFunc compatible callback. The progress argument
	 * must be a pointer to a CancellationToken (or null, in which case
	 * the operation always continues).
	 */
	static int CPL_STDCALL progressCallback(double, const char *, void *p_arg) {
		const CancellationToken *p_token = static_cast<const CancellationToken *>(p_arg);
		return (p_token && p_token->isCancelled()) ? FALSE : TRUE;
	}
};

} //namespace fieldmap
