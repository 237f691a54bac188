// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#ifndef CRYPTSEEK_LOG_LEVEL_HXX
#define CRYPTSEEK_LOG_LEVEL_HXX

enum class LogLevel {
	/**
	 * Debug message for developers, e.g. fill timings.
	 */
	DEBUG,

	/**
	 * Unimportant informational message.
	 */
	INFO,

	/**
	 * Interesting informational message.
	 */
	NOTICE,

	/**
	 * Warning: something may be wrong, e.g. a worker stream
	 * failed and its part of the cache buffer stays empty.
	 */
	WARNING,

	/**
	 * An error has occurred, an operation could not finish
	 * successfully.
	 */
	ERROR,
};

#endif
