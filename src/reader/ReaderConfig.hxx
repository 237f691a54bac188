// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "cache/FillSelection.hxx"

#include <cstddef>

struct ConfigBlock;

static constexpr std::size_t KILOBYTE = 1024;
static constexpr std::size_t MEGABYTE = 1024 * KILOBYTE;

struct ReaderConfig {
	static constexpr std::size_t DEFAULT_BUFFER_COUNT = 2;

	/**
	 * Large enough for the index of most MPEG videos.  Should be
	 * a multiple of the decrypting stream's chunk size.
	 */
	static constexpr std::size_t DEFAULT_BUFFER_SIZE = 2 * MEGABYTE;

	static constexpr unsigned DEFAULT_THREADS = 1;

	static constexpr unsigned MAX_THREADS = 64;

	/**
	 * Should be a multiple of the decrypting stream's chunk
	 * size, too.
	 */
	static constexpr std::size_t DEFAULT_STREAM_OFFSET = 256 * KILOBYTE;

	/**
	 * The number of cache buffers.  The first one usually ends up
	 * holding the beginning of the file (container header and
	 * index); the others follow the playback position.
	 */
	std::size_t buffer_count = DEFAULT_BUFFER_COUNT;

	std::size_t buffer_size = DEFAULT_BUFFER_SIZE;

	/**
	 * The number of fill worker threads.  Zero means the calling
	 * thread fills the buffer.
	 */
	unsigned threads = DEFAULT_THREADS;

	/**
	 * A fill starts this many bytes before the requested
	 * position, because after a seek, players often make a second
	 * request slightly before the first one.
	 */
	std::size_t stream_offset = DEFAULT_STREAM_OFFSET;

	FillSelectionType eviction = FillSelectionType::REPLACE_LAST;

	ReaderConfig() = default;

	/**
	 * Load the settings from a configuration block; missing
	 * settings keep their defaults.
	 *
	 * Throws on error.
	 */
	explicit ReaderConfig(const ConfigBlock &block);

	/**
	 * The number of #DecryptStream instances needed.
	 */
	constexpr std::size_t GetStreamCount() const noexcept {
		return threads > 0 ? threads : 1;
	}

	/**
	 * Verify the settings.
	 *
	 * Throws std::invalid_argument on error.
	 */
	void Check() const;
};
