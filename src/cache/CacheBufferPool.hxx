// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "CacheBuffer.hxx"
#include "FillSelection.hxx"

#include <memory>
#include <vector>

/**
 * A small, fixed number of #CacheBuffer instances.  The number of
 * buffers never changes after construction.
 *
 * This class is not thread-safe; the caller serializes all accesses.
 */
class CacheBufferPool {
	std::vector<CacheBuffer> buffers;

	const std::unique_ptr<FillSelection> selection;

public:
	/**
	 * Throws std::bad_alloc.
	 *
	 * @param count the number of buffers (must be positive)
	 * @param capacity the size of each buffer in bytes
	 */
	CacheBufferPool(std::size_t count, std::size_t capacity,
			FillSelectionType selection_type=FillSelectionType::REPLACE_LAST);

	CacheBufferPool(const CacheBufferPool &) = delete;
	CacheBufferPool &operator=(const CacheBufferPool &) = delete;

	std::size_t size() const noexcept {
		return buffers.size();
	}

	const CacheBuffer &operator[](std::size_t i) const noexcept {
		return buffers[i];
	}

	auto begin() const noexcept {
		return buffers.begin();
	}

	auto end() const noexcept {
		return buffers.end();
	}

	/**
	 * Find the first buffer (in construction order) whose range
	 * contains the given offset.
	 *
	 * @return the buffer or nullptr if no buffer covers the
	 * offset
	 */
	CacheBuffer *FindCovering(offset_type position) noexcept;

	/**
	 * Choose a buffer to be filled: the first empty one, or if
	 * all are populated, the one chosen by the #FillSelection.
	 */
	CacheBuffer &SelectForFill() noexcept;

	/**
	 * Zero-fill all buffers and mark them empty.
	 */
	void Wipe() noexcept;
};
