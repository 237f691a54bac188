// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "stream/Offset.hxx"

#include <cassert>
#include <cstddef>
#include <memory>
#include <span>

/**
 * A fixed-capacity region of decrypted data, tagged with the range
 * of the plaintext it currently holds.  A #count of zero means the
 * buffer is empty and available.
 */
class CacheBuffer {
	std::unique_ptr<std::byte[]> storage;
	std::size_t capacity;

	offset_type start = 0;
	std::size_t count = 0;

public:
	/**
	 * Throws std::bad_alloc.
	 */
	explicit CacheBuffer(std::size_t _capacity);

	CacheBuffer(CacheBuffer &&) noexcept = default;
	CacheBuffer &operator=(CacheBuffer &&) noexcept = default;

	std::size_t GetCapacity() const noexcept {
		return capacity;
	}

	offset_type GetStart() const noexcept {
		return start;
	}

	std::size_t GetCount() const noexcept {
		return count;
	}

	bool IsEmpty() const noexcept {
		return count == 0;
	}

	/**
	 * Does this buffer hold the byte at the given offset?
	 */
	[[gnu::pure]]
	bool Contains(offset_type position) const noexcept {
		return position >= start && position - start < count;
	}

	/**
	 * Returns the cached data from the given offset to the end of
	 * this buffer's range.  The offset must be inside the range.
	 */
	std::span<const std::byte> Read(offset_type position) const noexcept {
		assert(Contains(position));

		const std::size_t skip = position - start;
		return {storage.get() + skip, count - skip};
	}

	/**
	 * Returns the whole storage for filling it.
	 */
	std::span<std::byte> Write() noexcept {
		return {storage.get(), capacity};
	}

	/**
	 * Returns the whole storage, including bytes outside the
	 * committed range.
	 */
	std::span<const std::byte> GetStorage() const noexcept {
		return {storage.get(), capacity};
	}

	/**
	 * Declare that the storage now holds the given range.
	 */
	void Commit(offset_type _start, std::size_t _count) noexcept {
		assert(_count <= capacity);

		start = _start;
		count = _count;
	}

	void Invalidate() noexcept {
		count = 0;
	}

	/**
	 * Overwrite the storage with zeroes and mark the buffer
	 * empty, so no decrypted plaintext stays in memory.
	 */
	void Wipe() noexcept;
};
