// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

enum class FillSelectionType : uint8_t {
	/**
	 * Always overwrite the last buffer.  Crude, but this keeps
	 * the first buffer (usually holding the container header and
	 * index) alive while the user seeks around.
	 */
	REPLACE_LAST,

	ROUND_ROBIN,

	LEAST_RECENTLY_USED,
};

/**
 * Parse a #FillSelectionType name ("replace_last", "round_robin",
 * "lru").
 *
 * Throws std::invalid_argument on error.
 */
FillSelectionType
ParseFillSelectionType(const char *s);

[[gnu::const]]
const char *
ToString(FillSelectionType type) noexcept;

/**
 * Decides which populated #CacheBuffer gets overwritten when the
 * pool has no empty buffer left.  Empty buffers are always preferred
 * by #CacheBufferPool; this policy is consulted only when all are
 * populated.
 */
class FillSelection {
public:
	virtual ~FillSelection() noexcept = default;

	/**
	 * @param n the number of buffers in the pool
	 * @return the index of the buffer to be overwritten
	 */
	virtual std::size_t SelectVictim(std::size_t n) noexcept = 0;

	/**
	 * The buffer with the given index was used for a read or has
	 * just been chosen for a fill.
	 */
	virtual void OnUse([[maybe_unused]] std::size_t i) noexcept {}
};

class ReplaceLastSelection final : public FillSelection {
public:
	std::size_t SelectVictim(std::size_t n) noexcept override {
		return n - 1;
	}
};

class RoundRobinSelection final : public FillSelection {
	std::size_t next = 0;

public:
	std::size_t SelectVictim(std::size_t n) noexcept override {
		return next++ % n;
	}
};

class LeastRecentlyUsedSelection final : public FillSelection {
	std::vector<uint_least64_t> last_use;
	uint_least64_t clock = 0;

public:
	explicit LeastRecentlyUsedSelection(std::size_t n)
		:last_use(n, 0) {}

	std::size_t SelectVictim(std::size_t n) noexcept override;
	void OnUse(std::size_t i) noexcept override;
};

/**
 * Throws std::bad_alloc.
 */
std::unique_ptr<FillSelection>
CreateFillSelection(FillSelectionType type, std::size_t n);
