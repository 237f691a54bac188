// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <vector>

struct BlockParam {
	std::string name;
	std::string value;
	int line;

	/**
	 * This flag is false when nobody has queried the value of
	 * this option yet.
	 */
	mutable bool used = false;

	template<typename N, typename V>
	BlockParam(N &&_name, V &&_value, int _line=-1) noexcept
		:name(std::forward<N>(_name)), value(std::forward<V>(_value)),
		 line(_line) {}

	unsigned GetUnsignedValue() const;
	unsigned GetPositiveValue() const;

	bool GetBoolValue() const;

	/**
	 * Parse a byte size with an optional "k", "M" or "G" suffix.
	 */
	std::size_t GetSizeValue() const;

	/**
	 * Call this method in a "catch" block to throw a nested
	 * exception showing the location of this setting in the
	 * configuration file.
	 */
	[[noreturn]]
	void ThrowWithNested() const;

	/**
	 * Invoke a function with the configured value; if the
	 * function throws, call ThrowWithNested().
	 */
	template<std::regular_invocable<const char *> F>
	auto With(F &&f) const {
		try {
			return f(value.c_str());
		} catch (...) {
			ThrowWithNested();
		}
	}
};

/**
 * A flat list of "name value" settings, usually loaded from a
 * configuration file by ReadConfigFile().
 */
struct ConfigBlock {
	int line;

	std::vector<BlockParam> block_params;

	explicit ConfigBlock(int _line=-1)
		:line(_line) {}

	ConfigBlock(ConfigBlock &&) = default;
	ConfigBlock &operator=(ConfigBlock &&) = default;

	/**
	 * Determine if this is a "null" instance, i.e. an empty
	 * object that was synthesized and not loaded from a
	 * configuration file.
	 */
	bool IsNull() const noexcept {
		return line < 0;
	}

	[[gnu::pure]]
	bool IsEmpty() const noexcept {
		return block_params.empty();
	}

	template<typename N, typename V>
	void AddBlockParam(N &&_name, V &&_value, int _line=-1) noexcept {
		block_params.emplace_back(std::forward<N>(_name),
					  std::forward<V>(_value),
					  _line);
	}

	[[gnu::nonnull]] [[gnu::pure]]
	const BlockParam *GetBlockParam(const char *_name) const noexcept;

	[[gnu::pure]]
	const char *GetBlockValue(const char *name,
				  const char *default_value=nullptr) const noexcept;

	unsigned GetBlockValue(const char *name, unsigned default_value) const;

	unsigned GetPositiveValue(const char *name, unsigned default_value) const;

	bool GetBlockValue(const char *name, bool default_value) const;

	std::size_t GetSizeValue(const char *name,
				 std::size_t default_value) const;

	/**
	 * Log a warning for each setting which was never queried.
	 */
	void CheckUnused() const noexcept;
};
