// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "DecryptStream.hxx"

/**
 * An opened encrypted file which can hand out any number of
 * independent #DecryptStream instances.
 */
class DecryptSource {
public:
	virtual ~DecryptSource() noexcept = default;

	/**
	 * Returns the length of the decrypted content.
	 */
	[[gnu::pure]]
	virtual offset_type GetSize() const noexcept = 0;

	/**
	 * Open a new stream positioned at offset 0.
	 *
	 * Throws on error.
	 *
	 * @param read_ahead the number of bytes the stream shall
	 * buffer internally per read
	 */
	virtual DecryptStreamPtr OpenStream(std::size_t read_ahead) = 0;
};
