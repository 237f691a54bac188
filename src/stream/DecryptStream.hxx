// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "Offset.hxx"

#include <cstddef>
#include <memory>
#include <span>

/**
 * A forward-reading stream which decrypts chunked, authenticated
 * ciphertext.  Each instance has its own read cursor; an instance is
 * used by only one thread at a time.
 */
class DecryptStream {
public:
	DecryptStream() = default;
	DecryptStream(const DecryptStream &) = delete;
	DecryptStream &operator=(const DecryptStream &) = delete;

	virtual ~DecryptStream() noexcept = default;

	/**
	 * Move the read cursor to the given absolute plaintext
	 * offset.
	 *
	 * Throws on error, e.g. if the offset is out of bounds.
	 */
	virtual void Seek(offset_type offset) = 0;

	/**
	 * Decrypt data at the current position and advance the
	 * cursor.  Returns fewer bytes than requested only at the end
	 * of the stream.
	 *
	 * Throws #IntegrityError if a chunk fails authentication;
	 * throws other exceptions on I/O errors.
	 *
	 * @return the number of bytes read, 0 on end of file
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;

	/**
	 * Release the underlying resources.  May be called more than
	 * once.
	 */
	virtual void Close() noexcept = 0;
};

typedef std::unique_ptr<DecryptStream> DecryptStreamPtr;
