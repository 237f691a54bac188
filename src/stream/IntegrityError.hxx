// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "Offset.hxx"

#include <stdexcept>

/**
 * Thrown by #DecryptStream when the authentication code of a chunk
 * does not match, i.e. the file is corrupt or has been tampered
 * with.
 */
class IntegrityError final : public std::runtime_error {
	offset_type chunk_offset;

public:
	IntegrityError(offset_type _chunk_offset, const char *_msg)
		:std::runtime_error(_msg), chunk_offset(_chunk_offset) {}

	offset_type GetChunkOffset() const noexcept {
		return chunk_offset;
	}
};
