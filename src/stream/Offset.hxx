// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include <cstdint>

/**
 * A type for absolute offsets in the plaintext of an encrypted file.
 */
typedef uint64_t offset_type;
