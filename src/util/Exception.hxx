// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <exception>
#include <string>

/**
 * Obtain the message of an exception followed by the messages of its
 * nested chain, outermost first, e.g. "Failed to open decrypting
 * stream 2 of 4: No such file".  Line breaks inside a message are
 * collapsed to a space.
 */
std::string
GetFullMessage(std::exception_ptr ep,
	       const char *separator=": ") noexcept;
