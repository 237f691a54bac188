// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cerrno> // IWYU pragma: export
#include <system_error> // IWYU pragma: export

/**
 * Returns the error_category to be used to wrap errno values.  On
 * POSIX, system_category() is what the C++ standard library
 * implementations use.
 */
[[gnu::const]]
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::system_category();
}

static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, ErrnoCategory()),
				 msg);
}

static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}
