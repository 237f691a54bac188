// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include <fmt/format.h>

#include <pthread.h>

static inline void
SetThreadName(const char *name) noexcept
{
#ifdef __linux__
	pthread_setname_np(pthread_self(), name);
#else
	(void)name;
#endif
}

/**
 * Format a thread name; Linux truncates it to 15 characters.
 */
template<typename S, typename... Args>
static inline void
FmtThreadName(const S &format_str, Args&&... args) noexcept
{
	char buffer[16];
	const auto result = fmt::format_to_n(buffer, sizeof(buffer) - 1,
					     fmt::runtime(format_str),
					     args...);
	*result.out = 0;
	SetThreadName(buffer);
}
