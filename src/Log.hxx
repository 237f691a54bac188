// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#ifndef CRYPTSEEK_LOG_HXX
#define CRYPTSEEK_LOG_HXX

#include "LogLevel.hxx"

#include <fmt/core.h>

#include <string_view>

class Domain;

/**
 * Emit a message if #level passes the threshold configured with
 * SetLogThreshold().  May be called from any thread.
 */
void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept;

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Format and emit a message.  Include
 * "lib/fmt/ExceptionFormatter.hxx" to pass a std::exception_ptr
 * argument.
 */
template<typename S, typename... Args>
void
LogFmt(LogLevel level, const Domain &domain,
       const S &format_str, Args&&... args) noexcept
{
	return LogVFmt(level, domain, format_str,
		       fmt::make_format_args(args...));
}

template<typename S, typename... Args>
void
FmtDebug(const Domain &domain,
	 const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::DEBUG, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtWarning(const Domain &domain,
	   const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::WARNING, domain, format_str, args...);
}

template<typename S, typename... Args>
void
FmtError(const Domain &domain,
	 const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::ERROR, domain, format_str, args...);
}

static inline void
LogDebug(const Domain &domain, const char *msg) noexcept
{
	Log(LogLevel::DEBUG, domain, msg);
}

#endif
