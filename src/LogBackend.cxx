// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <iterator>
#include <cassert>
#include <ctime>

#include <stdio.h>

/* worker threads log concurrently with the thread that configures
   the backend */
static std::atomic<LogLevel> log_threshold{LogLevel::NOTICE};

static std::atomic_bool enable_timestamp{false};

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold.store(_threshold, std::memory_order_relaxed);
}

void
EnableLogTimestamp() noexcept
{
	assert(!enable_timestamp);

	enable_timestamp = true;
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	if (enable_timestamp) {
		const std::time_t t = std::time(nullptr);
		struct tm tm;
		if (localtime_r(&t, &tm) != nullptr) {
			fmt::print(stderr, "{:%FT%T} {}: {}\n",
				   tm, domain.GetName(),
				   StripRight(message));
			return;
		}
	}

	fmt::print(stderr, "{}: {}\n",
		   domain.GetName(), StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold.load(std::memory_order_relaxed))
		return;

	FileLog(domain, msg);
}

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (level < log_threshold.load(std::memory_order_relaxed))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	FileLog(domain, {buffer.data(), buffer.size()});
}
