// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringStrip.hxx"

#include <algorithm>

const char *
StripLeft(const char *p) noexcept
{
	while (*p != 0 && IsWhitespaceOrNull(*p))
		++p;

	return p;
}

std::string_view
StripLeft(const std::string_view s) noexcept
{
	auto i = std::find_if_not(s.begin(), s.end(),
				  [](auto ch){ return IsWhitespaceOrNull(ch); });

	return s.substr(std::distance(s.begin(), i));
}

std::string_view
StripRight(std::string_view s) noexcept
{
	auto i = std::find_if_not(s.rbegin(), s.rend(),
				  [](auto ch){ return IsWhitespaceOrNull(ch); });

	return s.substr(0, std::distance(i, s.rend()));
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
