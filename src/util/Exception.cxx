// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Exception.hxx"
#include "StringStrip.hxx"

#include <utility>

static void
AppendSingleLine(std::string &dest, std::string_view src) noexcept
{
	src = Strip(src);

	bool space = false;
	for (const char ch : src) {
		if (IsWhitespaceOrNull(ch)) {
			space = true;
			continue;
		}

		if (space) {
			space = false;
			dest.push_back(' ');
		}

		dest.push_back(ch);
	}
}

std::string
GetFullMessage(std::exception_ptr ep, const char *separator) noexcept
{
	std::string result;

	while (ep) {
		if (!result.empty())
			result += separator;

		std::exception_ptr next;

		try {
			std::rethrow_exception(std::move(ep));
		} catch (const std::exception &e) {
			AppendSingleLine(result, e.what());

			if (const auto *ne = dynamic_cast<const std::nested_exception *>(&e))
				next = ne->nested_ptr();
		} catch (const char *s) {
			AppendSingleLine(result, s);
		} catch (...) {
			result += "Unknown exception";
		}

		ep = std::move(next);
	}

	return result;
}
