// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "PrintException.hxx"

#include <fmt/core.h>

#include <cstdio>

void
PrintException(const std::exception &e) noexcept
{
	fmt::print(stderr, "{}\n", e.what());
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		PrintException(nested);
	} catch (const char *s) {
		fmt::print(stderr, "{}\n", s);
	} catch (...) {
		fmt::print(stderr, "Unrecognized nested exception\n");
	}
}

void
PrintException(const std::exception_ptr &ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		PrintException(e);
	} catch (const char *s) {
		fmt::print(stderr, "{}\n", s);
	} catch (...) {
		fmt::print(stderr, "Unrecognized exception\n");
	}
}
