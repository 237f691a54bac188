// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "WorkerStreamSet.hxx"
#include "stream/DecryptSource.hxx"
#include "lib/fmt/RuntimeError.hxx"

WorkerStreamSet::WorkerStreamSet(DecryptSource &source, std::size_t n,
				 std::size_t read_ahead)
{
	streams.reserve(n);

	try {
		for (std::size_t i = 0; i < n; ++i)
			streams.emplace_back(source.OpenStream(read_ahead));
	} catch (...) {
		const auto i = streams.size();
		Close();
		std::throw_with_nested(FmtRuntimeError("Failed to open decrypting stream {} of {}",
						       i + 1, n));
	}
}

void
WorkerStreamSet::Close() noexcept
{
	for (auto &i : streams)
		if (i)
			i->Close();

	streams.clear();
}
