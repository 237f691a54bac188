// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "CacheBuffer.hxx"

#include <string.h>

CacheBuffer::CacheBuffer(std::size_t _capacity)
	:storage(std::make_unique<std::byte[]>(_capacity)),
	 capacity(_capacity)
{
}

void
CacheBuffer::Wipe() noexcept
{
	memset(storage.get(), 0, capacity);
	start = 0;
	count = 0;
}
