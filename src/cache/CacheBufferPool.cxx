// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "CacheBufferPool.hxx"

CacheBufferPool::CacheBufferPool(std::size_t count, std::size_t capacity,
				 FillSelectionType selection_type)
	:selection(CreateFillSelection(selection_type, count))
{
	assert(count > 0);
	assert(capacity > 0);

	buffers.reserve(count);
	for (std::size_t i = 0; i < count; ++i)
		buffers.emplace_back(capacity);
}

CacheBuffer *
CacheBufferPool::FindCovering(offset_type position) noexcept
{
	for (std::size_t i = 0; i < buffers.size(); ++i) {
		auto &buffer = buffers[i];
		if (buffer.Contains(position)) {
			selection->OnUse(i);
			return &buffer;
		}
	}

	return nullptr;
}

CacheBuffer &
CacheBufferPool::SelectForFill() noexcept
{
	std::size_t i = 0;
	while (i < buffers.size() && !buffers[i].IsEmpty())
		++i;

	if (i == buffers.size())
		/* no empty buffer left: evict one */
		i = selection->SelectVictim(buffers.size());

	selection->OnUse(i);
	return buffers[i];
}

void
CacheBufferPool::Wipe() noexcept
{
	for (auto &i : buffers)
		i.Wipe();
}
