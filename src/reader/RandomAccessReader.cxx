// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "RandomAccessReader.hxx"
#include "Domain.hxx"
#include "stream/DecryptSource.hxx"
#include "Log.hxx"

#include <algorithm>

static const ReaderConfig &
CheckConfig(const ReaderConfig &config)
{
	config.Check();
	return config;
}

RandomAccessReader::RandomAccessReader(DecryptSource &source,
				       const ReaderConfig &_config,
				       IntegrityFaultHandler *handler)
	:config(CheckConfig(_config)),
	 size(source.GetSize()),
	 notifier(handler),
	 pool(config.buffer_count, config.buffer_size, config.eviction),
	 streams(source, config.GetStreamCount(),
		 WorkerStreamSet::ReadAheadSize(config.buffer_size,
						config.GetStreamCount())),
	 fill(streams, notifier, config.threads, size)
{
	fill.Start();

	FmtDebug(reader_domain,
		 "Opened {} bytes with {} buffers of {} bytes, {} threads, eviction={}",
		 size, config.buffer_count, config.buffer_size,
		 config.threads, ToString(config.eviction));
}

RandomAccessReader::~RandomAccessReader() noexcept
{
	Close();
}

inline CacheBuffer *
RandomAccessReader::Fill(offset_type position) noexcept
{
	CacheBuffer &buffer = pool.SelectForFill();

	/* after a seek, players often request data slightly before
	   the previous request; start the buffer a little early so
	   both requests are served by one fill */
	const offset_type start = position > config.stream_offset
		? position - config.stream_offset
		: 0;

	/* the old contents are about to be overwritten */
	buffer.Invalidate();

	const std::size_t nbytes = fill.Fill(buffer, start, 0,
					     buffer.GetCapacity());
	if (nbytes == 0)
		return nullptr;

	buffer.Commit(start, nbytes);

	if (!buffer.Contains(position)) {
		/* a worker failed and the data ends before the
		   requested position */
		FmtWarning(reader_domain,
			   "Filled only {} bytes at {}, not enough for position {}",
			   nbytes, start, position);
		return nullptr;
	}

	return &buffer;
}

inline std::size_t
RandomAccessReader::LockedReadAt(offset_type position,
				 std::span<std::byte> dest) noexcept
{
	if (closed || position >= size || dest.empty())
		return 0;

	CacheBuffer *buffer = pool.FindCovering(position);
	if (buffer == nullptr) {
		buffer = Fill(position);
		if (buffer == nullptr)
			return 0;
	}

	const auto src = buffer->Read(position);
	const std::size_t nbytes = std::min(dest.size(), src.size());
	std::copy_n(src.begin(), nbytes, dest.begin());
	return nbytes;
}

std::size_t
RandomAccessReader::ReadAt(offset_type position,
			   std::span<std::byte> dest) noexcept
{
	std::size_t nbytes;

	{
		const std::scoped_lock lock{mutex};
		nbytes = LockedReadAt(position, dest);
	}

	/* outside the lock: the handler may call Close() */
	notifier.Dispatch();

	return nbytes;
}

void
RandomAccessReader::Close() noexcept
{
	const std::scoped_lock lock{mutex};

	if (closed)
		return;

	closed = true;

	fill.Stop();
	streams.Close();
	pool.Wipe();

	LogDebug(reader_domain, "Closed");
}
