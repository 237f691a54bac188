// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "ReaderConfig.hxx"
#include "config/Block.hxx"
#include "lib/fmt/RuntimeError.hxx"

ReaderConfig::ReaderConfig(const ConfigBlock &block)
	:buffer_count(block.GetPositiveValue("buffer_count",
					     DEFAULT_BUFFER_COUNT)),
	 buffer_size(block.GetSizeValue("buffer_size",
					DEFAULT_BUFFER_SIZE)),
	 threads(block.GetBlockValue("threads", DEFAULT_THREADS)),
	 stream_offset(block.GetSizeValue("stream_offset",
					  DEFAULT_STREAM_OFFSET))
{
	if (const auto *param = block.GetBlockParam("eviction"))
		eviction = param->With(ParseFillSelectionType);

	block.CheckUnused();

	Check();
}

void
ReaderConfig::Check() const
{
	if (buffer_count == 0)
		throw std::invalid_argument("buffer_count must be positive");

	if (buffer_size == 0)
		throw std::invalid_argument("buffer_size must be positive");

	if (threads > MAX_THREADS)
		throw FmtInvalidArgument("Too many threads: {} (maximum is {})",
					 threads, MAX_THREADS);

	if (stream_offset >= buffer_size)
		throw FmtInvalidArgument("stream_offset ({}) must be smaller than buffer_size ({})",
					 stream_offset, buffer_size);
}
