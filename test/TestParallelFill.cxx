// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "MemoryDecryptSource.hxx"
#include "reader/ParallelFill.hxx"
#include "reader/WorkerStreamSet.hxx"
#include "reader/IntegrityNotifier.hxx"
#include "cache/CacheBuffer.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

using Fault = MemoryDecryptSource::Fault;

/**
 * Bundles everything a #ParallelFill needs.
 */
struct FillFixture {
	WorkerStreamSet streams;
	IntegrityNotifier notifier;
	ParallelFill fill;

	FillFixture(MemoryDecryptSource &source, unsigned threads,
		    IntegrityFaultHandler *handler=nullptr)
		:streams(source, threads > 0 ? threads : 1, 4096),
		 notifier(handler),
		 fill(streams, notifier, threads, source.GetSize())
	{
		fill.Start();
	}
};

TEST(ParallelFill, Direct)
{
	MemoryDecryptSource source(100000);
	FillFixture f(source, 0);
	EXPECT_EQ(f.fill.GetThreadCount(), 0u);

	CacheBuffer buffer(8192);
	EXPECT_EQ(f.fill.Fill(buffer, 1000, 0, 8192), 8192u);
	EXPECT_TRUE(IsPlainData(buffer.GetStorage(), 1000));
	EXPECT_EQ(source.seek_count, 1u);
	EXPECT_EQ(source.read_count, 1u);
}

TEST(ParallelFill, WriteOffset)
{
	MemoryDecryptSource source(100000);
	FillFixture f(source, 2);

	CacheBuffer buffer(1000);
	EXPECT_EQ(f.fill.Fill(buffer, 500, 100, 900), 900u);

	const auto storage = buffer.GetStorage();
	EXPECT_TRUE(std::all_of(storage.begin(), storage.begin() + 100,
				[](std::byte b){ return b == std::byte{0}; }));
	EXPECT_TRUE(IsPlainData(storage.subspan(100), 500));
}

TEST(ParallelFill, Partition)
{
	constexpr offset_type start = 4980736;
	constexpr std::size_t size = 2097152;
	constexpr std::size_t part_size = 524288;

	MemoryDecryptSource source(10485760);
	FillFixture f(source, 4);

	CacheBuffer buffer(size);
	EXPECT_EQ(f.fill.Fill(buffer, start, 0, size), size);

	for (unsigned k = 0; k < 4; ++k)
		EXPECT_EQ(source.last_seek[k], start + k * part_size);

	EXPECT_TRUE(IsPlainData(buffer.GetStorage(), start));
}

TEST(ParallelFill, SameResultForAnyThreadCount)
{
	constexpr offset_type start = 123457;
	constexpr std::size_t size = 100003;

	MemoryDecryptSource source(1000000);

	CacheBuffer reference(size);
	{
		FillFixture f(source, 1);
		ASSERT_EQ(f.fill.Fill(reference, start, 0, size), size);
	}

	for (unsigned threads : {0u, 2u, 3u, 7u, 16u}) {
		FillFixture f(source, threads);
		CacheBuffer buffer(size);
		EXPECT_EQ(f.fill.Fill(buffer, start, 0, size), size);

		const auto a = reference.GetStorage();
		const auto b = buffer.GetStorage();
		EXPECT_TRUE(std::equal(a.begin(), a.end(), b.begin()))
			<< "threads=" << threads;
	}
}

TEST(ParallelFill, PartsAfterEndOfFile)
{
	MemoryDecryptSource source(1000);
	FillFixture f(source, 4);

	CacheBuffer buffer(4000);
	EXPECT_EQ(f.fill.Fill(buffer, 0, 0, 4000), 1000u);

	/* only the first worker has touched its stream */
	EXPECT_EQ(source.seek_count, 1u);
	EXPECT_TRUE(IsPlainData(buffer.GetStorage().first(1000), 0));
}

TEST(ParallelFill, IntegrityFault)
{
	MemoryDecryptSource source(100000);
	source.faults[2] = Fault::INTEGRITY;

	CountingFaultHandler handler;
	FillFixture f(source, 4, &handler);

	CacheBuffer buffer(4000);
	EXPECT_EQ(f.fill.Fill(buffer, 0, 0, 4000), 3000u);
	EXPECT_TRUE(f.notifier.IsReported());

	/* the handler waits for Dispatch() */
	EXPECT_EQ(handler.count, 0u);
	f.notifier.Dispatch();
	EXPECT_EQ(handler.count, 1u);

	const auto storage = buffer.GetStorage();
	EXPECT_TRUE(IsPlainData(storage.first(2000), 0));
	EXPECT_TRUE(IsPlainData(storage.subspan(3000), 3000));
}

TEST(ParallelFill, SimultaneousIntegrityFaults)
{
	MemoryDecryptSource source(100000);
	source.faults[0] = Fault::INTEGRITY;
	source.faults[2] = Fault::INTEGRITY;

	CountingFaultHandler handler;
	FillFixture f(source, 4, &handler);

	CacheBuffer buffer(4000);
	EXPECT_EQ(f.fill.Fill(buffer, 0, 0, 4000), 2000u);
	f.notifier.Dispatch();
	EXPECT_EQ(handler.count, 1u);

	/* reported only once per lifetime */
	EXPECT_EQ(f.fill.Fill(buffer, 0, 0, 4000), 2000u);
	f.notifier.Dispatch();
	EXPECT_EQ(handler.count, 1u);
}

TEST(ParallelFill, AllWorkersFault)
{
	MemoryDecryptSource source(100000);
	for (auto &i : source.faults)
		i = Fault::INTEGRITY;

	CountingFaultHandler handler;
	FillFixture f(source, 8, &handler);

	CacheBuffer buffer(8000);
	EXPECT_EQ(f.fill.Fill(buffer, 0, 0, 8000), 0u);
	f.notifier.Dispatch();
	EXPECT_EQ(handler.count, 1u);
}

TEST(ParallelFill, IoFault)
{
	MemoryDecryptSource source(100000);
	source.faults[1] = Fault::IO;

	CountingFaultHandler handler;
	FillFixture f(source, 4, &handler);

	CacheBuffer buffer(4000);
	EXPECT_EQ(f.fill.Fill(buffer, 0, 0, 4000), 3000u);
	f.notifier.Dispatch();
	EXPECT_EQ(handler.count, 0u);
	EXPECT_FALSE(f.notifier.IsReported());
}

TEST(ParallelFill, HandlerRunsInCallerThread)
{
	struct ThreadRecorder final : IntegrityFaultHandler {
		std::thread::id id;

		void OnIntegrityFault() noexcept override {
			id = std::this_thread::get_id();
		}
	} handler;

	MemoryDecryptSource source(100000);
	source.faults[3] = Fault::INTEGRITY;
	FillFixture f(source, 4, &handler);

	CacheBuffer buffer(4000);
	f.fill.Fill(buffer, 0, 0, 4000);
	f.notifier.Dispatch();
	EXPECT_EQ(handler.id, std::this_thread::get_id());
}

TEST(ParallelFill, StopTwice)
{
	MemoryDecryptSource source(100000);
	FillFixture f(source, 3);
	f.fill.Stop();
	f.fill.Stop();
}

TEST(WorkerStreamSet, CloseTwice)
{
	MemoryDecryptSource source(100000);
	WorkerStreamSet streams(source, 3,
				WorkerStreamSet::ReadAheadSize(1000, 3));
	EXPECT_EQ(source.last_read_ahead, 334u);
	EXPECT_EQ(streams.size(), 3u);
	EXPECT_FALSE(streams.IsClosed());

	streams.Close();
	EXPECT_TRUE(streams.IsClosed());
	EXPECT_EQ(source.close_count, 3u);

	streams.Close();
	EXPECT_EQ(source.close_count, 3u);
}
