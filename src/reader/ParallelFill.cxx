// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "ParallelFill.hxx"
#include "WorkerStreamSet.hxx"
#include "IntegrityNotifier.hxx"
#include "Domain.hxx"
#include "cache/CacheBuffer.hxx"
#include "stream/DecryptStream.hxx"
#include "stream/IntegrityError.hxx"
#include "thread/Name.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "Log.hxx"

#include <algorithm>
#include <cassert>
#include <chrono>

/**
 * A thread which owns one #DecryptStream and decrypts one part of
 * each fill.
 */
class ParallelFill::Worker {
	ParallelFill &parent;
	DecryptStream &stream;

	const unsigned index;

	Thread thread;

	/**
	 * Signalled when a job has been submitted or when the thread
	 * shall exit.
	 */
	Cond wake_cond;

	/* the following attributes are protected by parent.mutex */

	std::optional<FillJob> job;

	std::size_t result = 0;

	bool stop = false;

public:
	Worker(ParallelFill &_parent, DecryptStream &_stream,
	       unsigned _index) noexcept
		:parent(_parent), stream(_stream), index(_index),
		 thread(BIND_THIS_METHOD(Run)) {}

#ifndef NDEBUG
	~Worker() noexcept {
		assert(!thread.IsDefined());
	}
#endif

	bool IsRunning() const noexcept {
		return thread.IsDefined();
	}

	void Start() {
		thread.Start();
	}

	void Stop() noexcept {
		if (!thread.IsDefined())
			return;

		{
			const std::scoped_lock lock{parent.mutex};
			stop = true;
			wake_cond.notify_one();
		}

		thread.Join();
	}

	/**
	 * Caller must lock the mutex.
	 */
	void Submit(const FillJob &_job) noexcept {
		assert(!job);

		job = _job;
		result = 0;
		wake_cond.notify_one();
	}

	/**
	 * Caller must lock the mutex.
	 */
	void Skip() noexcept {
		assert(!job);

		result = 0;
	}

	/**
	 * Caller must lock the mutex.
	 */
	std::size_t GetResult() const noexcept {
		assert(!job);

		return result;
	}

private:
	void Run() noexcept;
};

inline void
ParallelFill::Worker::Run() noexcept
{
	FmtThreadName("fill:{}", index);

	std::unique_lock lock{parent.mutex};

	while (!stop) {
		if (!job) {
			wake_cond.wait(lock);
			continue;
		}

		const FillJob current = *job;

		std::size_t nbytes;

		{
			const ScopeUnlock unlock(parent.mutex);
			nbytes = FillPart(stream, parent.notifier, current);
		}

		result = nbytes;
		job.reset();

		assert(parent.pending > 0);
		if (--parent.pending == 0)
			parent.done_cond.notify_one();
	}
}

ParallelFill::ParallelFill(WorkerStreamSet &_streams,
			   IntegrityNotifier &_notifier,
			   unsigned n_threads, offset_type _source_size)
	:streams(_streams), notifier(_notifier), source_size(_source_size)
{
	assert(streams.size() >= n_threads);
	assert(streams.size() > 0);

	workers.reserve(n_threads);
	for (unsigned i = 0; i < n_threads; ++i)
		workers.emplace_back(std::make_unique<Worker>(*this,
							      streams[i],
							      i));
}

ParallelFill::~ParallelFill() noexcept
{
	Stop();
}

void
ParallelFill::Start()
{
	try {
		for (auto &i : workers)
			i->Start();
	} catch (...) {
		Stop();
		throw;
	}
}

void
ParallelFill::Stop() noexcept
{
	assert(pending == 0);

	for (auto &i : workers)
		i->Stop();
}

std::size_t
ParallelFill::FillPart(DecryptStream &stream, IntegrityNotifier &notifier,
		       const FillJob &job) noexcept
{
	/* the stream verifies each chunk while decrypting it, there
	   is no need to check the whole file in advance */

	try {
		stream.Seek(job.position);
		return stream.Read(job.dest);
	} catch (const IntegrityError &e) {
		FmtError(fill_domain,
			 "Integrity check failed in chunk at {}: {}",
			 e.GetChunkOffset(), e.what());
		if (notifier.Report())
			LogDebug(fill_domain, "Reporting integrity fault");
	} catch (...) {
		FmtWarning(fill_domain, "Failed to decrypt {} bytes at {}: {}",
			   job.dest.size(), job.position,
			   std::current_exception());
	}

	return 0;
}

inline std::size_t
ParallelFill::FillDirect(std::span<std::byte> dest,
			 offset_type start_position) noexcept
{
	return FillPart(streams[0], notifier, {dest, start_position});
}

inline std::size_t
ParallelFill::FillMulti(std::span<std::byte> dest,
			offset_type start_position) noexcept
{
	const std::size_t n = workers.size();
	const std::size_t size = dest.size();
	const std::size_t part_size = (size + n - 1) / n;

	std::unique_lock lock{mutex};
	assert(pending == 0);

	for (std::size_t i = 0; i < n; ++i) {
		auto &worker = *workers[i];
		assert(worker.IsRunning());

		const std::size_t part_start = i * part_size;
		if (part_start >= size ||
		    start_position + part_start >= source_size) {
			/* nothing left for this one */
			worker.Skip();
			continue;
		}

		const std::size_t length = std::min(part_size,
						    size - part_start);
		worker.Submit({
			dest.subspan(part_start, length),
			start_position + part_start,
		});
		++pending;
	}

	done_cond.wait(lock, [this]{ return pending == 0; });

	std::size_t total = 0;
	for (const auto &i : workers)
		total += i->GetResult();

	return total;
}

std::size_t
ParallelFill::Fill(CacheBuffer &buffer, offset_type start_position,
		   std::size_t write_offset, std::size_t size) noexcept
{
	assert(write_offset <= buffer.GetCapacity());
	assert(size <= buffer.GetCapacity() - write_offset);

	const auto dest = buffer.Write().subspan(write_offset, size);

	const auto start_time = std::chrono::steady_clock::now();

	const std::size_t nbytes = workers.empty()
		? FillDirect(dest, start_position)
		: FillMulti(dest, start_position);

	const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
	FmtDebug(fill_domain, "Requested {} bytes at {}, read {} bytes in {} ms",
		 size, start_position, nbytes, duration.count());

	return nbytes;
}
