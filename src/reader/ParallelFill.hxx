// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "stream/Offset.hxx"
#include "thread/Thread.hxx"
#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

class CacheBuffer;
class DecryptStream;
class WorkerStreamSet;
class IntegrityNotifier;

/**
 * A portion of a fill: decrypt into #dest starting at the absolute
 * plaintext offset #position.
 */
struct FillJob {
	std::span<std::byte> dest;
	offset_type position;
};

/**
 * Fills a #CacheBuffer from several #DecryptStream instances in
 * parallel.  The requested range is split into one contiguous part
 * per worker thread; each worker seeks its own stream and decrypts
 * its part directly into the buffer.  Fill() returns after all
 * workers have finished.
 *
 * Faults inside a worker are logged and turn that part into a 0 byte
 * read; they never cancel the other workers.  Short reads are not
 * detected: the returned sum may include a hole if a worker other
 * than the last one stops early.
 *
 * With zero threads, Fill() reads from the first stream directly in
 * the calling thread.
 */
class ParallelFill {
	WorkerStreamSet &streams;
	IntegrityNotifier &notifier;

	/**
	 * Parts starting at or after this offset are skipped.
	 */
	const offset_type source_size;

	class Worker;
	std::vector<std::unique_ptr<Worker>> workers;

	/**
	 * Protects #pending and the job/result attributes of all
	 * workers.
	 */
	Mutex mutex;

	/**
	 * Signalled by the last worker to finish its job.
	 */
	Cond done_cond;

	/**
	 * The number of workers which have not yet finished their
	 * job of the current Fill() call.
	 */
	std::size_t pending = 0;

public:
	/**
	 * @param n_threads the number of worker threads; the
	 * #WorkerStreamSet must contain at least that many streams
	 * (and at least one)
	 */
	ParallelFill(WorkerStreamSet &_streams, IntegrityNotifier &_notifier,
		     unsigned n_threads, offset_type _source_size);

	~ParallelFill() noexcept;

	ParallelFill(const ParallelFill &) = delete;
	ParallelFill &operator=(const ParallelFill &) = delete;

	unsigned GetThreadCount() const noexcept {
		return workers.size();
	}

	/**
	 * Start all worker threads.
	 *
	 * Throws on error.
	 */
	void Start();

	/**
	 * Stop and join all worker threads.  Must not be called
	 * during Fill().  Does nothing if the threads are not
	 * running.
	 */
	void Stop() noexcept;

	/**
	 * Decrypt data into the given buffer.  The buffer's range is
	 * not modified; that is up to the caller.
	 *
	 * @param start_position the absolute plaintext offset of the
	 * first byte
	 * @param write_offset the position in the buffer's storage
	 * where the first byte goes
	 * @param size the number of bytes to read
	 * @return the sum of bytes read by all workers
	 *
	 * Integrity faults are only recorded in the
	 * #IntegrityNotifier; the caller invokes
	 * IntegrityNotifier::Dispatch() after releasing its own
	 * locks.
	 */
	std::size_t Fill(CacheBuffer &buffer, offset_type start_position,
			 std::size_t write_offset, std::size_t size) noexcept;

	/**
	 * Seek the stream and decrypt one part.  Faults are logged
	 * and reported as 0 bytes read.
	 */
	static std::size_t FillPart(DecryptStream &stream,
				    IntegrityNotifier &notifier,
				    const FillJob &job) noexcept;

private:
	std::size_t FillDirect(std::span<std::byte> dest,
			       offset_type start_position) noexcept;
	std::size_t FillMulti(std::span<std::byte> dest,
			      offset_type start_position) noexcept;
};
