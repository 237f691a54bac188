// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "ReaderConfig.hxx"
#include "IntegrityNotifier.hxx"
#include "WorkerStreamSet.hxx"
#include "ParallelFill.hxx"
#include "cache/CacheBufferPool.hxx"
#include "stream/Offset.hxx"
#include "thread/Mutex.hxx"

#include <cstddef>
#include <span>

class DecryptSource;

/**
 * Random access ("read N bytes at position P") to the decrypted
 * contents of a #DecryptSource, for consumers which seek
 * unpredictably, e.g. a media player.
 *
 * Decrypted data is cached in a few large #CacheBuffer instances.  On
 * a cache miss, a buffer is filled by several worker threads in
 * parallel, each with its own #DecryptStream.
 *
 * ReadAt() and Close() are serialized internally, but the class is
 * designed for one caller issuing one request at a time; concurrent
 * callers just wait for each other.
 */
class RandomAccessReader {
	const ReaderConfig config;

	/**
	 * The plaintext length, obtained once at construction.
	 */
	const offset_type size;

	IntegrityNotifier notifier;

	/**
	 * Serializes ReadAt() and Close().
	 */
	Mutex mutex;

	CacheBufferPool pool;

	WorkerStreamSet streams;

	ParallelFill fill;

	bool closed = false;

public:
	/**
	 * Allocate all buffers, open the streams and start the worker
	 * threads.
	 *
	 * Throws on error.
	 *
	 * @param handler an optional handler which gets notified
	 * about the first integrity fault; it must outlive this
	 * object
	 */
	explicit RandomAccessReader(DecryptSource &source,
				    const ReaderConfig &_config={},
				    IntegrityFaultHandler *handler=nullptr);

	~RandomAccessReader() noexcept;

	RandomAccessReader(const RandomAccessReader &) = delete;
	RandomAccessReader &operator=(const RandomAccessReader &) = delete;

	const ReaderConfig &GetConfig() const noexcept {
		return config;
	}

	/**
	 * Returns the length of the decrypted content.
	 */
	offset_type GetSize() const noexcept {
		return size;
	}

	/**
	 * Has an integrity fault been detected during the lifetime
	 * of this object?
	 */
	bool IsIntegrityFaultReported() const noexcept {
		return notifier.IsReported();
	}

	/**
	 * Access the cache buffers for inspection.  Must not be
	 * called while another thread is inside ReadAt().
	 */
	const CacheBufferPool &GetPool() const noexcept {
		return pool;
	}

	/**
	 * Copy decrypted data at the given position into #dest.
	 *
	 * This method never throws.  End of file, decryption errors
	 * and I/O errors all result in a short read or a return value
	 * of 0; integrity faults are additionally reported to the
	 * #IntegrityFaultHandler.
	 *
	 * @return the number of bytes copied; 0 at (or after) the end
	 * of the file, on error or after Close()
	 */
	std::size_t ReadAt(offset_type position,
			   std::span<std::byte> dest) noexcept;

	/**
	 * Stop the worker threads, close all streams and wipe all
	 * buffers.  Calling it again does nothing.
	 */
	void Close() noexcept;

private:
	/**
	 * Caller must lock the mutex.
	 */
	std::size_t LockedReadAt(offset_type position,
				 std::span<std::byte> dest) noexcept;

	/**
	 * Fill a buffer with data around the given position.
	 *
	 * @return the buffer containing the position or nullptr on
	 * error
	 */
	CacheBuffer *Fill(offset_type position) noexcept;
};
