// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "stream/DecryptStream.hxx"

#include <vector>

class DecryptSource;

/**
 * The #DecryptStream instances used by the fill workers, one per
 * worker.  A stream is never shared between workers.
 */
class WorkerStreamSet {
	std::vector<DecryptStreamPtr> streams;

public:
	/**
	 * Open all streams.
	 *
	 * Throws on error; streams opened so far are closed.
	 *
	 * @param n the number of streams
	 * @param read_ahead the read-ahead hint for each stream
	 */
	WorkerStreamSet(DecryptSource &source, std::size_t n,
			std::size_t read_ahead);

	~WorkerStreamSet() noexcept {
		Close();
	}

	WorkerStreamSet(const WorkerStreamSet &) = delete;
	WorkerStreamSet &operator=(const WorkerStreamSet &) = delete;

	/**
	 * The read-ahead hint for each of the given number of
	 * streams filling one buffer together.
	 */
	static constexpr std::size_t ReadAheadSize(std::size_t buffer_size,
						   std::size_t n) noexcept {
		return n > 0 ? (buffer_size + n - 1) / n : buffer_size;
	}

	std::size_t size() const noexcept {
		return streams.size();
	}

	bool IsClosed() const noexcept {
		return streams.empty();
	}

	DecryptStream &operator[](std::size_t i) const noexcept {
		return *streams[i];
	}

	/**
	 * Close and free all streams.  Does nothing if they have been
	 * closed already.
	 */
	void Close() noexcept;
};
