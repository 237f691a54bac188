// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include <atomic>

/**
 * Receives the notification that decrypted content failed
 * authentication.  Implemented by the application, e.g. to show a
 * "file is corrupt or has been tampered with" message.
 */
class IntegrityFaultHandler {
public:
	/**
	 * Called at most once per #RandomAccessReader, on the thread
	 * which called RandomAccessReader::ReadAt(), after the reader
	 * has released its lock.  The handler may call back into the
	 * reader, e.g. to Close() it.
	 */
	virtual void OnIntegrityFault() noexcept = 0;
};

/**
 * Makes sure that an integrity fault is reported only once, even if
 * several fill workers detect one at the same time.
 */
class IntegrityNotifier {
	IntegrityFaultHandler *const handler;

	/**
	 * Set by the first Report() call and never cleared.
	 */
	std::atomic_bool reported{false};

	/**
	 * Set by the first Report() call, cleared by Dispatch().
	 */
	std::atomic_bool pending{false};

public:
	explicit IntegrityNotifier(IntegrityFaultHandler *_handler) noexcept
		:handler(_handler) {}

	IntegrityNotifier(const IntegrityNotifier &) = delete;
	IntegrityNotifier &operator=(const IntegrityNotifier &) = delete;

	bool IsReported() const noexcept {
		return reported.load(std::memory_order_relaxed);
	}

	/**
	 * Record an integrity fault.  May be called from any thread.
	 *
	 * @return true if this was the first fault
	 */
	bool Report() noexcept {
		if (reported.exchange(true))
			return false;

		pending.store(true);
		return true;
	}

	/**
	 * Invoke the #IntegrityFaultHandler if Report() has recorded
	 * the first fault since the last call.  Must be called
	 * without holding any lock the handler might need.
	 */
	void Dispatch() noexcept {
		if (pending.exchange(false) && handler != nullptr)
			handler->OnIntegrityFault();
	}
};
