// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include "util/BindMethod.hxx"

#include <cassert>

#include <pthread.h>

class Thread {
	using Function = BoundMethod<void() noexcept>;
	const Function f;

	pthread_t handle = pthread_t();

#ifndef NDEBUG
	/**
	 * This handle is only used by IsInside(), and is set by the
	 * thread function.  Since #handle is set by pthread_create()
	 * which is racy, we need this attribute for early checks
	 * inside the thread function.
	 */
	pthread_t inside_handle = pthread_t();
#endif

public:
	explicit Thread(Function _f) noexcept:f(_f) {}

	Thread(const Thread &) = delete;
	Thread &operator=(const Thread &) = delete;

#ifndef NDEBUG
	~Thread() noexcept {
		/* all Thread objects must be destructed manually by calling
		   Join(), to clean up */
		assert(!IsDefined());
	}
#endif

	bool IsDefined() const noexcept {
		return handle != pthread_t();
	}

#ifndef NDEBUG
	/**
	 * Check if this thread is the current thread.
	 */
	[[gnu::pure]]
	bool IsInside() const noexcept {
		return pthread_self() == inside_handle;
	}
#endif

	/**
	 * Start the thread.
	 *
	 * Throws on error.
	 */
	void Start();

	void Join() noexcept;

private:
	static void *ThreadProc(void *ctx) noexcept;
};
