/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Annotated mutex and condition variable
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

#include <camtune/base/class.h>
#include <camtune/base/thread_annotations.h>

namespace camtune {

/*
 * Thin wrappers around the standard primitives, annotated so that clang can
 * check the CAMTUNE_TSA_GUARDED_BY() members.
 */
class CAMTUNE_TSA_CAPABILITY("mutex") Mutex final
{
public:
	Mutex() = default;

	void lock() CAMTUNE_TSA_ACQUIRE() { impl_.lock(); }
	void unlock() CAMTUNE_TSA_RELEASE() { impl_.unlock(); }

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(Mutex)

	friend class MutexLocker;

	std::mutex impl_;
};

class CAMTUNE_TSA_SCOPED_CAPABILITY MutexLocker final
{
public:
	explicit MutexLocker(Mutex &mutex) CAMTUNE_TSA_ACQUIRE(mutex)
		: lock_(mutex.impl_)
	{
	}

	~MutexLocker() CAMTUNE_TSA_RELEASE() {}

	void lock() CAMTUNE_TSA_ACQUIRE() { lock_.lock(); }
	void unlock() CAMTUNE_TSA_RELEASE() { lock_.unlock(); }

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(MutexLocker)

	friend class ConditionVariable;

	std::unique_lock<std::mutex> lock_;
};

class ConditionVariable final
{
public:
	ConditionVariable() = default;

	void notify_one() noexcept { impl_.notify_one(); }
	void notify_all() noexcept { impl_.notify_all(); }

	template<typename Predicate>
	void wait(MutexLocker &locker, Predicate done)
	{
		impl_.wait(locker.lock_, done);
	}

	template<typename Rep, typename Period, typename Predicate>
	bool wait_for(MutexLocker &locker,
		      const std::chrono::duration<Rep, Period> &timeout,
		      Predicate done)
	{
		return impl_.wait_for(locker.lock_, timeout, done);
	}

	template<typename Clock, typename Duration, typename Predicate>
	bool wait_until(MutexLocker &locker,
			const std::chrono::time_point<Clock, Duration> &deadline,
			Predicate done)
	{
		return impl_.wait_until(locker.lock_, deadline, done);
	}

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(ConditionVariable)

	std::condition_variable impl_;
};

} /* namespace camtune */
