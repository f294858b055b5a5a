/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * Blocking token bucket rate limiter
 */

#pragma once

#include <camtune/base/class.h>
#include <camtune/base/mutex.h>
#include <camtune/base/utils.h>

namespace camtune {

class TokenBucket
{
public:
	TokenBucket(double rate, unsigned int burst = 1);

	static double refillRate(double perSecond, unsigned int burst);

	bool acquire() CAMTUNE_TSA_EXCLUDES(mutex_);
	bool tryAcquire() CAMTUNE_TSA_EXCLUDES(mutex_);
	void cancel() CAMTUNE_TSA_EXCLUDES(mutex_);

	double rate() const { return rate_; }
	unsigned int burst() const { return burst_; }

private:
	CAMTUNE_DISABLE_COPY_AND_MOVE(TokenBucket)

	void refill(utils::time_point now) CAMTUNE_TSA_REQUIRES(mutex_);

	const double rate_;
	const unsigned int burst_;

	Mutex mutex_;
	ConditionVariable cv_;
	double tokens_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	utils::time_point last_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	bool cancelled_ CAMTUNE_TSA_GUARDED_BY(mutex_);
};

} /* namespace camtune */
